#pragma once

#include <algorithm>       // std::copy_n
#include <atomic>          // std::atomic
#include <chrono>          // std::chrono::system_clock
#include <ctime>           // localtime_r, strftime, time_t, tm
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format
#include <print>           // std::print
#include <source_location> // std::source_location
#include <utility>         // std::forward

#include "Error.hpp"
#include "Types.hpp"

namespace switchboard::utils::logging {
  namespace types = ::switchboard::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  inline auto WriteToConsole(const types::StringView text, const bool useStderr = false) -> void {
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m",
      "\033[38;5;3m", "\033[38;5;4m", "\033[38;5;5m",
      "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // Tracing-style colors: TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels (tracing-style).
   */
  enum class LogLevel : types::u8 {
    Trace, // Most verbose - message routing and fan-out
    Debug, // Plugin installation, dropped envelopes, subscription churn
    Info,  // General information
    Warn,  // Recoverable problems
    Error, // Failures
  };

  inline auto GetLogLevelStorage() -> std::atomic<LogLevel>& {
    static std::atomic<LogLevel> Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Gets the current runtime log level.
   * @details Read from worker and subscription threads, hence atomic.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel {
    return GetLogLevelStorage().load(std::memory_order_relaxed);
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetLogLevelStorage().store(level, std::memory_order_relaxed);
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
    LogColor color  = LogColor::White;
  };

  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  // User-facing print (stdout only)
  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Timestamp
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   * @details Cached per thread; only re-formatted when the second changes.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) == nullptr ||
          std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Structured Fields Support
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @struct Field
   * @brief A key-value pair attached to a log line or span.
   */
  struct Field {
    types::StringView key;
    types::String     value;

    template <typename T>
    static auto create(types::StringView key, const T& value) -> Field {
      using Decayed = std::decay_t<T>;

      if constexpr (std::is_convertible_v<Decayed, types::StringView>)
        return Field { key, types::String(types::StringView(value)) };
      else if constexpr (std::is_same_v<Decayed, bool>)
        return Field { key, value ? "true" : "false" };
      else
        return Field { key, std::format("{}", value) };
    }
  };

  inline auto FormatFields(const types::Vec<Field>& fields) -> types::String {
    types::String result;

    for (types::usize i = 0; i < fields.size(); ++i) {
      if (i > 0)
        result += ", ";
      result += Stylize(fields[i].key, { .bold = true });
      result += "=";
      result += fields[i].value;
    }

    return result;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Span Support
  // ─────────────────────────────────────────────────────────────────────────────

  struct SpanInfo {
    types::String     name;
    types::Vec<Field> fields;
  };

  /**
   * @brief Gets the thread-local span stack (outermost span first).
   */
  inline auto GetSpanStack() -> types::Vec<SpanInfo>& {
    thread_local types::Vec<SpanInfo> SpanStackInstance;
    return SpanStackInstance;
  }

  /**
   * @class SpanGuard
   * @brief RAII guard that enters a span on construction and exits on destruction.
   *
   * Every log line emitted on the same thread while the guard is alive is
   * suffixed with the span's name and fields.
   */
  class SpanGuard {
   public:
    explicit SpanGuard(types::String name, types::Vec<Field> fields = {}) {
      GetSpanStack().push_back(SpanInfo { .name = std::move(name), .fields = std::move(fields) });
    }

    ~SpanGuard() {
      if (!GetSpanStack().empty())
        GetSpanStack().pop_back();
    }

    SpanGuard(const SpanGuard&)                    = delete;
    SpanGuard(SpanGuard&&)                         = delete;
    auto operator=(const SpanGuard&) -> SpanGuard& = delete;
    auto operator=(SpanGuard&&) -> SpanGuard&      = delete;
  };

  inline auto FormatSpans() -> types::String {
    types::String result;

    for (const SpanInfo& span : GetSpanStack()) {
      result += span.fields.empty()
        ? std::format(" in {}", span.name)
        : std::format(" in {}{{{}}}", span.name, FormatFields(span.fields));
    }

    return result;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Target Extraction
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Extracts a module-like target from a function signature.
   * @details Converts "auto switchboard::core::plugin::PluginManager::route(const PluginMessage&)"
   *          to "switchboard::core::plugin::PluginManager".
   */
  inline auto ExtractTarget(const types::StringView func) -> types::String {
    types::usize parenPos = func.find('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const types::usize lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const types::usize spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = spacePos != types::StringView::npos ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Core Logging Implementation
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Core logging implementation.
   *
   * Format: `timestamp LEVEL [file:line] target: message, fields in span{fields}`.
   * The file:line part is only printed in debug builds.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    const types::Vec<Field>&    fields,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    using std::chrono::system_clock;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t   nowTt   = system_clock::to_time_t(system_clock::now());
    const types::String message = std::format(fmt, std::forward<Args>(args)...);

    types::String line;
    line.reserve(message.size() + 96);

    line += Stylize(GetCachedTimestamp(nowTt), { .dim = true, .color = LogColor::Gray });
    line += ' ';
    line += GetLevelInfo().at(static_cast<types::usize>(level));
    line += ' ';
#ifndef NDEBUG
    line += Stylize(
      std::format("{}:{}", std::filesystem::path(loc.file_name()).filename().string(), loc.line()),
      { .italic = true, .color = LogColor::Gray }
    );
    line += ' ';
#else
    (void)loc;
#endif
    line += Stylize(target, { .bold = true });
    line += ": ";
    line += message;

    if (!fields.empty()) {
      line += ", ";
      line += FormatFields(fields);
    }

    line += Stylize(FormatSpans(), { .italic = true, .color = LogColor::Gray });
    line += '\n';

    const types::LockGuard lock(GetLogMutex());
    WriteToConsole(line, ShouldUseStderr(level));
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    LogImpl(level, loc, target, types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Log an error object at the specified level.
   *
   * SwbError is logged at the location it was created, anything else at the
   * call site.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, const types::StringView target, const ErrorType& errorObj) -> void {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::SwbError>)
      LogImpl(level, errorObj.location, target, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), target, "Unknown error type logged");
  }
} // namespace switchboard::utils::logging

// ─────────────────────────────────────────────────────────────────────────────
// Macros
// ─────────────────────────────────────────────────────────────────────────────

#define SWB_CONCAT_IMPL(a, b) a##b
#define SWB_CONCAT(a, b)      SWB_CONCAT_IMPL(a, b)

#define SWB_LOG_TARGET ::switchboard::utils::logging::ExtractTarget(std::source_location::current().function_name())

#define field(name, value) ::switchboard::utils::logging::Field::create(#name, value)

#define span_enter(name, ...)                                  \
  const ::switchboard::utils::logging::SpanGuard SWB_CONCAT(   \
    _swb_span_guard_, __LINE__                                 \
  )(#name, ::switchboard::utils::types::Vec<::switchboard::utils::logging::Field> { __VA_ARGS__ })

#define SWB_LOG_IMPL(level, fmt, ...)  \
  ::switchboard::utils::logging::LogImpl( \
    ::switchboard::utils::logging::LogLevel::level, std::source_location::current(), SWB_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define SWB_LOG_FIELDS_IMPL(level, fieldsVec, fmt, ...) \
  ::switchboard::utils::logging::LogImpl(                \
    ::switchboard::utils::logging::LogLevel::level, std::source_location::current(), SWB_LOG_TARGET, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define trace_log(fmt, ...) SWB_LOG_IMPL(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) SWB_LOG_IMPL(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  SWB_LOG_IMPL(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  SWB_LOG_IMPL(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) SWB_LOG_IMPL(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

#define trace_log_fields(fieldsVec, fmt, ...) SWB_LOG_FIELDS_IMPL(Trace, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log_fields(fieldsVec, fmt, ...) SWB_LOG_FIELDS_IMPL(Debug, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log_fields(fieldsVec, fmt, ...)  SWB_LOG_FIELDS_IMPL(Info, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log_fields(fieldsVec, fmt, ...)  SWB_LOG_FIELDS_IMPL(Warn, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log_fields(fieldsVec, fmt, ...) SWB_LOG_FIELDS_IMPL(Error, fieldsVec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(errorObj) ::switchboard::utils::logging::LogError(::switchboard::utils::logging::LogLevel::Debug, SWB_LOG_TARGET, errorObj)
#define warn_at(errorObj)  ::switchboard::utils::logging::LogError(::switchboard::utils::logging::LogLevel::Warn, SWB_LOG_TARGET, errorObj)
#define error_at(errorObj) ::switchboard::utils::logging::LogError(::switchboard::utils::logging::LogLevel::Error, SWB_LOG_TARGET, errorObj)
