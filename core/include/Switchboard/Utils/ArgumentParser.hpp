/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser used by the switchboard host.
 *
 * Supports flags, valued options with typed defaults, enum-style choices backed
 * by magic_enum, and binding parsed values straight into an options struct via
 * bindTo().
 */

#pragma once

#include <algorithm>                 // std::ranges::transform, std::ranges::contains
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name, magic_enum::enum_cast, magic_enum::enum_values
#include <ranges>                    // std::views::transform
#include <variant>                   // std::variant, std::visit

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace switchboard::utils::argparse {
  namespace error   = ::switchboard::utils::error;
  namespace logging = ::switchboard::utils::logging;
  namespace types   = ::switchboard::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::i32, types::f64, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::StringView text) -> types::String {
    types::String lower(text);
    std::ranges::transform(lower, lower.begin(), [](const types::u8 chr) -> char { return static_cast<char>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief Enum <-> string conversion for option values, via magic_enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices choices;
        for (const EnumType value : magic_enum::enum_values<EnumType>())
          choices.emplace_back(magic_enum::enum_name(value));
        return choices;
      }();

      return CACHED_CHOICES;
    }

    /**
     * @brief Case-insensitive lookup; falls back to the first enumerator.
     */
    static auto stringToEnum(types::StringView str) -> EnumType {
      return magic_enum::enum_cast<EnumType>(str, magic_enum::case_insensitive)
        .value_or(magic_enum::enum_values<EnumType>()[0]);
    }

    static auto enumToString(const EnumType value) -> types::String {
      return types::String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief A command-line argument with its metadata and parsed value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    /**
     * @brief Set the default value. Its alternative also decides how later
     *        string input is converted (i32 and f64 defaults make the option numeric).
     */
    template <typename T>
      requires std::constructible_from<ArgValue, T> && (!std::is_enum_v<T>)
    auto defaultValue(T value) -> Argument& {
      m_defaultValue = ArgValue(std::move(value));
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      return choices(EnumTraits<EnumType>::getChoices());
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    auto choices(const ArgChoices& allowed) -> Argument& {
      m_choices = allowed;
      m_lowerChoices.clear();

      for (const types::String& choice : allowed)
        m_lowerChoices.push_back(ToLower(choice));

      return *this;
    }

    /**
     * @brief The parsed value, else the default, else a value-initialized T.
     */
    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_value)
        if (const T* value = std::get_if<T>(&*m_value))
          return *value;

      if (m_defaultValue)
        if (const T* value = std::get_if<T>(&*m_defaultValue))
          return *value;

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.front();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> const ArgChoices& {
      return m_choices;
    }

    [[nodiscard]] auto getDefaultAsString() const -> types::String {
      if (!m_defaultValue)
        return {};

      return std::visit(
        []<typename V>(const V& value) -> types::String {
          if constexpr (std::is_same_v<V, bool>)
            return value ? "true" : "false";
          else if constexpr (std::is_same_v<V, types::String>)
            return ToLower(value);
          else
            return std::format("{}", value);
        },
        *m_defaultValue
      );
    }

    /**
     * @brief Store a raw command-line value, validating choices and numeric defaults.
     */
    auto setValue(types::StringView raw) -> types::Result<> {
      if (!m_choices.empty() && !std::ranges::contains(m_lowerChoices, ToLower(raw))) {
        types::String allowed;
        for (const types::String& choice : m_lowerChoices)
          allowed += allowed.empty() ? choice : ", " + choice;

        ERR_FMT(
          error::SwbErrorCode::InvalidArgument,
          "Invalid value '{}' for argument '{}'. Allowed values: {}",
          raw,
          getPrimaryName(),
          allowed
        );
      }

      if (m_defaultValue && std::holds_alternative<types::i32>(*m_defaultValue)) {
        m_value = TRY(parseNumber<types::i32>(raw));
      } else if (m_defaultValue && std::holds_alternative<types::f64>(*m_defaultValue)) {
        m_value = TRY(parseNumber<types::f64>(raw));
      } else {
        m_value = types::String(raw);
      }

      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;
      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Bind this argument to a struct member (bool, i32, f64, or String).
     *
     * @code
     *   struct Options { bool verbose; String config; };
     *   Options opts;
     *   parser.addArguments("-V", "--verbose").flag().bindTo(opts.verbose);
     *   parser.addArguments("-c", "--config").bindTo(opts.config);
     * @endcode
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::same_as<T, types::f64> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    template <typename T, typename Func>
      requires std::invocable<Func, const Argument&> && std::convertible_to<std::invoke_result_t<Func, const Argument&>, T>
    auto bindTo(T& member, Func transform) -> Argument& {
      m_binding = [&member, transform = std::move(transform)](const Argument& arg) { member = transform(arg); };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    /**
     * @brief Apply the binding, if any. Unused arguments leave the member untouched
     *        unless they carry a default.
     */
    auto applyBinding() const -> types::Unit {
      if (m_binding && (m_isUsed || m_defaultValue))
        m_binding(*this);
    }

   private:
    template <typename Number>
    auto parseNumber(types::StringView raw) const -> types::Result<Number> {
      Number value {};
      const auto [ptr, errc] = std::from_chars(raw.data(), raw.data() + raw.size(), value);

      if (errc != std::errc {} || ptr != raw.data() + raw.size())
        ERR_FMT(error::SwbErrorCode::InvalidArgument, "Failed to parse '{}' as a number for argument '{}'", raw, getPrimaryName());

      return value;
    }

    types::Vec<types::String> m_names;        ///< Argument names (e.g., {"-t", "--ticks"})
    types::String             m_helpText;     ///< Help text for this argument
    types::Option<ArgValue>   m_value;        ///< The value provided on the command line
    types::Option<ArgValue>   m_defaultValue; ///< Default value if none provided
    ArgChoices                m_choices;      ///< Allowed choices for enum-style arguments
    ArgChoices                m_lowerChoices; ///< Lower-cased choices for validation
    ArgBinding                m_binding;      ///< Optional binding to a struct member
    bool                      m_isFlag {};    ///< Whether this is a flag argument
    bool                      m_isUsed {};    ///< Whether this argument was used
  };

  /**
   * @brief Main argument parser class.
   *
   * `-h/--help` and `--version` are registered automatically. They never exit
   * the process; the caller checks helpRequested() / versionRequested().
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(types::String version)
      : m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      Argument& arg = *m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parse command-line arguments. The first element is the program name.
     * @param args Any range of string-like values (argv span, Vec<String>, ...)
     */
    template <std::ranges::input_range Range>
      requires std::convertible_to<std::ranges::range_reference_t<Range>, types::StringView>
    auto parseArgs(const Range& args) -> types::Result<> {
      auto       iter = std::ranges::begin(args);
      const auto end  = std::ranges::end(args);

      if (iter == end)
        return {};

      if (m_programName.empty())
        m_programName = types::String(types::StringView(*iter));

      for (++iter; iter != end; ++iter) {
        const types::StringView arg = *iter;

        auto found = m_argumentMap.find(arg);
        if (found == m_argumentMap.end())
          ERR_FMT(error::SwbErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = found->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (std::next(iter) == end)
          ERR_FMT(error::SwbErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(types::StringView(*++iter)));
      }

      return {};
    }

    auto parseArgs(types::Span<const char* const> args) -> types::Result<> {
      return parseArgs(args | std::views::transform([](const char* arg) { return types::StringView(arg); }));
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(types::StringView name) const -> T {
      auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->get<T>() : T {};
    }

    template <typename EnumType>
    [[nodiscard]] auto getEnum(types::StringView name) const -> EnumType {
      auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->getEnum<EnumType>() : EnumTraits<EnumType>::stringToEnum("");
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto helpRequested() const -> bool {
      return isUsed("--help");
    }

    [[nodiscard]] auto versionRequested() const -> bool {
      return isUsed("--version");
    }

    [[nodiscard]] auto version() const -> const types::String& {
      return m_version;
    }

    [[nodiscard]] auto helpText() const -> types::String {
      types::String text = std::format("Usage: {}", m_programName.empty() ? "switchboard" : m_programName);

      for (const auto& arg : m_arguments)
        text += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      text += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;
        for (const types::String& name : arg->getNames())
          names += names.empty() ? name : ", " + name;

        text += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          text += std::format("    {}\n", arg->getHelpText());

        if (!arg->getChoices().empty()) {
          types::String choices;
          for (const types::String& choice : arg->getChoices())
            choices += choices.empty() ? ToLower(choice) : ", " + ToLower(choice);

          text += std::format("    Available values: {}\n    Default: {}\n", choices, arg->getDefaultAsString());
        }
      }

      return text;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

    /**
     * @brief parseArgs() followed by applyBindings().
     */
    template <typename Range>
    auto parseInto(const Range& args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace switchboard::utils::argparse
