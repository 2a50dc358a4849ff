#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location

#include "Types.hpp"

namespace switchboard::utils::error {
  /**
   * @enum SwbErrorCode
   * @brief Error categories for the fallible parts of Switchboard.
   *
   * Routing itself never fails (mismatched envelopes are dropped); these codes
   * cover the layers around it: configuration, argument parsing, storage and
   * the host runtime.
   */
  enum class SwbErrorCode : types::u8 {
    ChannelClosed,      ///< The other end of a channel has gone away.
    ConfigurationError, ///< Configuration or environment issue.
    CorruptedData,      ///< Data present but corrupt or inconsistent.
    InternalError,      ///< A bug inside Switchboard itself.
    InvalidArgument,    ///< An invalid argument was passed to a function or method.
    IoError,            ///< General I/O error (filesystem, pipes, etc.).
    NotFound,           ///< A required resource (file, key, plugin) was not found.
    NotSupported,       ///< The requested operation is not supported.
    Other,              ///< A generic or unclassified error.
    ParseError,         ///< Failed to parse data (TOML, JSON, command line).
    PermissionDenied,   ///< Insufficient permissions to perform the operation.
    Shutdown,           ///< The runtime is shutting down and rejected the request.
    Timeout,            ///< An operation timed out.
  };

  /**
   * @struct SwbError
   * @brief Holds structured information about an error.
   *
   * Used as the error type in Result throughout the project.
   */
  struct SwbError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    SwbErrorCode         code;     ///< The general category of the error.

    SwbError(const SwbErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace switchboard::utils::error

#define ERR(errc, msg)          return ::switchboard::utils::types::Err(::switchboard::utils::error::SwbError(errc, msg))
#define ERR_FROM(err)           return ::switchboard::utils::types::Err(::switchboard::utils::error::SwbError(err))
#define ERR_FMT(errc, fmt, ...) return ::switchboard::utils::types::Err(::switchboard::utils::error::SwbError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Macro for Rust-style error propagation.
 *
 * Evaluates the given expression (which must return a Result<T, E>).
 * If the result contains an error, it immediately returns from the enclosing
 * function with that error wrapped in Err(). Otherwise, it yields the success value.
 *
 * @note Uses GNU statement expressions (GCC and Clang).
 *
 * @code
 * auto loadConfig(const fs::path& path) -> Result<Config> {
 *   String buffer = TRY(readFile(path));
 *   return TRY(parseToml(buffer));
 * }
 * @endcode
 */
#define TRY(expr)                                                                             \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _swb_try_result = (expr);                                                        \
      if (!_swb_try_result)                                                                   \
        return ::switchboard::utils::types::Err(_swb_try_result.error());                     \
      std::move(*_swb_try_result);                                                            \
    })                                                                                        \
      _Pragma("clang diagnostic pop")

/**
 * @brief Macro for Rust-style error propagation with Result<void> types.
 *
 * @code
 * auto prepare() -> Result<> {
 *   TRY_VOID(ensureDirectory(dir));
 *   TRY_VOID(writeDefaults(dir));
 *   return {};
 * }
 * @endcode
 */
#define TRY_VOID(expr)                                                                        \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _swb_try_result = (expr);                                                        \
      if (!_swb_try_result)                                                                   \
        return ::switchboard::utils::types::Err(_swb_try_result.error());                     \
    })                                                                                        \
      _Pragma("clang diagnostic pop")
