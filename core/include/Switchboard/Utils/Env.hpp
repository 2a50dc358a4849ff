#pragma once

#include <cerrno>  // errno
#include <cstdlib> // std::getenv, setenv, unsetenv
#include <cstring> // std::strerror

#include "Error.hpp"
#include "Types.hpp"

namespace switchboard::utils::env {
  namespace types = ::switchboard::utils::types;
  namespace error = ::switchboard::utils::error;

  using enum error::SwbErrorCode;

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return The value, or NotFound if the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
  }

  /**
   * @brief Retrieves an environment variable, treating an empty value as unset.
   * @details XDG variables are commonly exported empty; those should fall back too.
   */
  [[nodiscard]] inline auto GetEnvNonEmpty(const types::PCStr name) -> types::Result<types::String> {
    types::String value = TRY(GetEnv(name));

    if (value.empty())
      ERR_FMT(NotFound, "Environment variable '{}' is empty", name);

    return value;
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Result<> {
    if (setenv(name, value, 1) != 0)
      ERR_FMT(InvalidArgument, "Failed to set '{}': {}", name, std::strerror(errno));

    return {};
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Result<> {
    if (unsetenv(name) != 0)
      ERR_FMT(InvalidArgument, "Failed to unset '{}': {}", name, std::strerror(errno));

    return {};
  }
} // namespace switchboard::utils::env
