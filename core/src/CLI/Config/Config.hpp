#pragma once

#include <chrono>     // std::chrono::milliseconds
#include <filesystem> // std::filesystem::path

#include <Switchboard/Runtime/RuntimeConfig.hpp>
#include <Switchboard/Utils/Logging.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace switchboard::config {
  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    utils::logging::LogLevel logLevel = utils::logging::LogLevel::Info; ///< Minimum level printed.
  };

  /**
   * @struct Runtime
   * @brief Host runtime tuning.
   */
  struct Runtime {
    utils::types::usize workerThreads = 2;   ///< Threads running task actions.
    utils::types::u32   tickMs        = 250; ///< Longest wait for a message before the loop re-tracks subscriptions.
  };

  /**
   * @struct Plugins
   * @brief Settings for the bundled plugins.
   */
  struct Plugins {
    utils::types::u32                          timerPeriodMs = 1000;
    utils::types::Option<utils::types::String> prefStoreDir; ///< Defaults to the XDG data directory.
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General general; ///< General configuration settings.
    Runtime runtime; ///< Host runtime settings.
    Plugins plugins; ///< Plugin settings.

    Config() = default;

    /**
     * @brief Loads the configuration from the preferred location.
     *
     * Writes a default file first if none exists. Any failure is logged and
     * yields the in-memory defaults. Environment overrides are applied last.
     */
    static auto getInstance() -> Config;

    /**
     * @brief Like getInstance(), but for an explicit file.
     */
    static auto loadOrCreate(const std::filesystem::path& path) -> Config;

    /**
     * @brief Gets the path to the configuration file without loading it.
     * @return The first existing candidate, otherwise the most preferred one.
     *
     * Candidates, in order: $XDG_CONFIG_HOME/switchboard/config.toml,
     * $HOME/.config/switchboard/config.toml, ./config.toml.
     */
    static auto getConfigPath() -> std::filesystem::path;

    /**
     * @brief Parses and validates a config file.
     *
     * Unknown keys are ignored; missing keys keep their defaults.
     */
    static auto loadFrom(const std::filesystem::path& path) -> utils::types::Result<Config>;

    /**
     * @brief Writes a config file containing every key at its default value.
     */
    static auto writeDefault(const std::filesystem::path& path) -> utils::types::Result<>;

    /**
     * @brief Applies SWITCHBOARD_LOG_LEVEL, if set to a valid level.
     */
    auto applyEnvOverrides() -> void;

    [[nodiscard]] auto runtimeConfig() const -> core::runtime::RuntimeConfig;

    [[nodiscard]] auto tickInterval() const -> std::chrono::milliseconds {
      return std::chrono::milliseconds(runtime.tickMs);
    }

    [[nodiscard]] auto timerPeriod() const -> std::chrono::milliseconds {
      return std::chrono::milliseconds(plugins.timerPeriodMs);
    }

    /**
     * @brief Where the preference store keeps its group files.
     *
     * plugins.pref_store_dir if set, else $XDG_DATA_HOME/switchboard/prefs,
     * else $HOME/.local/share/switchboard/prefs, else ./prefs.
     */
    [[nodiscard]] auto prefStoreDirectory() const -> std::filesystem::path;
  };
} // namespace switchboard::config
