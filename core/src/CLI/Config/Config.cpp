#include "Config.hpp"

#include <algorithm>  // std::ranges::transform
#include <cctype>     // std::tolower
#include <filesystem> // std::filesystem::{path, operator/, exists, create_directories}
#include <glaze/toml.hpp>
#include <magic_enum/magic_enum.hpp>
#include <system_error> // std::error_code

#include <Switchboard/Utils/Env.hpp>
#include <Switchboard/Utils/Error.hpp>
#include <Switchboard/Utils/Logging.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace switchboard::utils::types;
using switchboard::utils::env::GetEnvNonEmpty;
using switchboard::utils::logging::LogLevel;
using enum switchboard::utils::error::SwbErrorCode;

// Intermediate structs for TOML parsing with glaze.
// Empty strings stand in for "not provided".
namespace {
  struct TomlGeneral {
    String logLevel; // Empty = not provided
  };

  struct TomlRuntime {
    u32 workerThreads = 2;
    u32 tickMs        = 250;
  };

  struct TomlPlugins {
    u32    timerPeriodMs = 1000;
    String prefStoreDir; // Empty = not provided
  };

  struct TomlConfig {
    TomlGeneral general;
    TomlRuntime runtime;
    TomlPlugins plugins;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object("log_level", &T::logLevel);
};

template <>
struct glz::meta<TomlRuntime> {
  using T                     = TomlRuntime;
  static constexpr auto value = object("worker_threads", &T::workerThreads, "tick_ms", &T::tickMs);
};

template <>
struct glz::meta<TomlPlugins> {
  using T                     = TomlPlugins;
  static constexpr auto value = object("timer_period_ms", &T::timerPeriodMs, "pref_store_dir", &T::prefStoreDir);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general, "runtime", &T::runtime, "plugins", &T::plugins);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace {
  auto ParseLogLevel(const StringView text) -> Option<LogLevel> {
    if (auto level = magic_enum::enum_cast<LogLevel>(text, magic_enum::case_insensitive))
      return *level;

    return None;
  }

  auto LevelName(const LogLevel level) -> String {
    String name(magic_enum::enum_name(level));
    std::ranges::transform(name, name.begin(), [](unsigned char chr) -> char { return static_cast<char>(std::tolower(chr)); });
    return name;
  }
} // namespace

namespace switchboard::config {
  auto Config::getConfigPath() -> fs::path {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnvNonEmpty("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "switchboard" / "config.toml");

    if (Result<String> result = GetEnvNonEmpty("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "switchboard" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  auto Config::writeDefault(const fs::path& path) -> Result<> {
    if (path.has_parent_path()) {
      std::error_code errc;
      fs::create_directories(path.parent_path(), errc);

      if (errc)
        ERR_FMT(IoError, "Failed to create config directory '{}': {}", path.parent_path().string(), errc.message());
    }

    const Config defaults {};

    TomlConfig defaultCfg;
    defaultCfg.general.logLevel      = LevelName(defaults.general.logLevel);
    defaultCfg.runtime.workerThreads = static_cast<u32>(defaults.runtime.workerThreads);
    defaultCfg.runtime.tickMs        = defaults.runtime.tickMs;
    defaultCfg.plugins.timerPeriodMs = defaults.plugins.timerPeriodMs;

    String buffer;

    if (const auto writeError = glz::write_file_toml(defaultCfg, path.string(), buffer))
      ERR_FMT(IoError, "Failed to write default config: {}", glz::format_error(writeError, buffer));

    info_log("Created default config file at {}", path.string());
    return {};
  }

  auto Config::loadFrom(const fs::path& path) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer;

    glz::context ctx {};
    ctx.current_file = path.string();

    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file: {}", path.string());

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx))
      ERR_FMT(ParseError, "Failed to parse config file: {}", glz::format_error(readError, buffer));

    Config cfg;

    if (!tomlCfg.general.logLevel.empty()) {
      Option<LogLevel> level = ParseLogLevel(tomlCfg.general.logLevel);

      if (!level)
        ERR_FMT(ConfigurationError, "Unknown log level '{}' (expected one of: trace, debug, info, warn, error)", tomlCfg.general.logLevel);

      cfg.general.logLevel = *level;
    }

    if (tomlCfg.runtime.workerThreads == 0)
      ERR(ConfigurationError, "runtime.worker_threads must be at least 1");

    if (tomlCfg.runtime.tickMs == 0)
      ERR(ConfigurationError, "runtime.tick_ms must be at least 1");

    if (tomlCfg.plugins.timerPeriodMs == 0)
      ERR(ConfigurationError, "plugins.timer_period_ms must be at least 1");

    cfg.runtime.workerThreads = tomlCfg.runtime.workerThreads;
    cfg.runtime.tickMs        = tomlCfg.runtime.tickMs;
    cfg.plugins.timerPeriodMs = tomlCfg.plugins.timerPeriodMs;
    cfg.plugins.prefStoreDir  = tomlCfg.plugins.prefStoreDir.empty() ? None : Option<String>(tomlCfg.plugins.prefStoreDir);

    debug_log("Config loaded from {}", path.string());
    return cfg;
  }

  auto Config::loadOrCreate(const fs::path& path) -> Config {
    std::error_code errc;

    if (!fs::exists(path, errc)) {
      info_log("Config file not found at {}, creating defaults.", path.string());

      if (Result<> written = writeDefault(path); !written) {
        error_at(written.error());

        Config cfg;
        cfg.applyEnvOverrides();
        return cfg;
      }
    }

    Result<Config> loaded = loadFrom(path);

    if (!loaded) {
      error_at(loaded.error());
      warn_log("Using in-memory defaults.");
      loaded = Config {};
    }

    loaded->applyEnvOverrides();
    return *std::move(loaded);
  }

  auto Config::getInstance() -> Config {
    return loadOrCreate(getConfigPath());
  }

  auto Config::applyEnvOverrides() -> void {
    Result<String> value = GetEnvNonEmpty("SWITCHBOARD_LOG_LEVEL");

    if (!value)
      return;

    if (Option<LogLevel> level = ParseLogLevel(*value)) {
      debug_log("Log level overridden by SWITCHBOARD_LOG_LEVEL={}", *value);
      general.logLevel = *level;
    } else {
      warn_log("Ignoring SWITCHBOARD_LOG_LEVEL={}: not a log level", *value);
    }
  }

  auto Config::runtimeConfig() const -> core::runtime::RuntimeConfig {
    return core::runtime::RuntimeConfig { .workerThreads = runtime.workerThreads };
  }

  auto Config::prefStoreDirectory() const -> fs::path {
    if (plugins.prefStoreDir)
      return fs::path(*plugins.prefStoreDir);

    if (Result<String> dataHome = GetEnvNonEmpty("XDG_DATA_HOME"))
      return fs::path(*dataHome) / "switchboard" / "prefs";

    if (Result<String> home = GetEnvNonEmpty("HOME"))
      return fs::path(*home) / ".local" / "share" / "switchboard" / "prefs";

    return fs::path(".") / "prefs";
  }
} // namespace switchboard::config
