#include <chrono>  // std::chrono::{steady_clock, milliseconds}
#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <thread>  // std::this_thread::sleep_for

#include <Switchboard/Runtime/Runtime.hpp>
#include <Switchboard/Utils/ArgumentParser.hpp>
#include <Switchboard/Utils/Error.hpp>
#include <Switchboard/Utils/Logging.hpp>
#include <Switchboard/Utils/Types.hpp>

#include "App.hpp"
#include "Config/Config.hpp"

using namespace switchboard::utils::types;
using namespace switchboard::utils::logging;
using namespace switchboard::config;
using namespace switchboard::app;

using switchboard::core::runtime::Runtime;

namespace {
  struct CliOptions {
    String configPath;
    i32    ticks          = 5;
    bool   verbose        = false;
    bool   showConfigPath = false;
    bool   listPlugins    = false;
  };

  constexpr auto LISTENER_WAIT = std::chrono::seconds(2);

  auto PrintPluginList(const App& app) -> i32 {
    const switchboard::core::plugin::PluginManager& manager = app.manager();

    Println("{} plugin(s) installed:", manager.pluginCount());

    usize index = 0;
    for (const StringView name : manager.pluginNames())
      Println("  [{}] {}", index++, name);

    return EXIT_SUCCESS;
  }

  auto PrintSummary(const AppSummary& summary) -> void {
    Println("{}", Stylize("Summary", { .bold = true }));

    if (summary.restored)
      Println("  restored counter : {}", *summary.restored);
    else
      Println("  restored counter : (none)");

    Println("  ticks applied    : {}", summary.ticks);
    Println("  final counter    : {}", summary.counter);

    for (const String& error : summary.errors)
      Println("  error            : {}", error);
  }

  auto WaitForListeners(Runtime<AppMessage>& runtime, const App& app) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + LISTENER_WAIT;

    runtime.track(app.subscription());

    while (!app.listenersReady()) {
      if (std::chrono::steady_clock::now() >= deadline)
        return false;

      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return true;
  }
} // namespace

auto main(const i32 argc, char* argv[]) -> i32 try {
  CliOptions opts;

  switchboard::utils::argparse::ArgumentParser parser(std::format("switchboard {}", SWB_VERSION));

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag()
    .bindTo(opts.verbose);

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("-c", "--config-path")
    .help("Read configuration from this file instead of the default location.")
    .defaultValue(String(""))
    .bindTo(opts.configPath);

  parser
    .addArguments("-t", "--ticks")
    .help("Number of timer ticks to apply before exiting.")
    .defaultValue(i32(5))
    .bindTo(opts.ticks);

  parser
    .addArguments("--list-plugins")
    .help("List the installed plugins and exit.")
    .flag()
    .bindTo(opts.listPlugins);

  parser
    .addArguments("--show-config-path")
    .help("Display the active configuration file location.")
    .flag()
    .bindTo(opts.showConfigPath);

  const char* const* args = argv;

  if (Result<> result = parser.parseInto(Span<const char* const>(args, static_cast<usize>(argc))); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.helpRequested()) {
    parser.printHelp();
    return EXIT_SUCCESS;
  }

  if (parser.versionRequested()) {
    Println("{}", parser.version());
    return EXIT_SUCCESS;
  }

  const std::filesystem::path configPath = opts.configPath.empty() ? Config::getConfigPath() : std::filesystem::path(opts.configPath);

  if (opts.showConfigPath) {
    Println("{}", configPath.string());
    return EXIT_SUCCESS;
  }

  const Config config = Config::loadOrCreate(configPath);

  // Explicit flags win over the config file and environment.
  if (opts.verbose)
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level"))
    SetRuntimeLogLevel(parser.getEnum<LogLevel>("--log-level"));
  else
    SetRuntimeLogLevel(config.general.logLevel);

  if (opts.ticks < 0) {
    error_log("--ticks must not be negative (got {})", opts.ticks);
    return EXIT_FAILURE;
  }

  auto [app, startup] = App::create(AppSettings {
    .timerPeriod  = config.timerPeriod(),
    .prefStoreDir = config.prefStoreDirectory(),
  });

  if (opts.listPlugins)
    return PrintPluginList(app);

  Runtime<AppMessage> runtime(config.runtimeConfig());

  if (!WaitForListeners(runtime, app)) {
    error_log("Plugin listeners did not start within {}s", LISTENER_WAIT.count());
    return EXIT_FAILURE;
  }

  runtime.spawn(std::move(startup));

  const auto target   = static_cast<u64>(opts.ticks);
  bool       stopping = false;

  info_log_fields(
    { field(ticks, target), field(tick_ms, config.runtime.tickMs), field(workers, config.runtime.workerThreads) },
    "Running with {} plugin(s)",
    app.manager().pluginCount()
  );

  while (true) {
    runtime.track(app.subscription());

    if (!stopping && app.isRestored() && app.ticks() >= target) {
      debug_log("Reached {} tick(s), stopping the timer", app.ticks());
      runtime.spawn(app.stop());
      stopping = true;
    }

    Option<AppMessage> message = runtime.next(config.tickInterval());

    if (!message) {
      // Once stopped, the first quiet interval means every pending write has landed.
      if (stopping)
        break;

      continue;
    }

    runtime.spawn(app.update(std::move(*message)));
  }

  PrintSummary(app.summary());

  return app.summary().errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
