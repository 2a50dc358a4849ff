#include <boost/ut.hpp>
#include <chrono>     // std::chrono::{milliseconds, seconds, steady_clock}
#include <filesystem> // std::filesystem::{path, temp_directory_path, create_directories, remove_all}
#include <format>     // std::format
#include <fstream>    // std::ofstream
#include <system_error> // std::error_code
#include <thread>     // std::this_thread::sleep_for
#include <variant>    // std::variant, std::visit

#include <Switchboard/Core/Envelope.hpp>
#include <Switchboard/Core/PluginHandle.hpp>
#include <Switchboard/Core/PluginManager.hpp>
#include <Switchboard/Core/PluginManagerBuilder.hpp>
#include <Switchboard/Runtime/Runtime.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

#include "App.hpp"
#include "Plugins/Counter.hpp"
#include "Plugins/PrefStore.hpp"
#include "Plugins/Timer.hpp"

namespace fs = std::filesystem;

using namespace switchboard::utils::types;
using namespace switchboard::core::plugin;
using namespace switchboard::core::runtime;
using namespace switchboard::plugins;
using namespace switchboard::app;

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {
  using Clock = std::chrono::steady_clock;

  constexpr auto DEADLINE = seconds(10);

  class TempDir {
   public:
    TempDir()
      : m_path(fs::temp_directory_path() / std::format("switchboard-scenario-{}", Clock::now().time_since_epoch().count())) {
      fs::create_directories(m_path);
    }

    TempDir(const TempDir&)                    = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    ~TempDir() {
      std::error_code errc;
      fs::remove_all(m_path, errc);
    }

    [[nodiscard]] auto path() const -> const fs::path& {
      return m_path;
    }

   private:
    fs::path m_path;
  };

  auto WaitUntil(const auto& predicate) -> bool {
    const auto deadline = Clock::now() + DEADLINE;

    while (!predicate()) {
      if (Clock::now() >= deadline)
        return false;

      std::this_thread::sleep_for(milliseconds(1));
    }

    return true;
  }

  // A timer whose ticks bump a counter, wired the way a host application does it.
  using TickMessage = std::variant<PluginMessage, TimerTicked>;

  auto Lift(Task<PluginMessage> task) -> Task<TickMessage> {
    return std::move(task).map([](PluginMessage envelope) -> TickMessage { return envelope; });
  }

  struct TickHost {
    PluginManager               manager;
    PluginHandle<CounterPlugin> counter;
    PluginHandle<TimerPlugin>   timer;

    [[nodiscard]] auto subscription() const -> Subscription<TickMessage> {
      Vec<Subscription<TickMessage>> parts;
      parts.push_back(manager.subscriptions().map([](PluginMessage envelope) -> TickMessage { return envelope; }));
      parts.push_back(timer.listen().map([](TimerTicked ticked) -> TickMessage { return ticked; }));
      return Subscription<TickMessage>::batch(std::move(parts));
    }

    auto update(TickMessage message) -> Task<TickMessage> {
      if (const auto* envelope = std::get_if<PluginMessage>(&message))
        return Lift(manager.update(*envelope));

      return Lift(counter.dispatch(counter::Increment {}));
    }

    [[nodiscard]] auto count() const -> i64 {
      return (*manager.getState<CounterPlugin>())->value;
    }

    [[nodiscard]] auto timerState() const -> const TimerState& {
      return **manager.getState<TimerPlugin>();
    }
  };

  auto MakeTickHost(const milliseconds period) -> Pair<TickHost, Task<PluginMessage>> {
    PluginManagerBuilder builder;

    PluginHandle<CounterPlugin> counter = builder.install(CounterPlugin {});
    PluginHandle<TimerPlugin>   timer   = builder.install(TimerPlugin { period });

    Pair<PluginManager, Task<PluginMessage>> built = std::move(builder).build();

    return { TickHost { .manager = std::move(built.first), .counter = counter, .timer = timer }, std::move(built.second) };
  }

  // Runs the host loop until the predicate holds or the deadline passes.
  auto Pump(Runtime<TickMessage>& runtime, TickHost& host, const auto& done) -> bool {
    const auto deadline = Clock::now() + DEADLINE;

    while (!done()) {
      if (Clock::now() >= deadline)
        return false;

      runtime.track(host.subscription());

      if (Option<TickMessage> message = runtime.next(milliseconds(50)))
        runtime.spawn(host.update(std::move(*message)));
    }

    return true;
  }

  // The CLI's loop, bounded by a deadline.
  auto RunApp(App& app, Task<AppMessage> startup, const u64 target) -> Option<AppSummary> {
    Runtime<AppMessage> runtime;

    runtime.track(app.subscription());

    if (!WaitUntil([&app] { return app.listenersReady(); }))
      return None;

    runtime.spawn(std::move(startup));

    const auto deadline = Clock::now() + DEADLINE;
    bool       stopping = false;

    while (Clock::now() < deadline) {
      runtime.track(app.subscription());

      if (!stopping && app.isRestored() && app.ticks() >= target) {
        runtime.spawn(app.stop());
        stopping = true;
      }

      Option<AppMessage> message = runtime.next(milliseconds(200));

      if (!message) {
        if (stopping)
          return app.summary();

        continue;
      }

      runtime.spawn(app.update(std::move(*message)));
    }

    return None;
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "counter applies increments, decrements and sets"_test = [] -> void {
    const CounterPlugin plugin;
    auto [state, startup] = plugin.init();

    expect(startup.isNone());
    expect(plugin.update(state, counter::Increment {}).output->value == 1_l);
    expect(plugin.update(state, counter::Increment {}).output->value == 2_l);
    expect(plugin.update(state, counter::Decrement {}).output->value == 1_l);
    expect(plugin.update(state, counter::Set { .value = -7 }).output->value == -7_l);
    expect(state.value == -7_l);
  };

  "the timer only subscribes while running"_test = [] -> void {
    auto [host, startup] = MakeTickHost(milliseconds(20));

    Subscription<PluginMessage> running = host.manager.subscriptions();
    expect(running.size() == 1_ul);

    host.manager.update(host.timer.message(timer::Pause {}));
    expect(!host.timerState().running);
    expect(host.manager.subscriptions().isNone());

    host.manager.update(host.timer.message(timer::Tick {}));
    expect(host.timerState().ticks == 0_ull);

    host.manager.update(host.timer.message(timer::Resume {}));
    expect(host.manager.subscriptions().size() == 1_ul);
    expect(host.manager.subscriptions().recipes()[0].id == running.recipes()[0].id);
  };

  "timer ticks drive the counter through the runtime"_test = [] -> void {
    auto [host, startup] = MakeTickHost(milliseconds(5));

    Runtime<TickMessage> runtime;
    runtime.track(host.subscription());

    const usize timerSlot = host.timer.index();
    const auto& fanout    = *host.manager.fanout();
    expect(WaitUntil([&fanout, timerSlot] { return fanout.listenerCount(timerSlot) >= 1; }));

    runtime.spawn(Lift(std::move(startup)));

    TickHost& hostRef = host;
    expect(Pump(runtime, hostRef, [&hostRef] { return hostRef.count() >= 5; }));

    expect(host.count() >= 5_l);
    expect(host.timerState().ticks >= static_cast<u64>(host.count()));

    runtime.spawn(Lift(host.timer.dispatch(timer::Pause {})));
    expect(Pump(runtime, hostRef, [&hostRef] { return !hostRef.timerState().running; }));

    TrackerDiff paused = runtime.track(host.subscription());
    expect(paused.stopped == 1_ul);
    expect(paused.started == 0_ul);

    host.manager.update(host.timer.message(timer::Resume {}));
    expect(runtime.track(host.subscription()).started == 1_ul);
  };

  "the app restores, advances and persists the counter"_test = [] -> void {
    const TempDir dir;
    expect(SaveGroup(dir.path() / "demo.json", PrefGroup { { "counter", "41" } }).has_value());

    auto [app, startup] = App::create(AppSettings { .timerPeriod = milliseconds(5), .prefStoreDir = dir.path() });

    expect(app.manager().pluginNames() == Vec<StringView> { "counter", "timer", "pref_store" });

    App&               appRef  = app;
    Option<AppSummary> summary = RunApp(appRef, std::move(startup), 3);

    expect(summary.has_value());
    expect(summary->restored == Option<i64>(41));
    expect(summary->ticks >= 3_ull);
    expect(summary->counter == 41 + static_cast<i64>(summary->ticks));
    expect(summary->errors.empty());

    Result<PrefGroup> stored = LoadGroup(dir.path() / "demo.json");
    expect(stored.has_value());
    expect(stored->at("counter") == std::to_string(summary->counter));
  };

  "the app starts from zero without a stored counter"_test = [] -> void {
    const TempDir dir;

    auto [app, startup] = App::create(AppSettings { .timerPeriod = milliseconds(5), .prefStoreDir = dir.path() });

    App&               appRef  = app;
    Option<AppSummary> summary = RunApp(appRef, std::move(startup), 2);

    expect(summary.has_value());
    expect(!summary->restored.has_value());
    expect(summary->counter == static_cast<i64>(summary->ticks));
    expect(summary->errors.empty());

    Result<PrefGroup> stored = LoadGroup(dir.path() / "demo.json");
    expect(stored.has_value());
    expect(stored->at("counter") == std::to_string(summary->counter));
  };

  "a corrupted store is reported without stopping the app"_test = [] -> void {
    const TempDir dir;

    {
      std::ofstream file(dir.path() / "demo.json");
      file << "not json at all";
    }

    auto [app, startup] = App::create(AppSettings { .timerPeriod = milliseconds(5), .prefStoreDir = dir.path() });

    App&               appRef  = app;
    Option<AppSummary> summary = RunApp(appRef, std::move(startup), 2);

    expect(summary.has_value());
    expect(!summary->restored.has_value());
    expect(summary->ticks >= 2_ull);
    expect(!summary->errors.empty());
  };

  return 0;
}
