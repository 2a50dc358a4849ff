#include "App.hpp"

#include <matchit.hpp> // matchit::impl::Overload

#include <Switchboard/Core/PluginManagerBuilder.hpp>
#include <Switchboard/Utils/Logging.hpp>

namespace switchboard::app {
  using namespace utils::types;

  using core::plugin::PluginMessage;
  using core::runtime::Subscription;
  using core::runtime::Task;
  using matchit::impl::Overload;

  namespace {
    auto Lift(Task<PluginMessage> task) -> Task<AppMessage> {
      return std::move(task).map([](PluginMessage envelope) -> AppMessage { return envelope; });
    }

    auto IsCounterKey(const StringView group, const StringView key) -> bool {
      return group == COUNTER_GROUP && key == COUNTER_KEY;
    }

    auto RestoreFilter(const plugins::PrefOutput& output) -> Option<RestoredCount> {
      return std::visit(
        Overload {
          [&](const plugins::PrefValue& found) -> Option<RestoredCount> {
            if (!IsCounterKey(found.group, found.key))
              return None;

            Option<i64> value = output.as<i64>();

            if (!value)
              warn_log("Stored counter '{}' is not an integer, starting from 0", found.value);

            return RestoredCount { .value = value };
          },
          [](const plugins::PrefNotFound& missing) -> Option<RestoredCount> {
            if (!IsCounterKey(missing.group, missing.key))
              return None;

            return RestoredCount { .value = None };
          },
          [](const auto&) -> Option<RestoredCount> { return None; },
        },
        output.kind
      );
    }

    auto ErrorFilter(const plugins::PrefOutput& output) -> Option<plugins::PrefError> {
      if (const auto* error = std::get_if<plugins::PrefError>(&output.kind))
        return *error;

      return None;
    }
  } // namespace

  App::App(
    core::plugin::PluginManager                         manager,
    core::plugin::PluginHandle<plugins::CounterPlugin>   counter,
    core::plugin::PluginHandle<plugins::TimerPlugin>     timer,
    core::plugin::PluginHandle<plugins::PrefStorePlugin> prefs
  )
    : m_plugins(std::move(manager)), m_counter(std::move(counter)), m_timer(std::move(timer)), m_prefs(std::move(prefs)) {}

  auto App::create(const AppSettings& settings) -> Pair<App, Task<AppMessage>> {
    core::plugin::PluginManagerBuilder builder;

    auto counter = builder.install(plugins::CounterPlugin {});
    auto timer   = builder.install(plugins::TimerPlugin { settings.timerPeriod });
    auto prefs   = builder.install(plugins::PrefStorePlugin { settings.prefStoreDir });

    auto [manager, startup] = std::move(builder).build();

    Vec<Task<AppMessage>> tasks;
    tasks.push_back(Lift(std::move(startup)));
    tasks.push_back(Lift(prefs.dispatch(plugins::PrefMessage::get(String(COUNTER_GROUP), String(COUNTER_KEY)))));

    return {
      App(std::move(manager), counter, timer, prefs),
      Task<AppMessage>::batch(std::move(tasks)),
    };
  }

  auto App::update(AppMessage message) -> Task<AppMessage> {
    return std::visit(
      Overload {
        [&](PluginMessage& envelope) -> Task<AppMessage> { return Lift(m_plugins.update(envelope)); },
        [&](plugins::TimerTicked& /*ticked*/) -> Task<AppMessage> {
          if (!m_restored) {
            debug_log("Tick before the stored counter was restored, skipping");
            return Task<AppMessage>::none();
          }

          ++m_ticks;
          return Lift(m_counter.dispatch(plugins::counter::Increment {}));
        },
        [&](plugins::CounterChanged& changed) -> Task<AppMessage> { return onCounterChanged(changed); },
        [&](RestoredCount& restored) -> Task<AppMessage> {
          if (m_restored)
            return Task<AppMessage>::none();

          m_restored      = true;
          m_restoredValue = restored.value;

          if (!restored.value) {
            info_log("No stored counter, starting from 0");
            return Task<AppMessage>::none();
          }

          info_log("Restored counter: {}", *restored.value);

          // Applied in place so no later tick can reach the counter first.
          return Lift(m_plugins.update(m_counter.message(plugins::counter::Set { .value = *restored.value })));
        },
        [&](plugins::PrefError& error) -> Task<AppMessage> {
          error_log("Preference store: {}", error.message);
          m_errors.push_back(std::move(error.message));

          // Before the restore completes the only disk access is the startup lookup.
          if (!m_restored) {
            warn_log("Could not read the stored counter, starting from 0");
            m_restored = true;
          }

          return Task<AppMessage>::none();
        },
      },
      message
    );
  }

  auto App::onCounterChanged(const plugins::CounterChanged& changed) -> Task<AppMessage> {
    m_value = changed.value;

    Result<plugins::PrefMessage> store = plugins::PrefMessage::set(String(COUNTER_GROUP), String(COUNTER_KEY), changed.value);

    if (!store) {
      error_at(store.error());
      m_errors.push_back(store.error().message);
      return Task<AppMessage>::none();
    }

    return Lift(m_prefs.dispatch(std::move(*store)));
  }

  auto App::subscription() const -> Subscription<AppMessage> {
    Vec<Subscription<AppMessage>> subscriptions;

    subscriptions.push_back(m_plugins.subscriptions().map([](PluginMessage envelope) -> AppMessage { return envelope; }));
    subscriptions.push_back(m_timer.listen().map([](plugins::TimerTicked ticked) -> AppMessage { return ticked; }));
    subscriptions.push_back(m_counter.listen().map([](plugins::CounterChanged changed) -> AppMessage { return changed; }));
    subscriptions.push_back(m_prefs.listenWith(&RestoreFilter).map([](RestoredCount restored) -> AppMessage { return restored; }));
    subscriptions.push_back(m_prefs.listenWith(&ErrorFilter).map([](plugins::PrefError error) -> AppMessage { return error; }));

    return Subscription<AppMessage>::batch(std::move(subscriptions));
  }

  auto App::listenersReady() const -> bool {
    const SharedPointer<core::plugin::OutputFanout>& fanout = m_plugins.fanout();

    return fanout->listenerCount(m_timer.index()) >= 1 &&
      fanout->listenerCount(m_counter.index()) >= 1 &&
      fanout->listenerCount(m_prefs.index()) >= 2;
  }

  auto App::stop() const -> Task<AppMessage> {
    return Lift(m_timer.dispatch(plugins::timer::Pause {}));
  }

  auto App::summary() const -> AppSummary {
    return AppSummary {
      .ticks    = m_ticks,
      .counter  = m_value,
      .restored = m_restoredValue,
      .errors   = m_errors,
    };
  }
} // namespace switchboard::app
