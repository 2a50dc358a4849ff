/**
 * @file App.hpp
 * @brief The demo host: a timer driving a counter whose value survives restarts.
 *
 * Every timer tick increments the counter. Every counter change is written to
 * the preference store, and the stored value is loaded back on startup.
 * Plugins never talk to each other directly; the app listens to their outputs
 * and dispatches the follow-up messages through their handles.
 */

#pragma once

#include <chrono>     // std::chrono::milliseconds
#include <filesystem> // std::filesystem::path
#include <variant>    // std::variant

#include <Switchboard/Core/Envelope.hpp>
#include <Switchboard/Core/PluginHandle.hpp>
#include <Switchboard/Core/PluginManager.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

#include "Plugins/Counter.hpp"
#include "Plugins/PrefStore.hpp"
#include "Plugins/Timer.hpp"

namespace switchboard::app {
  namespace types = ::switchboard::utils::types;

  /// Group and key the counter is persisted under.
  inline constexpr types::StringView COUNTER_GROUP = "demo";
  inline constexpr types::StringView COUNTER_KEY   = "counter";

  /// Answer to the startup lookup of the persisted counter. None when nothing was stored.
  struct RestoredCount {
    types::Option<types::i64> value;
  };

  using AppMessage = std::variant<
    core::plugin::PluginMessage,
    plugins::TimerTicked,
    plugins::CounterChanged,
    RestoredCount,
    plugins::PrefError>;

  struct AppSettings {
    std::chrono::milliseconds timerPeriod = std::chrono::seconds(1);
    std::filesystem::path     prefStoreDir;
  };

  struct AppSummary {
    types::u64                ticks   = 0; ///< Ticks applied to the counter this run.
    types::i64                counter = 0;
    types::Option<types::i64> restored;
    types::Vec<types::String> errors;
  };

  class App {
   public:
    /**
     * @brief Install the plugins and build the startup task (plugin init work
     *        plus the lookup of the persisted counter).
     */
    static auto create(const AppSettings& settings) -> types::Pair<App, core::runtime::Task<AppMessage>>;

    auto update(AppMessage message) -> core::runtime::Task<AppMessage>;

    /**
     * @brief Plugin subscriptions plus the app's listeners on plugin outputs.
     *
     * Rebuilt every loop iteration; identities stay stable so the tracker keeps
     * the same listeners running.
     */
    [[nodiscard]] auto subscription() const -> core::runtime::Subscription<AppMessage>;

    /**
     * @brief Whether every listener from subscription() has attached to the fanout.
     *
     * Outputs published earlier are not replayed, so the host should wait for
     * this before routing messages.
     */
    [[nodiscard]] auto listenersReady() const -> bool;

    /**
     * @brief Pause the timer so no further ticks are produced.
     */
    [[nodiscard]] auto stop() const -> core::runtime::Task<AppMessage>;

    /**
     * @brief Timer ticks applied to the counter. Ticks that arrive before the
     *        stored value has been restored are not counted.
     */
    [[nodiscard]] auto ticks() const -> types::u64 {
      return m_ticks;
    }

    [[nodiscard]] auto isRestored() const -> bool {
      return m_restored;
    }

    [[nodiscard]] auto summary() const -> AppSummary;

    [[nodiscard]] auto manager() const -> const core::plugin::PluginManager& {
      return m_plugins;
    }

   private:
    App(
      core::plugin::PluginManager                         manager,
      core::plugin::PluginHandle<plugins::CounterPlugin>   counter,
      core::plugin::PluginHandle<plugins::TimerPlugin>     timer,
      core::plugin::PluginHandle<plugins::PrefStorePlugin> prefs
    );

    auto onCounterChanged(const plugins::CounterChanged& changed) -> core::runtime::Task<AppMessage>;

    core::plugin::PluginManager                         m_plugins;
    core::plugin::PluginHandle<plugins::CounterPlugin>   m_counter;
    core::plugin::PluginHandle<plugins::TimerPlugin>     m_timer;
    core::plugin::PluginHandle<plugins::PrefStorePlugin> m_prefs;

    types::u64                m_ticks    = 0;
    types::i64                m_value    = 0;
    bool                      m_restored = false;
    types::Option<types::i64> m_restoredValue;
    types::Vec<types::String> m_errors;
  };
} // namespace switchboard::app
