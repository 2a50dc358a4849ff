#pragma once

#include "../Runtime/Task.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Envelope.hpp"
#include "OutputFanout.hpp"
#include "Plugin.hpp"
#include "PluginHandle.hpp"
#include "PluginManager.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Collects plugins, then creates the PluginManager and one batched startup task.
   *
   * Handles are available as soon as a plugin is queued (before build()), so
   * the host can keep them next to the manager:
   *
   * @code
   *   PluginManagerBuilder builder;
   *   PluginHandle<TimerPlugin> timer = builder.install(TimerPlugin { 1s });
   *   auto [plugins, startup] = std::move(builder).build();
   * @endcode
   */
  class PluginManagerBuilder {
   public:
    PluginManagerBuilder()
      : m_fanout(std::make_shared<OutputFanout>()) {}

    /**
     * @brief Queue @p plugin and return its handle. Slots follow the queueing order.
     */
    template <Plugin P>
    auto install(P plugin) -> PluginHandle<P> {
      const types::usize index = m_installers.size();

      m_installers.emplace_back([plugin = std::move(plugin)](PluginManager& manager) mutable -> runtime::Task<PluginMessage> {
        return std::move(manager.install(std::move(plugin)).second);
      });

      return PluginHandle<P>(index, m_fanout);
    }

    /**
     * @brief Chaining form of install() for when the handle is not needed.
     */
    template <Plugin P>
    auto withPlugin(P plugin) && -> PluginManagerBuilder&& {
      install(std::move(plugin));
      return std::move(*this);
    }

    template <Plugin P>
    auto withPlugin(P plugin) & -> PluginManagerBuilder& {
      install(std::move(plugin));
      return *this;
    }

    [[nodiscard]] auto pluginCount() const -> types::usize {
      return m_installers.size();
    }

    /**
     * @brief Install every queued plugin, in order.
     * @return The manager and the batch of all startup tasks.
     */
    auto build() && -> types::Pair<PluginManager, runtime::Task<PluginMessage>> {
      PluginManager                          manager(m_fanout);
      types::Vec<runtime::Task<PluginMessage>> startup;
      startup.reserve(m_installers.size());

      for (auto& installer : m_installers)
        startup.push_back(installer(manager));

      m_installers.clear();

      debug_log("Built plugin manager with {} plugin(s)", manager.pluginCount());

      return { std::move(manager), runtime::Task<PluginMessage>::batch(std::move(startup)) };
    }

   private:
    types::Vec<types::MoveFn<runtime::Task<PluginMessage>(PluginManager&)>> m_installers;
    types::SharedPointer<OutputFanout>                                     m_fanout;
  };
} // namespace switchboard::core::plugin
