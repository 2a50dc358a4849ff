/**
 * @file PluginManager.hpp
 * @brief The plugin registry: owns every plugin's state and routes envelopes to it.
 */

#pragma once

#include "../Runtime/Subscription.hpp"
#include "../Runtime/Task.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Envelope.hpp"
#include "OutputFanout.hpp"
#include "Plugin.hpp"
#include "PluginHandle.hpp"
#include "PluginSlot.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Registry of installed plugins.
   *
   * Plugins occupy slots numbered in installation order. Slot indices are never
   * reused and plugins are never removed while the manager lives. All methods
   * are meant to be called from the host thread; only the OutputFanout is
   * shared with other threads.
   */
  class PluginManager {
   public:
    PluginManager();
    explicit PluginManager(types::SharedPointer<OutputFanout> fanout);

    PluginManager(const PluginManager&)                    = delete;
    auto operator=(const PluginManager&) -> PluginManager& = delete;
    PluginManager(PluginManager&&) noexcept                = default;
    auto operator=(PluginManager&&) noexcept -> PluginManager& = default;
    ~PluginManager()                                       = default;

    /**
     * @brief Install a plugin in the next free slot.
     *
     * Calls the plugin's init() right away; the returned task carries its
     * startup work, already addressed to the new slot.
     */
    template <Plugin P>
    auto install(P plugin) -> types::Pair<PluginHandle<P>, runtime::Task<PluginMessage>> {
      const types::usize index = m_slots.size();

      auto [state, startup] = plugin.init();
      auto slot             = std::make_unique<detail::PluginSlot<P>>(index, std::move(plugin), std::move(state));

      debug_log_fields({ field(slot, index), field(actions, startup.size()) }, "Installed plugin '{}'", slot->name());

      m_slots.push_back(std::move(slot));

      return { PluginHandle<P>(index, m_fanout), std::move(startup).map(Addressed<MessageOf<P>>(index)) };
    }

    /**
     * @brief Deliver @p envelope to the plugin it is addressed to.
     *
     * Envelopes for an unknown slot, or whose payload is not the slot's
     * message type, are dropped and yield an empty result.
     */
    auto route(const PluginMessage& envelope) -> RouteResult;

    /**
     * @brief route() followed by publishing the output to listeners.
     * @return The follow-up task.
     */
    auto update(const PluginMessage& envelope) -> runtime::Task<PluginMessage>;

    /**
     * @brief Every plugin's current subscription, merged.
     */
    [[nodiscard]] auto subscriptions() const -> runtime::Subscription<PluginMessage>;

    [[nodiscard]] auto pluginCount() const -> types::usize {
      return m_slots.size();
    }

    [[nodiscard]] auto pluginNames() const -> types::Vec<types::StringView>;

    [[nodiscard]] auto indexOf(types::StringView name) const -> types::Option<types::usize>;

    template <Plugin P>
    [[nodiscard]] auto getState() const -> types::Option<const StateOf<P>*> {
      if (const detail::IPluginSlot* slot = findByTag(TypeTagOf<P>()))
        return static_cast<const StateOf<P>*>(slot->state());

      return types::None;
    }

    template <Plugin P>
    [[nodiscard]] auto getStateMut() -> types::Option<StateOf<P>*> {
      if (detail::IPluginSlot* slot = findByTag(TypeTagOf<P>()))
        return static_cast<StateOf<P>*>(slot->state());

      return types::None;
    }

    /**
     * @brief Look a plugin's state up by name, for code that cannot name the plugin type.
     *
     * Returns None when no plugin has that name or its state is not an S.
     */
    template <typename S>
    [[nodiscard]] auto getStateByName(const types::StringView name) const -> types::Option<const S*> {
      const detail::IPluginSlot* slot = findByName(name);

      if (!slot || slot->stateTag() != TypeTagOf<S>())
        return types::None;

      return static_cast<const S*>(slot->state());
    }

    template <typename S>
    [[nodiscard]] auto getStateByNameMut(const types::StringView name) -> types::Option<S*> {
      detail::IPluginSlot* slot = findByName(name);

      if (!slot || slot->stateTag() != TypeTagOf<S>())
        return types::None;

      return static_cast<S*>(slot->state());
    }

    /**
     * @brief A handle to the first installed plugin of type P.
     */
    template <Plugin P>
    [[nodiscard]] auto getHandle() const -> types::Option<PluginHandle<P>> {
      if (const detail::IPluginSlot* slot = findByTag(TypeTagOf<P>()))
        return PluginHandle<P>(slot->index(), m_fanout);

      return types::None;
    }

    [[nodiscard]] auto fanout() const -> const types::SharedPointer<OutputFanout>& {
      return m_fanout;
    }

   private:
    [[nodiscard]] auto findByTag(TypeTag pluginTag) const -> const detail::IPluginSlot*;
    [[nodiscard]] auto findByTag(TypeTag pluginTag) -> detail::IPluginSlot*;
    [[nodiscard]] auto findByName(types::StringView name) const -> const detail::IPluginSlot*;
    [[nodiscard]] auto findByName(types::StringView name) -> detail::IPluginSlot*;

    types::Vec<types::UniquePointer<detail::IPluginSlot>> m_slots;
    types::SharedPointer<OutputFanout>                    m_fanout;
  };
} // namespace switchboard::core::plugin
