/**
 * @file PluginSlot.hpp
 * @brief Type-erased slot that owns one plugin and its state.
 */

#pragma once

#include "../Runtime/Subscription.hpp"
#include "../Runtime/Task.hpp"
#include "../Utils/Types.hpp"
#include "Envelope.hpp"
#include "Plugin.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Result of routing one envelope: follow-up work (already addressed to
   *        the same slot) and the output, if the plugin produced one.
   */
  struct RouteResult {
    runtime::Task<PluginMessage> task;
    types::Option<PluginOutput>  output;
  };

  /**
   * @brief Wraps plugin messages of type Msg into envelopes for slot @p index.
   */
  template <typename Msg>
  auto Addressed(const types::usize index) {
    return [index](Msg message) -> PluginMessage { return PluginMessage::make(index, std::move(message)); };
  }

  namespace detail {
    /**
     * @brief Identity salt for every recipe a slot contributes.
     */
    inline constexpr runtime::SubscriptionId SLOT_KEY = runtime::HashId("switchboard.slot");

    /**
     * @brief Type-erased view of one installed plugin.
     */
    class IPluginSlot {
     public:
      IPluginSlot()                                      = default;
      IPluginSlot(const IPluginSlot&)                    = delete;
      IPluginSlot(IPluginSlot&&)                         = delete;
      auto operator=(const IPluginSlot&) -> IPluginSlot& = delete;
      auto operator=(IPluginSlot&&) -> IPluginSlot&      = delete;
      virtual ~IPluginSlot()                             = default;

      [[nodiscard]] virtual auto index() const -> types::usize     = 0;
      [[nodiscard]] virtual auto name() const -> types::StringView = 0;
      [[nodiscard]] virtual auto pluginTag() const -> TypeTag      = 0;
      [[nodiscard]] virtual auto stateTag() const -> TypeTag       = 0;
      [[nodiscard]] virtual auto messageTag() const -> TypeTag     = 0;
      [[nodiscard]] virtual auto outputTag() const -> TypeTag      = 0;

      /**
       * @brief Apply @p envelope to the plugin state. Envelopes of another type are ignored.
       */
      virtual auto update(const PluginMessage& envelope) -> RouteResult = 0;

      [[nodiscard]] virtual auto subscription() const -> runtime::Subscription<PluginMessage> = 0;

      [[nodiscard]] virtual auto state() const -> const void* = 0;
      [[nodiscard]] virtual auto state() -> void*             = 0;
    };

    template <Plugin P>
    class PluginSlot final : public IPluginSlot {
     public:
      using Message = MessageOf<P>;
      using State   = StateOf<P>;
      using Output  = OutputOf<P>;

      PluginSlot(const types::usize index, P plugin, State state)
        : m_index(index), m_plugin(std::move(plugin)), m_state(std::move(state)) {}

      [[nodiscard]] auto index() const -> types::usize override {
        return m_index;
      }

      [[nodiscard]] auto name() const -> types::StringView override {
        return m_plugin.name();
      }

      [[nodiscard]] auto pluginTag() const -> TypeTag override {
        return TypeTagOf<P>();
      }

      [[nodiscard]] auto stateTag() const -> TypeTag override {
        return TypeTagOf<State>();
      }

      [[nodiscard]] auto messageTag() const -> TypeTag override {
        return TypeTagOf<Message>();
      }

      [[nodiscard]] auto outputTag() const -> TypeTag override {
        return TypeTagOf<Output>();
      }

      auto update(const PluginMessage& envelope) -> RouteResult override {
        const Message* message = envelope.get<Message>();

        if (!message)
          return {};

        UpdateResult<Message, Output> result = m_plugin.update(m_state, *message);

        RouteResult routed { .task = std::move(result.task).map(Addressed<Message>(m_index)), .output = types::None };

        if (result.output)
          routed.output = PluginOutput::make(m_index, std::move(*result.output));

        return routed;
      }

      [[nodiscard]] auto subscription() const -> runtime::Subscription<PluginMessage> override {
        return m_plugin.subscription(m_state)
          .map(Addressed<Message>(m_index))
          .keyed(runtime::HashCombine(SLOT_KEY, m_index));
      }

      [[nodiscard]] auto state() const -> const void* override {
        return &m_state;
      }

      [[nodiscard]] auto state() -> void* override {
        return &m_state;
      }

      [[nodiscard]] auto typedState() const -> const State& {
        return m_state;
      }

      [[nodiscard]] auto typedState() -> State& {
        return m_state;
      }

     private:
      types::usize m_index;
      P            m_plugin;
      State        m_state;
    };
  } // namespace detail
} // namespace switchboard::core::plugin
