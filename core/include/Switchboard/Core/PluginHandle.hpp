/**
 * @file PluginHandle.hpp
 * @brief Typed access to an installed plugin: wrap messages and listen to outputs.
 */

#pragma once

#include <cstdint> // std::uintptr_t

#include "../Runtime/Subscription.hpp"
#include "../Runtime/Task.hpp"
#include "../Utils/Types.hpp"
#include "Envelope.hpp"
#include "OutputFanout.hpp"
#include "Plugin.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Typed access to one installed plugin, for code that does not own the registry.
   *
   * Holds only the slot index and the shared OutputFanout, so it is cheap to
   * copy into views, tasks and other plugins.
   */
  template <Plugin P>
  class PluginHandle {
   public:
    using Message = MessageOf<P>;
    using Output  = OutputOf<P>;

    PluginHandle(const types::usize index, types::SharedPointer<OutputFanout> fanout)
      : m_index(index), m_fanout(std::move(fanout)) {}

    [[nodiscard]] auto index() const -> types::usize {
      return m_index;
    }

    /**
     * @brief Address @p message to this plugin without scheduling anything.
     */
    [[nodiscard]] auto message(Message message) const -> PluginMessage {
      return PluginMessage::make(m_index, std::move(message));
    }

    /**
     * @brief A task that delivers @p message to this plugin on the next update.
     */
    [[nodiscard]] auto dispatch(Message message) const -> runtime::Task<PluginMessage> {
      return runtime::Task<PluginMessage>::done(this->message(std::move(message)));
    }

    /**
     * @brief Every output this plugin produces from the moment the subscription starts.
     */
    [[nodiscard]] auto listen() const -> runtime::Subscription<Output> {
      return makeListener<Output>(listenerId(), [](const Output& output) -> types::Option<Output> { return output; });
    }

    /**
     * @brief Filter and map this plugin's outputs.
     *
     * @p filter must be a plain function (or captureless lambda converted to
     * one); its address is part of the subscription identity, so rebuilding the
     * subscription each tick keeps the same listener running.
     */
    template <typename R>
    [[nodiscard]] auto listenWith(types::Option<R> (*filter)(const Output&)) const -> runtime::Subscription<R> {
      return makeListener<R>(
        runtime::HashCombine(listenerId(), static_cast<types::u64>(reinterpret_cast<std::uintptr_t>(filter))),
        types::Fn<types::Option<R>(const Output&)>(filter)
      );
    }

    /**
     * @brief Filter and map with an arbitrary callable.
     *
     * @p key stands in for the callable's identity: pass the same key whenever
     * the callable does the same thing.
     */
    template <typename R>
    [[nodiscard]] auto listenWith(const types::u64 key, types::Fn<types::Option<R>(const Output&)> filter) const -> runtime::Subscription<R> {
      return makeListener<R>(runtime::HashCombine(listenerId(), key), std::move(filter));
    }

    auto operator==(const PluginHandle& other) const -> bool {
      return m_index == other.m_index && m_fanout == other.m_fanout;
    }

   private:
    static constexpr runtime::SubscriptionId LISTEN_KEY = runtime::HashId("switchboard.listen");

    [[nodiscard]] auto listenerId() const -> runtime::SubscriptionId {
      const auto fanoutAddress = static_cast<types::u64>(reinterpret_cast<std::uintptr_t>(m_fanout.get()));
      return runtime::HashCombine(runtime::HashCombine(LISTEN_KEY, fanoutAddress), m_index);
    }

    template <typename R>
    [[nodiscard]] auto makeListener(const runtime::SubscriptionId id, types::Fn<types::Option<R>(const Output&)> filter) const
      -> runtime::Subscription<R> {
      using Sub = runtime::Subscription<R>;

      return Sub::run(
        id,
        [fanout = m_fanout, index = m_index, filter = std::move(filter)](const typename Sub::Sink& sink, const types::StopToken& token) {
          runtime::Receiver<PluginOutput> receiver = fanout->subscribe(index).second;

          while (types::Option<PluginOutput> envelope = receiver.recv(token)) {
            const Output* output = envelope->template get<Output>();

            if (!output)
              continue;

            if (types::Option<R> mapped = filter(*output))
              sink(std::move(*mapped));
          }
        }
      );
    }

    types::usize                       m_index;
    types::SharedPointer<OutputFanout> m_fanout;
  };
} // namespace switchboard::core::plugin
