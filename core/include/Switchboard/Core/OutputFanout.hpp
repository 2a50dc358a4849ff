/**
 * @file OutputFanout.hpp
 * @brief Delivers each published plugin output to every live listener of its slot.
 */

#pragma once

#include "../Runtime/Channel.hpp"
#include "../Utils/Types.hpp"
#include "Envelope.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  using ListenerId = types::u64;

  /**
   * @brief Delivers plugin outputs to everyone listening on the producing slot.
   *
   * Shared between the PluginManager (which publishes) and every listener
   * subscription (which registers while its body runs). A listener never
   * unregisters explicitly: it drops its receiver, and the next publish for
   * that slot notices the failed send and forgets the registration.
   */
  class OutputFanout {
   public:
    OutputFanout() = default;

    OutputFanout(const OutputFanout&)                    = delete;
    OutputFanout(OutputFanout&&)                         = delete;
    auto operator=(const OutputFanout&) -> OutputFanout& = delete;
    auto operator=(OutputFanout&&) -> OutputFanout&      = delete;

    ~OutputFanout() = default;

    /**
     * @brief Register a new listener for outputs of slot @p pluginIndex.
     * @return The listener id and the receiving end of its private channel.
     */
    auto subscribe(types::usize pluginIndex) -> types::Pair<ListenerId, runtime::Receiver<PluginOutput>>;

    /**
     * @brief Send a copy of @p output to every listener of its slot, pruning
     *        listeners whose receiver is gone.
     * @return Number of listeners that received the output.
     */
    auto publish(const PluginOutput& output) -> types::usize;

    [[nodiscard]] auto listenerCount(types::usize pluginIndex) const -> types::usize;

    [[nodiscard]] auto totalListeners() const -> types::usize;

   private:
    struct Registration {
      ListenerId                   id;
      runtime::Sender<PluginOutput> sender;
    };

    mutable types::Mutex                                   m_mutex;
    types::UnorderedMap<types::usize, types::Vec<Registration>> m_listeners;
    ListenerId                                             m_nextId = 0;
  };
} // namespace switchboard::core::plugin
