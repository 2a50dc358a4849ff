/**
 * @file OutputFanout.cpp
 * @brief Per-slot listener lists for plugin outputs.
 */

#include <Switchboard/Core/OutputFanout.hpp>

#include <Switchboard/Utils/Logging.hpp>

namespace switchboard::core::plugin {
  using namespace utils::types;

  auto OutputFanout::subscribe(const usize pluginIndex) -> Pair<ListenerId, runtime::Receiver<PluginOutput>> {
    auto [sender, receiver] = runtime::MakeChannel<PluginOutput>();

    const LockGuard  lock(m_mutex);
    const ListenerId id = m_nextId++;

    m_listeners[pluginIndex].push_back(Registration { .id = id, .sender = std::move(sender) });

    trace_log_fields({ field(slot, pluginIndex), field(listener, id) }, "Listener registered");

    return { id, std::move(receiver) };
  }

  auto OutputFanout::publish(const PluginOutput& output) -> usize {
    const LockGuard lock(m_mutex);

    auto iter = m_listeners.find(output.pluginIndex());
    if (iter == m_listeners.end())
      return 0;

    Vec<Registration>& registrations = iter->second;

    usize delivered = 0;
    usize pruned    = 0;

    std::erase_if(registrations, [&](const Registration& registration) {
      if (registration.sender.send(output)) {
        ++delivered;
        return false;
      }

      trace_log_fields({ field(slot, output.pluginIndex()), field(listener, registration.id) }, "Pruning closed listener");
      ++pruned;
      return true;
    });

    if (registrations.empty())
      m_listeners.erase(iter);

    if (pruned != 0)
      debug_log("Pruned {} listener(s) of slot {}", pruned, output.pluginIndex());

    return delivered;
  }

  auto OutputFanout::listenerCount(const usize pluginIndex) const -> usize {
    const LockGuard lock(m_mutex);

    auto iter = m_listeners.find(pluginIndex);
    return iter == m_listeners.end() ? 0 : iter->second.size();
  }

  auto OutputFanout::totalListeners() const -> usize {
    const LockGuard lock(m_mutex);

    usize total = 0;
    for (const auto& [slot, registrations] : m_listeners)
      total += registrations.size();

    return total;
  }
} // namespace switchboard::core::plugin
