/**
 * @file PluginManager.cpp
 * @brief Slot installation, envelope routing and output publishing for the plugin registry.
 */

#include <Switchboard/Core/PluginManager.hpp>

#include <Switchboard/Utils/Logging.hpp>

namespace switchboard::core::plugin {
  using namespace utils::types;

  PluginManager::PluginManager()
    : m_fanout(std::make_shared<OutputFanout>()) {}

  PluginManager::PluginManager(SharedPointer<OutputFanout> fanout)
    : m_fanout(fanout ? std::move(fanout) : std::make_shared<OutputFanout>()) {}

  auto PluginManager::route(const PluginMessage& envelope) -> RouteResult {
    const usize index = envelope.pluginIndex();

    if (index >= m_slots.size()) {
      debug_log("Dropping message for slot {}: only {} plugin(s) installed", index, m_slots.size());
      return {};
    }

    detail::IPluginSlot& slot = *m_slots[index];

    if (envelope.typeTag() != slot.messageTag()) {
      debug_log_fields(
        { field(slot, index), field(expected, slot.messageTag().name()), field(received, envelope.typeTag().name()) },
        "Dropping message for '{}': type mismatch",
        slot.name()
      );
      return {};
    }

    trace_log("Routing message to '{}' (slot {})", slot.name(), index);

    return slot.update(envelope);
  }

  auto PluginManager::update(const PluginMessage& envelope) -> runtime::Task<PluginMessage> {
    auto [task, output] = route(envelope);

    if (output) {
      const usize delivered = m_fanout->publish(*output);
      trace_log("Published output of slot {} to {} listener(s)", output->pluginIndex(), delivered);
    }

    return std::move(task);
  }

  auto PluginManager::subscriptions() const -> runtime::Subscription<PluginMessage> {
    Vec<runtime::Subscription<PluginMessage>> parts;
    parts.reserve(m_slots.size());

    for (const auto& slot : m_slots)
      parts.push_back(slot->subscription());

    return runtime::Subscription<PluginMessage>::batch(std::move(parts));
  }

  auto PluginManager::pluginNames() const -> Vec<StringView> {
    Vec<StringView> names;
    names.reserve(m_slots.size());

    for (const auto& slot : m_slots)
      names.push_back(slot->name());

    return names;
  }

  auto PluginManager::indexOf(const StringView name) const -> Option<usize> {
    if (const detail::IPluginSlot* slot = findByName(name))
      return slot->index();

    return None;
  }

  auto PluginManager::findByTag(const TypeTag pluginTag) const -> const detail::IPluginSlot* {
    for (const auto& slot : m_slots)
      if (slot->pluginTag() == pluginTag)
        return slot.get();

    return nullptr;
  }

  auto PluginManager::findByTag(const TypeTag pluginTag) -> detail::IPluginSlot* {
    return const_cast<detail::IPluginSlot*>(std::as_const(*this).findByTag(pluginTag));
  }

  auto PluginManager::findByName(const StringView name) const -> const detail::IPluginSlot* {
    for (const auto& slot : m_slots)
      if (slot->name() == name)
        return slot.get();

    return nullptr;
  }

  auto PluginManager::findByName(const StringView name) -> detail::IPluginSlot* {
    return const_cast<detail::IPluginSlot*>(std::as_const(*this).findByName(name));
  }
} // namespace switchboard::core::plugin
