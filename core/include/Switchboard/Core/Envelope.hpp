/**
 * @file Envelope.hpp
 * @brief Type-erased messages and outputs addressed to a plugin slot.
 *
 * The host's message type has to carry traffic for every installed plugin
 * without naming any of their types. An envelope does that: it pairs the slot
 * index with an immutable, reference-counted payload and the payload's type
 * tag. The tag is checked before every cast back to the concrete type.
 */

#pragma once

#include <type_traits> // std::decay_t
#include <typeindex>   // std::type_index
#include <typeinfo>    // typeid

#include "../Utils/Types.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  using TypeTag = std::type_index;

  template <typename T>
  auto TypeTagOf() -> TypeTag {
    return TypeTag(typeid(T));
  }

  namespace detail {
    /**
     * @brief Storage shared by PluginMessage and PluginOutput.
     */
    class ErasedPayload {
     public:
      template <typename T>
      static auto make(const types::usize slot, T&& value) -> ErasedPayload {
        using Value = std::decay_t<T>;
        return ErasedPayload(slot, TypeTagOf<Value>(), std::make_shared<const Value>(std::forward<T>(value)));
      }

      [[nodiscard]] auto slot() const -> types::usize {
        return m_slot;
      }

      [[nodiscard]] auto tag() const -> TypeTag {
        return m_tag;
      }

      template <typename T>
      [[nodiscard]] auto holds() const -> bool {
        return m_tag == TypeTagOf<T>();
      }

      /**
       * @brief The payload as T, or nullptr when the tag does not match.
       */
      template <typename T>
      [[nodiscard]] auto get() const -> const T* {
        return holds<T>() ? static_cast<const T*>(m_payload.get()) : nullptr;
      }

      [[nodiscard]] auto useCount() const -> long {
        return m_payload.use_count();
      }

     private:
      ErasedPayload(const types::usize slot, const TypeTag tag, types::SharedPointer<const void> payload)
        : m_slot(slot), m_tag(tag), m_payload(std::move(payload)) {}

      types::usize                     m_slot;
      TypeTag                          m_tag;
      types::SharedPointer<const void> m_payload;
    };
  } // namespace detail

  /**
   * @brief Inbound envelope: a plugin message on its way to slot pluginIndex().
   */
  class PluginMessage {
   public:
    template <typename T>
    static auto make(const types::usize pluginIndex, T&& message) -> PluginMessage {
      return PluginMessage(detail::ErasedPayload::make(pluginIndex, std::forward<T>(message)));
    }

    [[nodiscard]] auto pluginIndex() const -> types::usize {
      return m_payload.slot();
    }

    [[nodiscard]] auto typeTag() const -> TypeTag {
      return m_payload.tag();
    }

    template <typename T>
    [[nodiscard]] auto holds() const -> bool {
      return m_payload.holds<T>();
    }

    template <typename T>
    [[nodiscard]] auto get() const -> const T* {
      return m_payload.get<T>();
    }

   private:
    explicit PluginMessage(detail::ErasedPayload payload)
      : m_payload(std::move(payload)) {}

    detail::ErasedPayload m_payload;
  };

  /**
   * @brief Outbound envelope: something slot pluginIndex() reported to the outside.
   *
   * Copies share the payload, which is never mutated, so handing one copy to
   * each listener is cheap and safe across threads.
   */
  class PluginOutput {
   public:
    template <typename T>
    static auto make(const types::usize pluginIndex, T&& output) -> PluginOutput {
      return PluginOutput(detail::ErasedPayload::make(pluginIndex, std::forward<T>(output)));
    }

    [[nodiscard]] auto pluginIndex() const -> types::usize {
      return m_payload.slot();
    }

    [[nodiscard]] auto typeTag() const -> TypeTag {
      return m_payload.tag();
    }

    template <typename T>
    [[nodiscard]] auto holds() const -> bool {
      return m_payload.holds<T>();
    }

    template <typename T>
    [[nodiscard]] auto get() const -> const T* {
      return m_payload.get<T>();
    }

    [[nodiscard]] auto shareCount() const -> long {
      return m_payload.useCount();
    }

   private:
    explicit PluginOutput(detail::ErasedPayload payload)
      : m_payload(std::move(payload)) {}

    detail::ErasedPayload m_payload;
  };
} // namespace switchboard::core::plugin
