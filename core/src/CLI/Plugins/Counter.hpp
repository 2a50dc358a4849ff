#pragma once

#include <matchit.hpp> // matchit::impl::Overload
#include <variant>     // std::variant, std::visit

#include <Switchboard/Core/Plugin.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace switchboard::plugins {
  namespace counter {
    struct Increment {};
    struct Decrement {};

    struct Set {
      utils::types::i64 value;
    };
  } // namespace counter

  using CounterMessage = std::variant<counter::Increment, counter::Decrement, counter::Set>;

  struct CounterState {
    utils::types::i64 value = 0;
  };

  struct CounterChanged {
    utils::types::i64 value;
  };

  /**
   * @brief A single integer that other parts of the app can bump or overwrite.
   */
  class CounterPlugin {
   public:
    using Message = CounterMessage;
    using State   = CounterState;
    using Output  = CounterChanged;

    [[nodiscard]] auto name() const -> utils::types::StringView {
      return "counter";
    }

    [[nodiscard]] auto init() const -> utils::types::Pair<State, core::runtime::Task<Message>> {
      return { State {}, core::runtime::Task<Message>::none() };
    }

    auto update(State& state, Message message) const -> core::plugin::UpdateResult<Message, Output> {
      std::visit(
        matchit::impl::Overload {
          [&](const counter::Increment&) -> void { ++state.value; },
          [&](const counter::Decrement&) -> void { --state.value; },
          [&](const counter::Set& set) -> void { state.value = set.value; },
        },
        message
      );

      return core::plugin::UpdateResult<Message, Output>::withOutput(CounterChanged { .value = state.value });
    }

    [[nodiscard]] auto subscription(const State& /*state*/) const -> core::runtime::Subscription<Message> {
      return core::runtime::Subscription<Message>::none();
    }
  };
} // namespace switchboard::plugins
