#pragma once

#include <chrono>      // std::chrono::milliseconds
#include <matchit.hpp> // matchit::impl::Overload
#include <variant>     // std::variant, std::visit

#include <Switchboard/Core/Plugin.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace switchboard::plugins {
  namespace timer {
    struct Tick {};
    struct Pause {};
    struct Resume {};
  } // namespace timer

  using TimerMessage = std::variant<timer::Tick, timer::Pause, timer::Resume>;

  struct TimerState {
    utils::types::u64 ticks   = 0;
    bool              running = true;
  };

  struct TimerTicked {
    utils::types::u64 ticks;
  };

  /**
   * @brief Counts ticks of a periodic timer. The timer only exists while the
   *        plugin is running; pausing removes it from the subscription.
   */
  class TimerPlugin {
   public:
    using Message = TimerMessage;
    using State   = TimerState;
    using Output  = TimerTicked;

    explicit TimerPlugin(const std::chrono::milliseconds period = std::chrono::seconds(1))
      : m_period(period) {}

    [[nodiscard]] auto name() const -> utils::types::StringView {
      return "timer";
    }

    [[nodiscard]] auto period() const -> std::chrono::milliseconds {
      return m_period;
    }

    [[nodiscard]] auto init() const -> utils::types::Pair<State, core::runtime::Task<Message>> {
      return { State {}, core::runtime::Task<Message>::none() };
    }

    auto update(State& state, Message message) const -> core::plugin::UpdateResult<Message, Output> {
      using Result = core::plugin::UpdateResult<Message, Output>;

      return std::visit(
        matchit::impl::Overload {
          [&](const timer::Tick&) -> Result {
            if (!state.running)
              return Result::none();

            ++state.ticks;
            return Result::withOutput(TimerTicked { .ticks = state.ticks });
          },
          [&](const timer::Pause&) -> Result {
            state.running = false;
            return Result::none();
          },
          [&](const timer::Resume&) -> Result {
            state.running = true;
            return Result::none();
          },
        },
        message
      );
    }

    [[nodiscard]] auto subscription(const State& state) const -> core::runtime::Subscription<Message> {
      if (!state.running)
        return core::runtime::Subscription<Message>::none();

      return core::runtime::Every(m_period).map([](std::chrono::steady_clock::time_point) -> Message { return timer::Tick {}; });
    }

   private:
    std::chrono::milliseconds m_period;
  };
} // namespace switchboard::plugins
