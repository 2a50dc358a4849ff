/**
 * @file Task.hpp
 * @brief Deferred, possibly asynchronous work that yields messages.
 *
 * A Task is a list of actions. An action receives a sink and a stop token and
 * may push any number of messages into the sink before returning. Tasks are
 * plain values: building one performs no work, the host decides where the
 * actions run (Runtime hands them to the Executor, tests call collect()).
 */

#pragma once

#include <concepts>    // std::invocable
#include <type_traits> // std::invoke_result_t

#include "../Utils/Types.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Cancels an abortable Task. Copies share the same cancellation state.
   */
  class AbortHandle {
   public:
    AbortHandle() = default;

    explicit AbortHandle(types::StopSource source)
      : m_source(std::move(source)) {}

    auto abort() const -> void {
      types::StopSource(m_source).request_stop();
    }

    [[nodiscard]] auto isAborted() const -> bool {
      return m_source.stop_requested();
    }

   private:
    types::StopSource m_source;
  };

  template <typename Msg>
  class Task {
   public:
    using Message = Msg;
    using Sink    = types::Fn<void(Msg)>;
    using Action  = types::Fn<void(const Sink&, types::StopToken)>;

    Task() = default;

    static auto none() -> Task {
      return {};
    }

    /**
     * @brief A task that immediately yields @p message.
     */
    static auto done(Msg message) -> Task {
      return fromAction([message = std::move(message)](const Sink& sink, types::StopToken) { sink(message); });
    }

    /**
     * @brief Run @p work off the host thread and turn its result into a message.
     *
     * The message is dropped if the task is stopped while @p work runs.
     */
    template <typename Work, typename ToMessage>
      requires std::invocable<Work&> && std::invocable<ToMessage&, std::invoke_result_t<Work&>>
    static auto perform(Work work, ToMessage toMessage) -> Task {
      return fromAction(
        [work = std::move(work), toMessage = std::move(toMessage)](const Sink& sink, types::StopToken token) mutable {
          auto result = work();

          if (!token.stop_requested())
            sink(toMessage(std::move(result)));
        }
      );
    }

    /**
     * @brief A task that emits a stream of messages, e.g. progress reports.
     *
     * @p producer is called with the sink and stop token and should return once
     * it is done or the token is stopped.
     */
    template <typename Producer>
      requires std::invocable<Producer&, const Sink&, types::StopToken>
    static auto stream(Producer producer) -> Task {
      return fromAction(std::move(producer));
    }

    /**
     * @brief Run several tasks concurrently.
     */
    static auto batch(types::Vec<Task> tasks) -> Task {
      Task merged;

      for (Task& task : tasks)
        for (Action& action : task.m_actions)
          merged.m_actions.push_back(std::move(action));

      return merged;
    }

    /**
     * @brief Transform every message this task will produce.
     */
    template <typename Func>
      requires std::invocable<Func&, Msg>
    auto map(Func func) && -> Task<std::invoke_result_t<Func&, Msg>> {
      using Mapped = std::invoke_result_t<Func&, Msg>;
      using Out    = Task<Mapped>;

      Out mapped;
      mapped.m_actions.reserve(m_actions.size());

      for (Action& action : m_actions)
        mapped.m_actions.emplace_back(
          [action = std::move(action), func](const typename Out::Sink& sink, types::StopToken token) mutable {
            action([&](Msg message) { sink(func(std::move(message))); }, token);
          }
        );

      m_actions.clear();
      return mapped;
    }

    /**
     * @brief Make the task cancellable.
     *
     * After AbortHandle::abort() the actions see a stopped token and any message
     * they still try to emit is discarded.
     */
    auto abortable() && -> types::Pair<Task, AbortHandle> {
      types::StopSource source;
      Task              wrapped;

      for (Action& action : m_actions)
        wrapped.m_actions.emplace_back(
          [action = std::move(action), source](const Sink& sink, types::StopToken outer) {
            const types::StopToken token = source.get_token();

            if (token.stop_requested())
              return;

            const std::stop_callback relay(outer, [source]() { types::StopSource(source).request_stop(); });

            action(
              [&](Msg message) {
                if (!token.stop_requested())
                  sink(std::move(message));
              },
              token
            );
          }
        );

      m_actions.clear();
      return { std::move(wrapped), AbortHandle(source) };
    }

    [[nodiscard]] auto isNone() const -> bool {
      return m_actions.empty();
    }

    [[nodiscard]] auto size() const -> types::usize {
      return m_actions.size();
    }

    /**
     * @brief Hand the actions over to whoever runs them.
     */
    auto actions() && -> types::Vec<Action> {
      return std::move(m_actions);
    }

    /**
     * @brief Run every action to completion on the calling thread and gather
     *        what they emit, in order.
     */
    auto collect() && -> types::Vec<Msg> {
      types::Vec<Msg> messages;
      const Sink      sink = [&messages](Msg message) { messages.push_back(std::move(message)); };

      for (Action& action : m_actions)
        action(sink, types::StopToken {});

      m_actions.clear();
      return messages;
    }

   private:
    template <typename>
    friend class Task;

    template <typename Callable>
    static auto fromAction(Callable&& action) -> Task {
      Task task;
      task.m_actions.emplace_back(std::forward<Callable>(action));
      return task;
    }

    types::Vec<Action> m_actions;
  };
} // namespace switchboard::core::runtime
