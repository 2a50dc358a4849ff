/**
 * @file Runtime.hpp
 * @brief The plumbing behind a host event loop.
 *
 * Runtime owns the host inbox, an Executor for task actions and a
 * SubscriptionTracker for event sources. The host loop is:
 *
 * @code
 *   Runtime<AppMessage> runtime(config);
 *   runtime.spawn(std::move(startup));
 *
 *   while (running) {
 *     runtime.track(app.subscription());
 *     if (Option<AppMessage> message = runtime.next(tick))
 *       runtime.spawn(app.update(std::move(*message)));
 *   }
 * @endcode
 */

#pragma once

#include <chrono> // std::chrono::duration

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Channel.hpp"
#include "Executor.hpp"
#include "RuntimeConfig.hpp"
#include "Subscription.hpp"
#include "SubscriptionTracker.hpp"
#include "Task.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  template <typename Msg>
  class Runtime {
   public:
    explicit Runtime(const RuntimeConfig& config = {})
      : Runtime(MakeChannel<Msg>(), config) {}

    Runtime(const Runtime&)                    = delete;
    Runtime(Runtime&&)                         = delete;
    auto operator=(const Runtime&) -> Runtime& = delete;
    auto operator=(Runtime&&) -> Runtime&      = delete;

    ~Runtime() = default;

    /**
     * @brief Schedule every action of @p task on the executor.
     * @return Number of actions queued.
     */
    auto spawn(Task<Msg> task) -> types::usize {
      types::usize queued = 0;

      for (auto& action : std::move(task).actions()) {
        types::Result<> result = m_executor.enqueue(
          [action = std::move(action), sink = m_sender](const types::StopToken& token) {
            action([&sink](Msg message) { sink.send(std::move(message)); }, token);
          }
        );

        if (!result) {
          warn_at(result.error());
          break;
        }

        ++queued;
      }

      return queued;
    }

    auto track(const Subscription<Msg>& subscription) -> TrackerDiff {
      return m_tracker.update(subscription);
    }

    /**
     * @brief Wait up to @p timeout for the next message.
     */
    template <typename Rep, typename Period>
    auto next(const std::chrono::duration<Rep, Period>& timeout) -> types::Option<Msg> {
      return m_inbox.recvFor(timeout);
    }

    auto tryNext() -> types::Option<Msg> {
      return m_inbox.tryRecv();
    }

    /**
     * @brief A sender into the inbox, for events that originate outside tasks and
     *        subscriptions (signals, user input).
     */
    [[nodiscard]] auto sender() const -> Sender<Msg> {
      return m_sender;
    }

    [[nodiscard]] auto pendingMessages() const -> types::usize {
      return m_inbox.pending();
    }

    [[nodiscard]] auto activeSubscriptions() const -> types::usize {
      return m_tracker.active();
    }

    [[nodiscard]] auto executor() -> Executor& {
      return m_executor;
    }

   private:
    Runtime(types::Pair<Sender<Msg>, Receiver<Msg>> channel, const RuntimeConfig& config)
      : m_inbox(std::move(channel.second)),
        m_sender(std::move(channel.first)),
        m_executor(config.workerThreads),
        m_tracker(m_sender) {}

    // Destroyed bottom-up: subscriptions stop first, then in-flight actions.
    Receiver<Msg>            m_inbox;
    Sender<Msg>              m_sender;
    Executor                 m_executor;
    SubscriptionTracker<Msg> m_tracker;
  };
} // namespace switchboard::core::runtime
