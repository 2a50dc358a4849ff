#pragma once

#include <thread> // std::jthread

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Channel.hpp"
#include "Subscription.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  struct TrackerDiff {
    types::usize started = 0;
    types::usize stopped = 0;
  };

  /**
   * @brief Keeps the running subscription bodies in sync with the latest recipe set.
   *
   * Each body runs on its own thread and forwards its messages into the sender
   * given at construction. update() starts bodies whose id is new, stops and
   * joins bodies whose id disappeared, and leaves everything else running.
   */
  template <typename Msg>
  class SubscriptionTracker {
   public:
    explicit SubscriptionTracker(Sender<Msg> output)
      : m_output(std::move(output)) {}

    ~SubscriptionTracker() {
      clear();
    }

    SubscriptionTracker(const SubscriptionTracker&)                    = delete;
    SubscriptionTracker(SubscriptionTracker&&)                         = delete;
    auto operator=(const SubscriptionTracker&) -> SubscriptionTracker& = delete;
    auto operator=(SubscriptionTracker&&) -> SubscriptionTracker&      = delete;

    auto update(const Subscription<Msg>& subscription) -> TrackerDiff {
      TrackerDiff diff;

      types::UnorderedMap<SubscriptionId, const typename Subscription<Msg>::Recipe*> wanted;
      for (const auto& recipe : subscription.recipes())
        if (!wanted.try_emplace(recipe.id, &recipe).second)
          trace_log("Ignoring duplicate subscription id {:#x}", recipe.id);

      types::Vec<SubscriptionId> retired;
      for (auto& [id, worker] : m_running)
        if (!wanted.contains(id)) {
          worker.request_stop();
          retired.push_back(id);
        }

      // Destroying a jthread joins it; all stops were requested above so they wind down together.
      for (const SubscriptionId id : retired)
        m_running.erase(id);

      diff.stopped = retired.size();

      for (const auto& [id, recipe] : wanted) {
        if (m_running.contains(id))
          continue;

        m_running.emplace(id, std::jthread(Runner { .body = recipe->body, .output = m_output, .id = id }));
        ++diff.started;
      }

      if (diff.started != 0 || diff.stopped != 0)
        debug_log("Subscriptions: {} started, {} stopped, {} running", diff.started, diff.stopped, m_running.size());

      return diff;
    }

    [[nodiscard]] auto active() const -> types::usize {
      return m_running.size();
    }

    [[nodiscard]] auto isActive(const SubscriptionId id) const -> bool {
      return m_running.contains(id);
    }

    /**
     * @brief Stop and join every running body.
     */
    auto clear() -> void {
      for (auto& [id, worker] : m_running)
        worker.request_stop();

      m_running.clear();
    }

   private:
    struct Runner {
      typename Subscription<Msg>::Body body;
      Sender<Msg>                      output;
      SubscriptionId                   id;

      auto operator()(const types::StopToken& token) const -> void {
        try {
          body([this](Msg message) { output.send(std::move(message)); }, token);
        } catch (const types::Exception& e) {
          error_log("Subscription {:#x} threw: {}", id, e.what());
          throw;
        }
      }
    };

    Sender<Msg>                                       m_output;
    types::UnorderedMap<SubscriptionId, std::jthread> m_running;
  };
} // namespace switchboard::core::runtime
