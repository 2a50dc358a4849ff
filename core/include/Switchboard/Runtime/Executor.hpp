#pragma once

#include <thread> // std::jthread

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Fixed-size worker pool that runs task actions.
   *
   * Jobs are executed in FIFO order by whichever worker is free. Every job gets
   * the pool's stop token; shutdown() fires it, discards jobs that have not
   * started and joins the workers.
   */
  class Executor {
   public:
    using Job = types::Fn<void(types::StopToken)>;

    explicit Executor(types::usize workerCount = 2);
    ~Executor();

    Executor(const Executor&)                    = delete;
    Executor(Executor&&)                         = delete;
    auto operator=(const Executor&) -> Executor& = delete;
    auto operator=(Executor&&) -> Executor&      = delete;

    /**
     * @brief Queue a job.
     * @return Shutdown error if the pool has already been stopped.
     */
    auto enqueue(Job job) -> types::Result<>;

    [[nodiscard]] auto size() const -> types::usize {
      return m_workers.size();
    }

    [[nodiscard]] auto pending() const -> types::usize;

    [[nodiscard]] auto isStopped() const -> bool;

    auto shutdown() -> void;

   private:
    auto workerLoop(types::usize workerIndex) -> void;

    mutable types::Mutex     m_mutex;
    types::CondVar           m_wake;
    types::Deque<Job>        m_jobs;
    types::StopSource        m_stop;
    bool                     m_stopped = false;
    types::Vec<std::jthread> m_workers;
  };
} // namespace switchboard::core::runtime
