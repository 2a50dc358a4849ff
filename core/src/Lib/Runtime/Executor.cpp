/**
 * @file Executor.cpp
 * @brief Worker pool that runs task actions off the event loop.
 */

#include <Switchboard/Runtime/Executor.hpp>

#include <Switchboard/Utils/Logging.hpp>

namespace switchboard::core::runtime {
  using namespace utils::types;
  using enum utils::error::SwbErrorCode;

  Executor::Executor(const usize workerCount) {
    const usize count = workerCount == 0 ? 1 : workerCount;

    m_workers.reserve(count);
    for (usize i = 0; i < count; ++i)
      m_workers.emplace_back([this, i] { workerLoop(i); });

    debug_log("Executor started with {} worker(s)", count);
  }

  Executor::~Executor() {
    shutdown();
  }

  auto Executor::enqueue(Job job) -> Result<> {
    {
      const LockGuard lock(m_mutex);

      if (m_stopped)
        ERR(Shutdown, "Executor has been shut down");

      m_jobs.push_back(std::move(job));
    }

    m_wake.notify_one();
    return {};
  }

  auto Executor::pending() const -> usize {
    const LockGuard lock(m_mutex);
    return m_jobs.size();
  }

  auto Executor::isStopped() const -> bool {
    const LockGuard lock(m_mutex);
    return m_stopped;
  }

  auto Executor::shutdown() -> void {
    usize discarded = 0;

    {
      const LockGuard lock(m_mutex);

      if (m_stopped)
        return;

      m_stopped = true;
      discarded = m_jobs.size();
      m_jobs.clear();
    }

    m_stop.request_stop();
    m_wake.notify_all();

    for (std::jthread& worker : m_workers)
      if (worker.joinable())
        worker.join();

    debug_log("Executor shut down ({} queued job(s) discarded)", discarded);
  }

  auto Executor::workerLoop(const usize workerIndex) -> void {
    const StopToken token = m_stop.get_token();

    while (true) {
      Job job;

      {
        UniqueLock lock(m_mutex);
        m_wake.wait(lock, [this] { return m_stopped || !m_jobs.empty(); });

        if (m_stopped)
          return;

        job = std::move(m_jobs.front());
        m_jobs.pop_front();
      }

      try {
        job(token);
      } catch (const Exception& e) {
        error_log_fields({ field(worker, workerIndex) }, "Task action threw: {}", e.what());
        throw;
      }
    }
  }
} // namespace switchboard::core::runtime
