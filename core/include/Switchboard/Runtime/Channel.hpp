/**
 * @file Channel.hpp
 * @brief Unbounded multi-producer, single-consumer channel.
 *
 * The only way work running off the host thread talks back to it: task
 * actions and subscription bodies hold a Sender, the host (or a listener body)
 * owns the Receiver. Dropping the Receiver closes the channel, after which
 * every send reports failure; OutputFanout relies on that to prune listeners.
 */

#pragma once

#include <chrono> // std::chrono::duration

#include "../Utils/Types.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  namespace detail {
    template <typename T>
    struct ChannelState {
      types::Mutex    mutex;
      types::CondVar  ready;
      types::Deque<T> queue;
      types::usize    senders       = 0;
      bool            receiverAlive = true;
    };
  } // namespace detail

  template <typename T>
  class Sender;

  template <typename T>
  class Receiver;

  template <typename T>
  auto MakeChannel() -> types::Pair<Sender<T>, Receiver<T>>;

  /**
   * @brief Sending half. Copyable; the channel stays open for the receiver while
   *        at least one copy exists.
   */
  template <typename T>
  class Sender {
   public:
    Sender() = default;

    Sender(const Sender& other)
      : m_state(other.m_state) {
      attach();
    }

    Sender(Sender&& other) noexcept
      : m_state(std::move(other.m_state)) {}

    auto operator=(const Sender& other) -> Sender& {
      if (this != &other) {
        detach();
        m_state = other.m_state;
        attach();
      }
      return *this;
    }

    auto operator=(Sender&& other) noexcept -> Sender& {
      if (this != &other) {
        detach();
        m_state = std::move(other.m_state);
      }
      return *this;
    }

    ~Sender() {
      detach();
    }

    /**
     * @brief Queue a value for the receiver.
     * @return false if the receiver has been dropped (the value is discarded).
     */
    auto send(T value) const -> bool {
      if (!m_state)
        return false;

      {
        const types::LockGuard lock(m_state->mutex);

        if (!m_state->receiverAlive)
          return false;

        m_state->queue.push_back(std::move(value));
      }

      m_state->ready.notify_one();
      return true;
    }

    [[nodiscard]] auto isClosed() const -> bool {
      if (!m_state)
        return true;

      const types::LockGuard lock(m_state->mutex);
      return !m_state->receiverAlive;
    }

   private:
    template <typename U>
    friend auto MakeChannel() -> types::Pair<Sender<U>, Receiver<U>>;

    explicit Sender(types::SharedPointer<detail::ChannelState<T>> state)
      : m_state(std::move(state)) {
      attach();
    }

    auto attach() -> void {
      if (!m_state)
        return;

      const types::LockGuard lock(m_state->mutex);
      ++m_state->senders;
    }

    auto detach() -> void {
      if (!m_state)
        return;

      bool last = false;
      {
        const types::LockGuard lock(m_state->mutex);
        last = --m_state->senders == 0;
      }

      if (last)
        m_state->ready.notify_all();

      m_state.reset();
    }

    types::SharedPointer<detail::ChannelState<T>> m_state;
  };

  /**
   * @brief Receiving half. Move-only; destroying it closes the channel.
   */
  template <typename T>
  class Receiver {
   public:
    Receiver() = default;

    Receiver(const Receiver&)                    = delete;
    auto operator=(const Receiver&) -> Receiver& = delete;

    Receiver(Receiver&& other) noexcept
      : m_state(std::move(other.m_state)) {}

    auto operator=(Receiver&& other) noexcept -> Receiver& {
      if (this != &other) {
        close();
        m_state = std::move(other.m_state);
      }
      return *this;
    }

    ~Receiver() {
      close();
    }

    /**
     * @brief Block until a value arrives.
     * @return None once every sender is gone and the queue is drained, or when
     *         @p token is stopped.
     */
    auto recv(types::StopToken token = {}) -> types::Option<T> {
      if (!m_state)
        return types::None;

      types::UniqueLock lock(m_state->mutex);
      m_state->ready.wait(lock, token, [this] { return !m_state->queue.empty() || m_state->senders == 0; });
      return popLocked();
    }

    /**
     * @brief Like recv(), but gives up after @p timeout.
     */
    template <typename Rep, typename Period>
    auto recvFor(const std::chrono::duration<Rep, Period>& timeout, types::StopToken token = {}) -> types::Option<T> {
      if (!m_state)
        return types::None;

      types::UniqueLock lock(m_state->mutex);
      m_state->ready.wait_for(lock, token, timeout, [this] { return !m_state->queue.empty() || m_state->senders == 0; });
      return popLocked();
    }

    auto tryRecv() -> types::Option<T> {
      if (!m_state)
        return types::None;

      const types::LockGuard lock(m_state->mutex);
      return popLocked();
    }

    [[nodiscard]] auto pending() const -> types::usize {
      if (!m_state)
        return 0;

      const types::LockGuard lock(m_state->mutex);
      return m_state->queue.size();
    }

    /**
     * @brief True once every sender has been dropped.
     */
    [[nodiscard]] auto isDisconnected() const -> bool {
      if (!m_state)
        return true;

      const types::LockGuard lock(m_state->mutex);
      return m_state->senders == 0;
    }

   private:
    template <typename U>
    friend auto MakeChannel() -> types::Pair<Sender<U>, Receiver<U>>;

    explicit Receiver(types::SharedPointer<detail::ChannelState<T>> state)
      : m_state(std::move(state)) {}

    auto popLocked() -> types::Option<T> {
      if (m_state->queue.empty())
        return types::None;

      T value = std::move(m_state->queue.front());
      m_state->queue.pop_front();
      return value;
    }

    auto close() -> void {
      if (!m_state)
        return;

      {
        const types::LockGuard lock(m_state->mutex);
        m_state->receiverAlive = false;
        m_state->queue.clear();
      }

      m_state.reset();
    }

    types::SharedPointer<detail::ChannelState<T>> m_state;
  };

  template <typename T>
  auto MakeChannel() -> types::Pair<Sender<T>, Receiver<T>> {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return { Sender<T>(state), Receiver<T>(state) };
  }
} // namespace switchboard::core::runtime
