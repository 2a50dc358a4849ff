/**
 * @file Subscription.hpp
 * @brief Long-lived event sources identified by a stable id.
 *
 * A Subscription is a set of recipes. Each recipe pairs an identity with a
 * body that keeps pushing messages into a sink until its stop token fires.
 * Subscriptions are rebuilt from state every tick; the SubscriptionTracker
 * compares identities to decide which bodies to start and which to stop, so
 * equal state must produce equal ids.
 */

#pragma once

#include <chrono>      // std::chrono::{steady_clock, milliseconds}
#include <concepts>    // std::invocable
#include <type_traits> // std::invoke_result_t
#include <typeinfo>    // typeid

#include "../Utils/Types.hpp"

namespace switchboard::core::runtime {
  namespace types = ::switchboard::utils::types;

  using SubscriptionId = types::u64;

  /**
   * @brief 64-bit FNV-1a hash, usable at compile time for well-known ids.
   */
  constexpr auto HashId(const types::StringView text) -> SubscriptionId {
    SubscriptionId hash = 0xcbf29ce484222325ULL;

    for (const char chr : text) {
      hash ^= static_cast<types::u8>(chr);
      hash *= 0x100000001b3ULL;
    }

    return hash;
  }

  constexpr auto HashCombine(const SubscriptionId seed, const types::u64 value) -> SubscriptionId {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
  }

  template <typename Msg>
  class Subscription {
   public:
    using Message = Msg;
    using Sink    = types::Fn<void(Msg)>;
    using Body    = types::Fn<void(const Sink&, types::StopToken)>;

    struct Recipe {
      SubscriptionId id;
      Body           body;
    };

    Subscription() = default;

    static auto none() -> Subscription {
      return {};
    }

    /**
     * @brief A single event source.
     * @param id   Stable identity; two recipes with the same id are the same source.
     * @param body Runs until the token is stopped (or it has nothing more to emit).
     */
    template <typename Callable>
      requires std::invocable<Callable&, const Sink&, types::StopToken>
    static auto run(const SubscriptionId id, Callable body) -> Subscription {
      Subscription subscription;
      subscription.m_recipes.push_back(Recipe { .id = id, .body = Body(std::move(body)) });
      return subscription;
    }

    static auto batch(types::Vec<Subscription> subscriptions) -> Subscription {
      Subscription merged;

      for (Subscription& subscription : subscriptions)
        for (Recipe& recipe : subscription.m_recipes)
          merged.m_recipes.push_back(std::move(recipe));

      return merged;
    }

    /**
     * @brief Transform every message.
     *
     * The mapper's type is folded into every identity, so the same source
     * mapped by two different callables yields two recipes. A given lambda
     * expression always has the same type, which keeps rebuilt ids stable.
     */
    template <typename Func>
      requires std::invocable<Func&, Msg>
    auto map(Func func) && -> Subscription<std::invoke_result_t<Func&, Msg>> {
      using Out = Subscription<std::invoke_result_t<Func&, Msg>>;

      Out mapped;
      mapped.m_recipes.reserve(m_recipes.size());

      for (Recipe& recipe : m_recipes)
        mapped.m_recipes.push_back(typename Out::Recipe {
          .id   = HashCombine(recipe.id, static_cast<types::u64>(typeid(Func).hash_code())),
          .body = [body = std::move(recipe.body), func](const typename Out::Sink& sink, types::StopToken token) mutable {
            body([&](Msg message) { sink(func(std::move(message))); }, token);
          },
        });

      m_recipes.clear();
      return mapped;
    }

    /**
     * @brief Fold @p key into every identity, so equal recipes coming from
     *        different owners stay distinct.
     */
    auto keyed(const types::u64 key) && -> Subscription {
      for (Recipe& recipe : m_recipes)
        recipe.id = HashCombine(recipe.id, key);

      return std::move(*this);
    }

    [[nodiscard]] auto recipes() const -> const types::Vec<Recipe>& {
      return m_recipes;
    }

    [[nodiscard]] auto isNone() const -> bool {
      return m_recipes.empty();
    }

    [[nodiscard]] auto size() const -> types::usize {
      return m_recipes.size();
    }

   private:
    template <typename>
    friend class Subscription;

    types::Vec<Recipe> m_recipes;
  };

  /**
   * @brief Emits the current time every @p period until stopped.
   *
   * Ticks are scheduled on a fixed grid (start + n * period), so a slow
   * consumer does not make the timer drift. A tick that would land in the
   * past is skipped, so a stalled sink gets one tick, not a burst.
   */
  inline auto Every(const std::chrono::milliseconds period) -> Subscription<std::chrono::steady_clock::time_point> {
    using Clock = std::chrono::steady_clock;
    using Sub   = Subscription<Clock::time_point>;

    return Sub::run(
      HashCombine(HashId("switchboard.every"), static_cast<types::u64>(period.count())),
      [period](const Sub::Sink& sink, const types::StopToken& token) {
        types::Mutex   mutex;
        types::CondVar wake;

        Clock::time_point next = Clock::now() + period;

        while (!token.stop_requested()) {
          {
            types::UniqueLock lock(mutex);
            wake.wait_until(lock, token, next, [] { return false; });
          }

          if (token.stop_requested())
            return;

          sink(Clock::now());
          next += period;

          // Deadlines missed while the sink was busy are dropped, not replayed.
          for (const Clock::time_point now = Clock::now(); next <= now;)
            next += period;
        }
      }
    );
  }
} // namespace switchboard::core::runtime
