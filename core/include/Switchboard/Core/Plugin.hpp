/**
 * @file Plugin.hpp
 * @brief The contract every Switchboard plugin satisfies.
 *
 * A plugin is an ordinary type with three nested types and four const member
 * functions:
 *
 * @code
 *   struct CounterPlugin {
 *     using Message = CounterMessage;
 *     using State   = CounterState;
 *     using Output  = CounterChanged;
 *
 *     auto name() const -> StringView;
 *     auto init() const -> Pair<State, Task<Message>>;
 *     auto update(State& state, Message message) const -> UpdateResult<Message, Output>;
 *     auto subscription(const State& state) const -> Subscription<Message>;
 *   };
 * @endcode
 *
 * The plugin object itself holds configuration only; everything that changes
 * lives in State, which the PluginManager owns and mutates exclusively
 * through update().
 */

#pragma once

#include <concepts> // std::same_as, std::convertible_to, std::copy_constructible

#include "../Runtime/Subscription.hpp"
#include "../Runtime/Task.hpp"
#include "../Utils/Types.hpp"

namespace switchboard::core::plugin {
  namespace types = ::switchboard::utils::types;

  /**
   * @brief Output type for plugins that never report anything.
   */
  struct NoOutput {};

  /**
   * @brief What update() hands back: follow-up work and an optional output.
   */
  template <typename Msg, typename Out>
  struct UpdateResult {
    runtime::Task<Msg> task;
    types::Option<Out> output;

    static auto none() -> UpdateResult {
      return {};
    }

    static auto withTask(runtime::Task<Msg> task) -> UpdateResult {
      return { .task = std::move(task), .output = types::None };
    }

    static auto withOutput(Out output) -> UpdateResult {
      return { .task = {}, .output = std::move(output) };
    }
  };

  // clang-format off
  template <typename P>
  concept Plugin =
    std::move_constructible<P> &&
    requires {
      typename P::Message;
      typename P::State;
      typename P::Output;
    } &&
    std::copy_constructible<typename P::Message> &&
    std::copy_constructible<typename P::Output> &&
    std::move_constructible<typename P::State> &&
    requires(const P& plugin, typename P::State& state, const typename P::State& view, typename P::Message message) {
      { plugin.name() } -> std::convertible_to<types::StringView>;
      { plugin.init() } -> std::same_as<types::Pair<typename P::State, runtime::Task<typename P::Message>>>;
      { plugin.update(state, std::move(message)) } -> std::same_as<UpdateResult<typename P::Message, typename P::Output>>;
      { plugin.subscription(view) } -> std::same_as<runtime::Subscription<typename P::Message>>;
    };
  // clang-format on

  template <Plugin P>
  using MessageOf = typename P::Message;

  template <Plugin P>
  using StateOf = typename P::State;

  template <Plugin P>
  using OutputOf = typename P::Output;
} // namespace switchboard::core::plugin
