/**
 * @file Types.hpp
 * @brief Type aliases shared across Switchboard.
 *
 * Short, Rust-flavoured names for the standard library (and ankerl) types the
 * runtime passes around. Everything in the project spells its types through
 * this header so the public API reads the same everywhere.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <condition_variable>       // std::condition_variable_any (CondVar)
#include <cstdint>                  // std::uint*_t, std::int*_t
#include <deque>                    // std::deque (Deque)
#include <expected>                 // std::expected (Result)
#include <functional>               // std::function, std::move_only_function (Fn, MoveFn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::shared_ptr, std::unique_ptr (SharedPointer, UniquePointer)
#include <mutex>                    // std::mutex, std::lock_guard, std::unique_lock (Mutex, LockGuard, UniqueLock)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <stop_token>               // std::stop_token, std::stop_source (StopToken, StopSource)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace switchboard::utils {
  // Forward decl for Result and Err
  namespace error {
    struct SwbError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
    using u16 = std::uint16_t; ///< 16-bit unsigned integer.
    using u32 = std::uint32_t; ///< 32-bit unsigned integer.
    using u64 = std::uint64_t; ///< 64-bit unsigned integer.

    using i8  = std::int8_t;  ///< 8-bit signed integer.
    using i16 = std::int16_t; ///< 16-bit signed integer.
    using i32 = std::int32_t; ///< 32-bit signed integer.
    using i64 = std::int64_t; ///< 64-bit signed integer.

    using f32 = float;  ///< 32-bit floating-point number.
    using f64 = double; ///< 64-bit floating-point number.

    using usize = std::size_t;    ///< Unsigned size type (result of sizeof).
    using isize = std::ptrdiff_t; ///< Signed size type (result of pointer subtraction).

    /**
     * @brief Alias for std::string.
     *
     * Owning, mutable string.
     */
    using String = std::string;

    /**
     * @brief Alias for std::string_view.
     *
     * Non-owning view of a string.
     */
    using StringView = std::string_view;

    using PCStr = const char*; ///< Pointer to a null-terminated C-style string.

    /**
     * @brief Alias for void.
     *
     * Represents a unit type, mostly used as `Result<Unit>`.
     */
    using Unit = void;

    using Exception = std::exception; ///< Standard exception type.

    using Mutex      = std::mutex;                   ///< Mutex type for synchronization.
    using LockGuard  = std::lock_guard<Mutex>;       ///< RAII-style lock guard for mutexes.
    using UniqueLock = std::unique_lock<Mutex>;      ///< Movable lock, required by condition variables.
    using CondVar    = std::condition_variable_any;  ///< Condition variable that understands stop tokens.
    using StopToken  = std::stop_token;              ///< Cooperative cancellation token.
    using StopSource = std::stop_source;             ///< Owner side of a StopToken.

    /**
     * @brief Alias for std::optional<Tp>.
     *
     * Represents a value that may or may not be present.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Alias for std::nullopt_t.
     *
     * Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Helper function to create an Option with a value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap in an Option.
     * @return An Option containing the value.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_cvref_t<Tp>> {
      return std::make_optional<std::remove_cvref_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp>
    using Deque = std::deque<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Alias for std::map<Key, Val> with transparent comparison.
     *
     * Ordered map; lookups accept any type comparable with Key (e.g. StringView for String keys).
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Alias for ankerl::unordered_dense::map<Key, Val>.
     *
     * High-performance unordered map using Robin Hood hashing. Used for the
     * hot lookup tables (listener registrations, running subscriptions).
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp>
    using SharedPointer = std::shared_ptr<Tp>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @brief Alias for std::function<Sig>.
     *
     * Copyable callable. Effects and subscription bodies are built from these so
     * they can be cloned into several workers.
     */
    template <typename Sig>
    using Fn = std::function<Sig>;

    /**
     * @brief Alias for std::move_only_function<Sig>.
     *
     * Callable that may own move-only captures (e.g. a plugin waiting to be installed).
     */
    template <typename Sig>
    using MoveFn = std::move_only_function<Sig>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     */
    template <typename Tp = Unit, typename Er = error::SwbError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     */
    template <typename Er = error::SwbError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace switchboard::utils
