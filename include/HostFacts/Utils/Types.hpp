/**
 * @file Types.hpp
 * @brief Short type aliases used throughout hostfacts.
 *
 * Every alias maps one-to-one onto a standard library type; they exist so that
 * signatures across the library and the CLI stay compact and uniform.
 */

#pragma once

#include <array>       // std::array (Array)
#include <cstdint>     // fixed-width integers
#include <exception>   // std::exception (Exception)
#include <expected>    // std::expected (Result)
#include <functional>  // std::function (Fn)
#include <map>         // std::map (Map)
#include <memory>      // std::unique_ptr (UniquePointer)
#include <mutex>       // std::mutex, std::lock_guard (Mutex, LockGuard)
#include <optional>    // std::optional (Option)
#include <span>        // std::span (Span)
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <variant>     // std::variant (Variant)
#include <vector>      // std::vector (Vec)

namespace hostfacts::utils {
  namespace error {
    struct FactsError;
  } // namespace error

  namespace types {
    // ─── Numeric ─────────────────────────────────────────────────────────────
    using u8    = std::uint8_t;
    using u32   = std::uint32_t;
    using u64   = std::uint64_t;
    using i32   = std::int32_t;
    using i64   = std::int64_t;
    using f64   = double;
    using usize = std::size_t;

    // ─── Text ────────────────────────────────────────────────────────────────
    using String     = std::string;
    using StringView = std::string_view;
    using CStr       = char;        ///< Single character, used for `argv` style signatures.
    using PCStr      = const char*; ///< Null-terminated C string.

    /// Return type of functions that produce no value.
    using Unit = void;

    using Exception = std::exception;
    using Mutex     = std::mutex;
    using LockGuard = std::lock_guard<Mutex>;

    // ─── Optional values ─────────────────────────────────────────────────────
    template <typename Tp>
    using Option = std::optional<Tp>;

    inline constexpr std::nullopt_t None = std::nullopt;

    // ─── Containers ──────────────────────────────────────────────────────────
    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    /// Ordered map with heterogeneous lookup, so `StringView` keys can be used with `String` maps.
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    template <typename... Ts>
    using Variant = std::variant<Ts...>;

    // ─── Ownership & callables ───────────────────────────────────────────────
    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    template <typename Tp>
    using Fn = std::function<Tp>;

    // ─── Results ─────────────────────────────────────────────────────────────
    /**
     * @typedef Result
     * @brief Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = Unit, typename Er = error::FactsError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Constructs a Result in its error state.
     */
    template <typename Er = error::FactsError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace hostfacts::utils
