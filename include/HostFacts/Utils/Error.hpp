#pragma once

#include <cerrno>          // EACCES, ENOENT, ...
#include <format>          // std::format
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::generic_category
#include <utility>         // std::move

#include "Types.hpp"

namespace hostfacts::utils::error {
  /**
   * @enum FactsErrorCode
   * @brief Broad category of a failure while gathering host information.
   */
  enum class FactsErrorCode : types::u8 {
    ApiUnavailable,     ///< A required OS service or API failed unexpectedly at runtime.
    ConfigurationError, ///< Configuration file or environment issue.
    CorruptedData,      ///< Data present but inconsistent.
    InternalError,      ///< Logic error inside hostfacts itself.
    InvalidArgument,    ///< An invalid argument was passed to a function.
    IoError,            ///< General I/O error (files, pipes).
    NetworkError,       ///< Name resolution or other network failure.
    NotFound,           ///< A file, executable or key does not exist.
    NotSupported,       ///< Operation not supported on this platform.
    Other,              ///< Unclassified error.
    OutOfMemory,        ///< Allocation failure.
    ParseError,         ///< Text produced by the OS could not be parsed.
    PermissionDenied,   ///< Insufficient permissions.
    PlatformSpecific,   ///< Unmapped platform error, see the message.
    ResourceExhausted,  ///< A process or descriptor limit was reached.
    Timeout,            ///< Operation timed out.
  };

  /**
   * @struct FactsError
   * @brief Structured error carried by every `Result` in hostfacts.
   */
  struct FactsError {
    types::String        message;  ///< Human-readable description.
    std::source_location location; ///< Where the error was raised.
    FactsErrorCode       code;     ///< General category.

    FactsError(const FactsErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    /**
     * @brief Builds an error from an `errno` value.
     * @param errnum The `errno` reported by the failing call.
     * @param context What was being attempted, prefixed to the message.
     */
    static auto fromErrno(const int errnum, const types::StringView context, const std::source_location& loc = std::source_location::current()) -> FactsError {
      using namespace matchit;
      using enum FactsErrorCode;

      const FactsErrorCode errc = match(errnum)(
        is | or_(ENOENT, ENOTDIR)        = NotFound,
        is | or_(EACCES, EPERM)          = PermissionDenied,
        is | or_(EMFILE, ENFILE, EAGAIN) = ResourceExhausted,
        is | ENOMEM                      = OutOfMemory,
        is | EINVAL                      = InvalidArgument,
        is | EIO                         = IoError,
        is | _                           = PlatformSpecific
      );

      return { errc, std::format("{}: {}", context, std::generic_category().message(errnum)), loc };
    }
  };
} // namespace hostfacts::utils::error

#define ERR(errc, msg)          return ::hostfacts::utils::types::Err(::hostfacts::utils::error::FactsError(errc, msg))
#define ERR_FROM(err)           return ::hostfacts::utils::types::Err(::hostfacts::utils::error::FactsError(err))
#define ERR_FMT(errc, fmt, ...) return ::hostfacts::utils::types::Err(::hostfacts::utils::error::FactsError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Propagates the error of a `Result<T>` or yields its value.
 *
 * @code
 * auto readRelease() -> Result<String> {
 *   String text = TRY(ReadFile("/etc/os-release"));
 *   return ParseRelease(text);
 * }
 * @endcode
 *
 * @note Uses GNU statement expressions on GCC/Clang; MSVC rethrows the error.
 */
#ifdef _MSC_VER
  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _hf_try_result = (expr);                                                         \
        if (!_hf_try_result)                                                                    \
          return ::hostfacts::utils::types::Err(_hf_try_result.error());                        \
        std::move(*_hf_try_result);                                                             \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif

/// Same as TRY for `Result<>`: returns on error, otherwise continues.
#define TRY_VOID(expr)                                                \
  do {                                                                \
    auto&& _hf_try_result = (expr);                                   \
    if (!_hf_try_result)                                              \
      return ::hostfacts::utils::types::Err(_hf_try_result.error());  \
  } while (0)
