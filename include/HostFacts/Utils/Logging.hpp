#pragma once

#include <chrono>          // std::chrono::system_clock
#include <ctime>           // localtime_r/s, strftime, time_t, tm
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format
#include <source_location> // std::source_location
#include <utility>         // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace hostfacts::utils::logging {
  namespace types = ::hostfacts::utils::types;

  /**
   * @enum LogLevel
   * @brief Severity of a log event, most verbose first.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Destination for fully formatted log lines.
   *
   * Receives the level and the line without a trailing newline. When no sink is
   * installed, lines go to the console (stderr for Warn and Error).
   */
  using LogSink = types::Fn<void(LogLevel, types::StringView)>;

  namespace detail {
    struct LogState {
      types::Mutex mutex;
      LogLevel     level  = LogLevel::Info;
      LogSink      sink   = nullptr;
      bool         styled = true;
    };

    inline auto State() -> LogState& {
      static LogState Instance;
      return Instance;
    }

    // Bold, colored, padded level names: TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    inline constexpr types::Array<types::StringView, 5> STYLED_LEVELS = {
      "\033[1m\033[38;5;5mTRACE\033[0m",
      "\033[1m\033[38;5;4mDEBUG\033[0m",
      "\033[1m\033[38;5;2mINFO \033[0m",
      "\033[1m\033[38;5;3mWARN \033[0m",
      "\033[1m\033[38;5;1mERROR\033[0m",
    };

    inline constexpr types::Array<types::StringView, 5> PLAIN_LEVELS = { "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR" };

    inline constexpr types::StringView DIM_GRAY = "\033[2m\033[38;5;8m";
    inline constexpr types::StringView BOLD     = "\033[1m";
    inline constexpr types::StringView RESET    = "\033[0m";

    inline auto WriteToConsole(const types::StringView text, const bool useStderr) -> void {
#ifdef __cpp_lib_print
      if (useStderr)
        std::println(stderr, "{}", text);
      else
        std::println("{}", text);
#else
      (useStderr ? std::cerr : std::cout) << text << '\n';
#endif
    }

    /// ISO8601-like local timestamp (YYYY-MM-DDTHH:MM:SS).
    inline auto Timestamp(const std::time_t timeT) -> types::String {
      std::tm localTm {};

#ifdef _WIN32
      const bool converted = localtime_s(&localTm, &timeT) == 0;
#else
      const bool converted = localtime_r(&timeT, &localTm) != nullptr;
#endif

      types::Array<char, 20> buffer {};

      if (!converted || std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S", &localTm) == 0)
        return "????-??-??T??:??:??";

      return { buffer.data() };
    }
  } // namespace detail

  inline auto GetRuntimeLogLevel() -> LogLevel {
    const types::LockGuard lock(detail::State().mutex);
    return detail::State().level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    const types::LockGuard lock(detail::State().mutex);
    detail::State().level = level;
  }

  /**
   * @brief Replaces the output destination of all log macros.
   *
   * The sink is invoked without the logger's lock held, so it may log or
   * reconfigure the logger itself.
   *
   * @param sink New sink, or `nullptr` to restore console output.
   */
  inline auto SetLogSink(LogSink sink) -> void {
    const types::LockGuard lock(detail::State().mutex);
    detail::State().sink = std::move(sink);
  }

  /// Enables or disables ANSI styling of log lines.
  inline auto SetLogStyling(const bool enabled) -> void {
    const types::LockGuard lock(detail::State().mutex);
    detail::State().styled = enabled;
  }

  // User-facing output (stdout only, bypasses the sink)
  inline auto Println(const types::StringView text) -> void {
    detail::WriteToConsole(text, false);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) -> void {
    detail::WriteToConsole(std::format(fmt, std::forward<Args>(args)...), false);
  }

  /**
   * @struct Field
   * @brief Key-value pair appended to a log line (`key=value`).
   */
  struct Field {
    types::StringView key;
    types::String     value;

    template <typename T>
    static auto create(types::StringView k, const T& v) -> Field {
      if constexpr (std::is_convertible_v<const T&, types::StringView>)
        return Field { k, types::String(types::StringView(v)) };
      else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return Field { k, v ? "true" : "false" };
      else
        return Field { k, std::format("{}", v) };
    }
  };

  /**
   * @brief Extracts a module-like target from a function signature.
   * @details "auto hostfacts::core::facts::PosixFactProvider::netmask() const" becomes
   *          "hostfacts::core::facts::PosixFactProvider". MSVC's `__FUNCTION__` has no
   *          parameter list, which is handled the same way.
   */
  inline auto ExtractTarget(const types::PCStr funcName) -> types::String {
    const types::StringView func(funcName);

    types::usize parenPos = func.find('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const types::usize lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const types::usize spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = spacePos == types::StringView::npos ? 0 : spacePos + 1;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Formats and emits one log event.
   *
   * Layout: `timestamp LEVEL [file:line] target: message, key=value, ...`.
   * The file and line are only included in debug builds.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel               level,
    const std::source_location&  loc,
    const types::StringView      target,
    const types::Vec<Field>&     fields,
    std::format_string<Args...>  fmt,
    Args&&... args
  ) -> void {
    using std::chrono::system_clock;

    if (level < GetRuntimeLogLevel())
      return;

    detail::LogState& state = detail::State();

    LogSink sink;
    bool    styled = false;

    {
      const types::LockGuard lock(state.mutex);
      sink   = state.sink;
      styled = state.styled && !sink;
    }

    const types::String stamp = detail::Timestamp(system_clock::to_time_t(system_clock::now()));
    const auto          lvl   = static_cast<types::usize>(level);
    types::String       line;

    if (styled)
      line = std::format("{}{}{} {} ", detail::DIM_GRAY, stamp, detail::RESET, detail::STYLED_LEVELS.at(lvl));
    else
      line = std::format("{} {} ", stamp, detail::PLAIN_LEVELS.at(lvl));

#ifndef NDEBUG
    line += std::format("{}:{} ", std::filesystem::path(loc.file_name()).filename().string(), loc.line());
#else
    (void)loc;
#endif

    if (styled)
      line += std::format("{}{}{}: ", detail::BOLD, target, detail::RESET);
    else
      line += std::format("{}: ", target);

    line += std::format(fmt, std::forward<Args>(args)...);

    for (const Field& fld : fields)
      line += std::format(", {}={}", fld.key, fld.value);

    if (sink) {
      sink(level, line);
      return;
    }

    const types::LockGuard lock(state.mutex);
    detail::WriteToConsole(line, level >= LogLevel::Warn);
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    LogImpl(level, loc, target, types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs an error object, attributing it to where the error was raised.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, const types::StringView target, const ErrorType& errorObj) -> void {
    using Decayed = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<Decayed, error::FactsError>)
      LogImpl(level, errorObj.location, target, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, Decayed>)
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), target, "{}", "Unknown error type logged");
  }
} // namespace hostfacts::utils::logging

// ─────────────────────────────────────────────────────────────────────────────
// Macros
// ─────────────────────────────────────────────────────────────────────────────

#define HOSTFACTS_LOG_TARGET ::hostfacts::utils::logging::ExtractTarget(__FUNCTION__)

#define field(name, value) ::hostfacts::utils::logging::Field::create(#name, value)

#define HOSTFACTS_LOG(level, fmt, ...)                                                  \
  ::hostfacts::utils::logging::LogImpl(                                                 \
    ::hostfacts::utils::logging::LogLevel::level, std::source_location::current(),      \
    HOSTFACTS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__                                \
  )

#define HOSTFACTS_LOG_FIELDS(level, fields_vec, fmt, ...)                               \
  ::hostfacts::utils::logging::LogImpl(                                                 \
    ::hostfacts::utils::logging::LogLevel::level, std::source_location::current(),      \
    HOSTFACTS_LOG_TARGET, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__                    \
  )

#define trace_log(fmt, ...) HOSTFACTS_LOG(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) HOSTFACTS_LOG(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  HOSTFACTS_LOG(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  HOSTFACTS_LOG(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) HOSTFACTS_LOG(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log_fields(fields_vec, fmt, ...) HOSTFACTS_LOG_FIELDS(Debug, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log_fields(fields_vec, fmt, ...)  HOSTFACTS_LOG_FIELDS(Warn, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) ::hostfacts::utils::logging::LogError(::hostfacts::utils::logging::LogLevel::Debug, HOSTFACTS_LOG_TARGET, error_obj)
#define warn_at(error_obj)  ::hostfacts::utils::logging::LogError(::hostfacts::utils::logging::LogLevel::Warn, HOSTFACTS_LOG_TARGET, error_obj)
#define error_at(error_obj) ::hostfacts::utils::logging::LogError(::hostfacts::utils::logging::LogLevel::Error, HOSTFACTS_LOG_TARGET, error_obj)
