#pragma once

#include <cerrno>  // errno
#include <cstdlib> // std::getenv, setenv, unsetenv, _dupenv_s, _putenv_s
#include <format>  // std::format
#include <utility> // std::move

#include "Error.hpp"
#include "Types.hpp"

namespace hostfacts::utils::env {
  namespace types = ::hostfacts::utils::types;
  namespace error = ::hostfacts::utils::error;

  using enum error::FactsErrorCode;

  /**
   * @brief Reads an environment variable.
   * @param name Variable name.
   * @return The value, or a `NotFound` error if the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
#ifdef _WIN32
    char*        rawPtr     = nullptr;
    types::usize bufferSize = 0;

    const errno_t err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> owner(rawPtr, free);

    if (err != 0)
      ERR_FMT(PermissionDenied, "Failed to read environment variable {}", name);

    if (!owner)
      ERR_FMT(NotFound, "Environment variable {} is not set", name);

    return types::String(owner.get());
#else
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable {} is not set", name);

    return types::String(value);
#endif
  }

  /// Reads an environment variable, substituting `fallback` when it is unset or empty.
  [[nodiscard]] inline auto GetEnvOr(const types::PCStr name, const types::StringView fallback) -> types::String {
    types::Result<types::String> value = GetEnv(name);

    if (!value || value->empty())
      return types::String(fallback);

    return *std::move(value);
  }

  /**
   * @brief Sets (and overwrites) an environment variable.
   */
  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, value) != 0)
#else
    if (setenv(name, value, 1) != 0)
#endif
      return types::Err(error::FactsError::fromErrno(errno, std::format("setenv({})", name)));

    return {};
  }

  /**
   * @brief Removes an environment variable.
   */
  inline auto UnsetEnv(const types::PCStr name) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, "") != 0)
#else
    if (unsetenv(name) != 0)
#endif
      return types::Err(error::FactsError::fromErrno(errno, std::format("unsetenv({})", name)));

    return {};
  }
} // namespace hostfacts::utils::env
