/**
 * @file Host.hpp
 * @brief Thin per-platform queries for host identity and hardware.
 *
 * The free functions are implemented once per platform (src/Lib/OS). The
 * fact providers reach them through IHostProbe so the identity facts can be
 * exercised without depending on the machine running the tests.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace hostfacts::core::host {
  namespace types = ::hostfacts::utils::types;

  /**
   * @brief Fetches the name of the user running the process.
   *
   * @details
   *  - POSIX: `getpwuid_r(geteuid())`, falling back to `USER` then `LOGNAME`
   *  - Windows: `GetUserNameW`, falling back to `USERNAME`
   */
  auto GetCurrentUser() -> types::Result<types::String>;

  /**
   * @brief Fetches the kernel name (e.g. "Linux", "FreeBSD", "Windows").
   *
   * @details
   *  - POSIX: `uname().sysname`
   *  - Windows: always "Windows"
   */
  auto GetKernelName() -> types::Result<types::String>;

  /// Local host name as configured (`gethostname`).
  auto GetHostName() -> types::Result<types::String>;

  /**
   * @brief Resolves the canonical (fully qualified) name of a host.
   *
   * Uses `getaddrinfo` with `AI_CANONNAME`.
   *
   * @return The canonical name, or `NetworkError` if resolution fails.
   */
  auto GetCanonicalName(types::StringView host) -> types::Result<types::String>;

  /**
   * @brief Resolves a host name to its first IPv4 address in dotted notation.
   * @return The address, or `NetworkError` if the name has no IPv4 address.
   */
  auto ResolveHostAddress(types::StringView host) -> types::Result<types::String>;

  /**
   * @brief Fetches the processor architecture.
   *
   * @details
   *  - POSIX: `uname().machine` (e.g. "x86_64", "aarch64")
   *  - Windows: `PROCESSOR_ARCHITECTURE` from `GetNativeSystemInfo` (e.g. "AMD64")
   */
  auto GetMachineArch() -> types::Result<types::String>;

  /**
   * @brief Fetches the raw kernel release string.
   *
   * @details
   *  - POSIX: `uname().release` (e.g. "5.14.0-362.el9.x86_64")
   *  - Windows: "major.minor.build" from `RtlGetVersion`
   */
  auto GetKernelRelease() -> types::Result<types::String>;

  /**
   * @brief Fetches the local time zone abbreviation.
   *
   * Picks the daylight name when daylight saving time is currently in effect,
   * the standard name otherwise.
   */
  auto GetTimeZoneName() -> types::Result<types::String>;

  /// Number of logical processors online, at least 1.
  auto GetProcessorCount() -> types::i64;

  /**
   * @brief Fetches a 48-bit hardware (MAC) address of this host.
   *
   * Interfaces are visited in name order; loopback interfaces and all-zero
   * addresses are skipped and the first remaining address wins.
   *
   * @details
   *  - Linux: `getifaddrs` `AF_PACKET` entries
   *  - BSD/macOS: `getifaddrs` `AF_LINK` entries
   *  - Windows: `GetAdaptersAddresses`
   *
   * @return The address as an integer, most significant byte first, or
   *         `NotFound` when no interface has one.
   */
  auto GetHardwareNode() -> types::Result<types::u64>;

  /**
   * @brief Source of host identity facts.
   */
  class IHostProbe {
   public:
    IHostProbe()                                     = default;
    IHostProbe(const IHostProbe&)                    = default;
    IHostProbe(IHostProbe&&)                         = default;
    auto operator=(const IHostProbe&) -> IHostProbe& = default;
    auto operator=(IHostProbe&&) -> IHostProbe&      = default;
    virtual ~IHostProbe()                            = default;

    [[nodiscard]] virtual auto currentUser() const -> types::Result<types::String>                          = 0;
    [[nodiscard]] virtual auto kernelName() const -> types::Result<types::String>                           = 0;
    [[nodiscard]] virtual auto hostName() const -> types::Result<types::String>                             = 0;
    [[nodiscard]] virtual auto canonicalName(types::StringView host) const -> types::Result<types::String>  = 0;
    [[nodiscard]] virtual auto resolveAddress(types::StringView host) const -> types::Result<types::String> = 0;
    [[nodiscard]] virtual auto machineArch() const -> types::Result<types::String>                          = 0;
    [[nodiscard]] virtual auto kernelRelease() const -> types::Result<types::String>                        = 0;
    [[nodiscard]] virtual auto timeZoneName() const -> types::Result<types::String>                         = 0;
    [[nodiscard]] virtual auto processorCount() const -> types::i64                                         = 0;
    [[nodiscard]] virtual auto hardwareNode() const -> types::Result<types::u64>                            = 0;
  };

  /// IHostProbe that queries the running machine.
  class SystemHostProbe final : public IHostProbe {
   public:
    [[nodiscard]] auto currentUser() const -> types::Result<types::String> override;
    [[nodiscard]] auto kernelName() const -> types::Result<types::String> override;
    [[nodiscard]] auto hostName() const -> types::Result<types::String> override;
    [[nodiscard]] auto canonicalName(types::StringView host) const -> types::Result<types::String> override;
    [[nodiscard]] auto resolveAddress(types::StringView host) const -> types::Result<types::String> override;
    [[nodiscard]] auto machineArch() const -> types::Result<types::String> override;
    [[nodiscard]] auto kernelRelease() const -> types::Result<types::String> override;
    [[nodiscard]] auto timeZoneName() const -> types::Result<types::String> override;
    [[nodiscard]] auto processorCount() const -> types::i64 override;
    [[nodiscard]] auto hardwareNode() const -> types::Result<types::u64> override;
  };
} // namespace hostfacts::core::host
