/**
 * @file FactProvider.hpp
 * @brief Collects the full fact set of a host, one implementation per OS family.
 */

#pragma once

#include "../Utils/Types.hpp"

#include "Command.hpp"
#include "FactSet.hpp"
#include "Host.hpp"
#include "OSClassifier.hpp"

namespace hostfacts::core::facts {
  namespace types = ::hostfacts::utils::types;

  /**
   * @struct ProviderOptions
   * @brief Commands used to capture host state, overridable from configuration.
   */
  struct ProviderOptions {
    types::Vec<types::String> interfacesCommand = { "ifconfig" };
    types::Vec<types::String> uptimeCommand     = { "cat", "/proc/uptime" };
    types::Vec<types::String> meminfoCommand    = { "cat", "/proc/meminfo" };
    types::Vec<types::String> selinuxCommand    = { "/usr/sbin/sestatus" };
    types::Vec<types::String> powershellPrefix  = { "powershell", "-NoProfile", "-NonInteractive", "-Command" };
  };

  /**
   * @brief Facts that do not depend on the OS family, plus the aggregate query.
   *
   * Every accessor returns a usable value: failures are logged as warnings and
   * replaced with the fact's default. The classifier, runner and probe are
   * borrowed and must outlive the provider.
   */
  class FactProvider {
   public:
    FactProvider(const os::IOSClassifier& classifier, command::ICommandRunner& runner, const host::IHostProbe& probe);

    FactProvider(const FactProvider&)                    = delete;
    FactProvider(FactProvider&&)                         = delete;
    auto operator=(const FactProvider&) -> FactProvider& = delete;
    auto operator=(FactProvider&&) -> FactProvider&      = delete;
    virtual ~FactProvider()                              = default;

    [[nodiscard]] auto currentUser() const -> types::String;
    [[nodiscard]] auto kernelName() const -> types::String;
    /// Lower-cased canonical name of the local host; the plain host name if it does not resolve.
    [[nodiscard]] auto fullyQualifiedDomainName() const -> types::String;
    [[nodiscard]] auto hostname() const -> types::String;
    [[nodiscard]] auto domain() const -> types::String;
    /// Processor architecture, or "OS NOT SUPPORTED" if the OS reports none.
    [[nodiscard]] auto architecture() const -> types::String;
    [[nodiscard]] auto operatingSystem() const -> types::String;
    [[nodiscard]] auto operatingSystemRelease() const -> types::String;
    [[nodiscard]] auto osFamily() const -> types::String;
    [[nodiscard]] auto timeZone() const -> types::String;
    [[nodiscard]] auto processorCount() const -> types::i64;
    [[nodiscard]] auto kernelRelease() const -> types::String;
    [[nodiscard]] auto kernelVersion() const -> types::String;
    [[nodiscard]] auto kernelMajorVersion() const -> types::String;

    /**
     * @brief Hardware address as "XX:XX:XX:XX:XX:XX".
     *
     * The address is read twice and only reported when both reads agree;
     * randomized or virtual adapters that change between reads yield "UNKNOWN".
     */
    [[nodiscard]] auto macAddress() const -> types::String;

    [[nodiscard]] auto uptimeHours() const -> types::i64;
    [[nodiscard]] auto uptimeDays() const -> types::i64;

    [[nodiscard]] virtual auto ipAddress() const -> types::String     = 0;
    [[nodiscard]] virtual auto netmask() const -> types::String       = 0;
    [[nodiscard]] virtual auto interfaces() const -> types::String    = 0;
    [[nodiscard]] virtual auto uptimeSeconds() const -> types::i64    = 0;
    [[nodiscard]] virtual auto memoryFree() const -> types::i64       = 0;
    [[nodiscard]] virtual auto memoryTotal() const -> types::i64      = 0;
    [[nodiscard]] virtual auto memorySize() const -> types::i64       = 0;
    [[nodiscard]] virtual auto swapFree() const -> types::i64         = 0;
    [[nodiscard]] virtual auto swapSize() const -> types::i64         = 0;

    /**
     * @brief Queries every fact and returns them as one map.
     *
     * All keys of COMMON_KEYS are always present. Variants add their own keys.
     */
    [[nodiscard]] virtual auto collectAll() const -> FactSet;

   protected:
    /// Swap figure as reported in the aggregate, in the variant's native unit.
    [[nodiscard]] virtual auto renderSwap(types::i64 amount) const -> FactValue = 0;

    /// First IPv4 address of the local host name, or "" if it does not resolve.
    [[nodiscard]] auto resolveLocalAddress() const -> types::String;

    const os::IOSClassifier& m_classifier;
    command::ICommandRunner& m_runner;
    const host::IHostProbe&  m_probe;
  };

  /**
   * @brief Linux/BSD facts read from `ifconfig`, `/proc/uptime`, `/proc/meminfo` and `sestatus`.
   *
   * The interface, uptime and memory outputs are captured once, in the
   * constructor; construct a new provider to observe changes.
   */
  class PosixFactProvider final : public FactProvider {
   public:
    PosixFactProvider(
      const os::IOSClassifier& classifier,
      command::ICommandRunner& runner,
      const host::IHostProbe&  probe,
      ProviderOptions          options = {}
    );

    [[nodiscard]] auto ipAddress() const -> types::String override;
    [[nodiscard]] auto netmask() const -> types::String override;
    [[nodiscard]] auto interfaces() const -> types::String override;
    [[nodiscard]] auto uptimeSeconds() const -> types::i64 override;
    [[nodiscard]] auto memoryFree() const -> types::i64 override;
    [[nodiscard]] auto memoryTotal() const -> types::i64 override;
    [[nodiscard]] auto memorySize() const -> types::i64 override;
    [[nodiscard]] auto swapFree() const -> types::i64 override;
    [[nodiscard]] auto swapSize() const -> types::i64 override;

    /// Runs `sestatus`; false when SELinux is disabled or the tool is missing.
    [[nodiscard]] auto isSecurityEnforcementActive() const -> bool;

    [[nodiscard]] auto collectAll() const -> FactSet override;

   protected:
    /// Kilobytes from /proc/meminfo, rendered as "N.NN GB".
    [[nodiscard]] auto renderSwap(types::i64 amount) const -> FactValue override;

   private:
    [[nodiscard]] auto captureOutput(const types::Vec<types::String>& argv) const -> types::String;
    [[nodiscard]] auto meminfoField(types::StringView label) const -> types::i64;

    ProviderOptions    m_options;
    os::NetToolsFormat m_format;
    types::String      m_interfacesOutput;
    types::String      m_uptimeOutput;
    types::String      m_meminfoOutput;
  };

  /**
   * @brief Windows facts read through PowerShell WMI queries, on demand.
   *
   * Netmask and interface enumeration are not provided on this family.
   */
  class WindowsFactProvider final : public FactProvider {
   public:
    WindowsFactProvider(
      const os::IOSClassifier& classifier,
      command::ICommandRunner& runner,
      const host::IHostProbe&  probe,
      ProviderOptions          options = {}
    );

    [[nodiscard]] auto ipAddress() const -> types::String override;
    [[nodiscard]] auto netmask() const -> types::String override;
    [[nodiscard]] auto interfaces() const -> types::String override;
    [[nodiscard]] auto uptimeSeconds() const -> types::i64 override;
    [[nodiscard]] auto memoryFree() const -> types::i64 override;
    [[nodiscard]] auto memoryTotal() const -> types::i64 override;
    [[nodiscard]] auto memorySize() const -> types::i64 override;
    [[nodiscard]] auto swapFree() const -> types::i64 override;
    [[nodiscard]] auto swapSize() const -> types::i64 override;

   protected:
    /// Megabytes from Win32_PageFileUsage, rendered as "N.NN GB".
    [[nodiscard]] auto renderSwap(types::i64 amount) const -> FactValue override;

   private:
    enum class Pick : types::u8 {
      First,
      Last,
    };

    /// Runs a PowerShell script and returns one numeric token of its output, or 0.
    [[nodiscard]] auto queryToken(types::StringView fact, types::StringView script, Pick pick) const -> types::i64;

    ProviderOptions m_options;
  };

  /**
   * @brief Picks the provider matching the classified OS family.
   * @return A WindowsFactProvider when `classifier.isWindows()`, otherwise a PosixFactProvider.
   */
  auto CreateFactProvider(
    const os::IOSClassifier& classifier,
    command::ICommandRunner& runner,
    const host::IHostProbe&  probe,
    const ProviderOptions&   options = {}
  ) -> types::UniquePointer<FactProvider>;
} // namespace hostfacts::core::facts
