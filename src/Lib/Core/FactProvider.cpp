#include "HostFacts/Core/FactProvider.hpp"

#include <algorithm> // std::ranges::transform
#include <cctype>    // std::tolower
#include <format>    // std::format

#include "HostFacts/Core/Parsers.hpp"

#include "HostFacts/Utils/Logging.hpp"

using namespace hostfacts::utils::types;

namespace hostfacts::core::facts {
  namespace {
    template <typename T>
    auto ValueOr(Result<T> result, const StringView fact, T fallback) -> T {
      if (result)
        return *std::move(result);

      warn_log("Could not determine {}: {}", fact, result.error().message);
      return fallback;
    }
  } // namespace

  FactProvider::FactProvider(const os::IOSClassifier& classifier, command::ICommandRunner& runner, const host::IHostProbe& probe)
    : m_classifier(classifier), m_runner(runner), m_probe(probe) {}

  auto FactProvider::currentUser() const -> String {
    return ValueOr(m_probe.currentUser(), keys::Id, String());
  }

  auto FactProvider::kernelName() const -> String {
    return ValueOr(m_probe.kernelName(), keys::Kernel, String());
  }

  auto FactProvider::fullyQualifiedDomainName() const -> String {
    const String host = ValueOr(m_probe.hostName(), keys::Hostname, String("localhost"));

    Result<String> canonical = m_probe.canonicalName(host);

    if (!canonical)
      debug_log("Using {} as fqdn: {}", host, canonical.error().message);

    String fqdn = canonical ? *std::move(canonical) : host;

    std::ranges::transform(fqdn, fqdn.begin(), [](const u8 chr) -> CStr { return static_cast<CStr>(std::tolower(chr)); });

    return fqdn;
  }

  auto FactProvider::hostname() const -> String {
    return parse::HostnameFromFqdn(fullyQualifiedDomainName());
  }

  auto FactProvider::domain() const -> String {
    const String fqdn = fullyQualifiedDomainName();
    return parse::DomainFromFqdn(fqdn, parse::HostnameFromFqdn(fqdn));
  }

  auto FactProvider::architecture() const -> String {
    String arch = ValueOr(m_probe.machineArch(), keys::Architecture, String());
    return arch.empty() ? String(NOT_SUPPORTED) : arch;
  }

  auto FactProvider::operatingSystem() const -> String {
    return m_classifier.osType();
  }

  auto FactProvider::operatingSystemRelease() const -> String {
    return m_classifier.osVersion();
  }

  auto FactProvider::osFamily() const -> String {
    return m_classifier.osFamily();
  }

  auto FactProvider::timeZone() const -> String {
    return ValueOr(m_probe.timeZoneName(), keys::TimeZone, String());
  }

  auto FactProvider::processorCount() const -> i64 {
    return std::max<i64>(1, m_probe.processorCount());
  }

  auto FactProvider::kernelRelease() const -> String {
    return ValueOr(m_probe.kernelRelease(), keys::KernelRelease, String());
  }

  auto FactProvider::kernelVersion() const -> String {
    return parse::KernelVersionFromRelease(kernelRelease());
  }

  auto FactProvider::kernelMajorVersion() const -> String {
    return parse::KernelMajorVersion(kernelVersion());
  }

  auto FactProvider::macAddress() const -> String {
    const Result<u64> first  = m_probe.hardwareNode();
    const Result<u64> second = m_probe.hardwareNode();

    if (!first || !second) {
      warn_log("Could not read hardware address: {}", (first ? second : first).error().message);
      return String(UNKNOWN_MAC);
    }

    if (*first != *second) {
      debug_log("Hardware address changed between reads ({:012X} vs {:012X})", *first, *second);
      return String(UNKNOWN_MAC);
    }

    return parse::FormatMacAddress(*first);
  }

  auto FactProvider::uptimeHours() const -> i64 {
    return uptimeSeconds() / 3600;
  }

  auto FactProvider::uptimeDays() const -> i64 {
    return uptimeSeconds() / 86400;
  }

  auto FactProvider::resolveLocalAddress() const -> String {
    String host = ValueOr(m_probe.hostName(), keys::Hostname, String("localhost"));

    std::ranges::transform(host, host.begin(), [](const u8 chr) -> CStr { return static_cast<CStr>(std::tolower(chr)); });

    return ValueOr(m_probe.resolveAddress(host), keys::IpAddress, String());
  }

  auto FactProvider::collectAll() const -> FactSet {
    const String fqdn         = fullyQualifiedDomainName();
    const String host         = parse::HostnameFromFqdn(fqdn);
    const String arch         = architecture();
    const String release      = kernelRelease();
    const String version      = parse::KernelVersionFromRelease(release);
    const i64    cpus         = processorCount();
    const i64    uptime       = uptimeSeconds();
    const i64    totalMemory  = memoryTotal();

    debug_log("Collecting facts for {}", fqdn);

    return FactSet {
      { String(keys::Id), currentUser() },
      { String(keys::Kernel), kernelName() },
      { String(keys::Domain), parse::DomainFromFqdn(fqdn, host) },
      { String(keys::Fqdn), fqdn },
      { String(keys::Hostname), host },
      { String(keys::MacAddress), macAddress() },
      { String(keys::Architecture), arch },
      { String(keys::OperatingSystem), operatingSystem() },
      { String(keys::OperatingSystemRelease), operatingSystemRelease() },
      { String(keys::PhysicalProcessorCount), cpus },
      { String(keys::ProcessorCount), cpus },
      { String(keys::TimeZone), timeZone() },
      { String(keys::HardwareIsa), arch },
      { String(keys::HardwareModel), arch },
      { String(keys::KernelRelease), release },
      { String(keys::KernelVersion), version },
      { String(keys::OsFamily), osFamily() },
      { String(keys::KernelMajVersion), parse::KernelMajorVersion(version) },
      { String(keys::IpAddress), ipAddress() },
      { String(keys::Netmask), netmask() },
      { String(keys::Interfaces), interfaces() },
      { String(keys::UptimeSeconds), std::format("{}", uptime) },
      { String(keys::UptimeHours), std::format("{}", uptime / 3600) },
      { String(keys::UptimeDays), std::format("{}", uptime / 86400) },
      { String(keys::MemorySize), memorySize() },
      { String(keys::MemoryFree), memoryFree() },
      { String(keys::MemoryTotal), totalMemory },
      { String(keys::SwapSize), renderSwap(swapSize()) },
      { String(keys::SwapFree), renderSwap(swapFree()) },
    };
  }

  auto CreateFactProvider(
    const os::IOSClassifier& classifier,
    command::ICommandRunner& runner,
    const host::IHostProbe&  probe,
    const ProviderOptions&   options
  ) -> UniquePointer<FactProvider> {
    if (classifier.isWindows()) {
      debug_log("Using the Windows fact provider");
      return std::make_unique<WindowsFactProvider>(classifier, runner, probe, options);
    }

    debug_log("Using the POSIX fact provider ({} ifconfig output)", classifier.netToolsFormat() == os::NetToolsFormat::Modern ? "modern" : "legacy");
    return std::make_unique<PosixFactProvider>(classifier, runner, probe, options);
  }
} // namespace hostfacts::core::facts
