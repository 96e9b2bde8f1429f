#include "HostFacts/Core/Host.hpp"

using namespace hostfacts::utils::types;

namespace hostfacts::core::host {
  auto SystemHostProbe::currentUser() const -> Result<String> {
    return GetCurrentUser();
  }

  auto SystemHostProbe::kernelName() const -> Result<String> {
    return GetKernelName();
  }

  auto SystemHostProbe::hostName() const -> Result<String> {
    return GetHostName();
  }

  auto SystemHostProbe::canonicalName(const StringView host) const -> Result<String> {
    return GetCanonicalName(host);
  }

  auto SystemHostProbe::resolveAddress(const StringView host) const -> Result<String> {
    return ResolveHostAddress(host);
  }

  auto SystemHostProbe::machineArch() const -> Result<String> {
    return GetMachineArch();
  }

  auto SystemHostProbe::kernelRelease() const -> Result<String> {
    return GetKernelRelease();
  }

  auto SystemHostProbe::timeZoneName() const -> Result<String> {
    return GetTimeZoneName();
  }

  auto SystemHostProbe::processorCount() const -> i64 {
    return GetProcessorCount();
  }

  auto SystemHostProbe::hardwareNode() const -> Result<u64> {
    return GetHardwareNode();
  }
} // namespace hostfacts::core::host
