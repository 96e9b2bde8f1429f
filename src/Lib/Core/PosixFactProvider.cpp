#include "HostFacts/Core/FactProvider.hpp"
#include "HostFacts/Core/Parsers.hpp"

#include "HostFacts/Utils/Logging.hpp"

using namespace hostfacts::utils::types;
using hostfacts::core::command::CommandResult;
using hostfacts::core::command::DescribeCommand;

namespace hostfacts::core::facts {
  namespace {
    constexpr StringView MEM_FREE   = "MemFree";
    constexpr StringView MEM_TOTAL  = "MemTotal";
    constexpr StringView SWAP_FREE  = "SwapFree";
    constexpr StringView SWAP_TOTAL = "SwapTotal";
  } // namespace

  PosixFactProvider::PosixFactProvider(
    const os::IOSClassifier& classifier,
    command::ICommandRunner& runner,
    const host::IHostProbe&  probe,
    ProviderOptions          options
  )
    : FactProvider(classifier, runner, probe),
      m_options(std::move(options)),
      m_format(classifier.netToolsFormat()),
      m_interfacesOutput(captureOutput(m_options.interfacesCommand)),
      m_uptimeOutput(captureOutput(m_options.uptimeCommand)),
      m_meminfoOutput(captureOutput(m_options.meminfoCommand)) {}

  auto PosixFactProvider::captureOutput(const Vec<String>& argv) const -> String {
    Result<CommandResult> result = m_runner.run(argv);

    if (!result) {
      warn_log("Can't execute {}: {}", DescribeCommand(argv), result.error().message);
      return {};
    }

    if (!result->succeeded()) {
      const Vec<utils::logging::Field> details = { field(exit_code, result->exitCode), field(error_output, result->stdErr) };
      warn_log_fields(details, "{} exited with a non-zero status", DescribeCommand(argv));
    }

    return std::move(result->stdOut);
  }

  auto PosixFactProvider::ipAddress() const -> String {
    String address = parse::ExtractFirst(m_interfacesOutput, parse::IpAddressPattern(m_format));

    if (!address.empty())
      return address;

    warn_log("No IPv4 address in interface listing, resolving the host name instead");
    return resolveLocalAddress();
  }

  auto PosixFactProvider::netmask() const -> String {
    String mask = parse::ExtractFirst(m_interfacesOutput, parse::NetmaskPattern(m_format));

    if (!mask.empty())
      return mask;

    warn_log("Can't get a netmask from the interface listing");
    return String(NOT_SUPPORTED);
  }

  auto PosixFactProvider::interfaces() const -> String {
    String names = parse::ExtractAll(m_interfacesOutput, parse::InterfaceNamePattern(m_format));

    if (!names.empty())
      return names;

    warn_log("Can't get the network interface list from the interface listing");
    return String(NOT_SUPPORTED);
  }

  auto PosixFactProvider::isSecurityEnforcementActive() const -> bool {
    const Result<CommandResult> result = m_runner.run(m_options.selinuxCommand);

    if (!result) {
      warn_log("Can't execute {}: {}", DescribeCommand(m_options.selinuxCommand), result.error().message);
      return false;
    }

    return parse::IsSelinuxActive(result->stdOut);
  }

  auto PosixFactProvider::uptimeSeconds() const -> i64 {
    const Result<i64> seconds = parse::ParseUptimeSeconds(m_uptimeOutput);

    if (!seconds) {
      warn_log("Can't parse uptime: {}", seconds.error().message);
      return 0;
    }

    return *seconds;
  }

  auto PosixFactProvider::meminfoField(const StringView label) const -> i64 {
    const Result<i64> value = parse::ParseMeminfoField(m_meminfoOutput, label);

    if (!value) {
      warn_log("Can't parse memory information: {}", value.error().message);
      return 0;
    }

    return *value;
  }

  auto PosixFactProvider::memoryFree() const -> i64 {
    return meminfoField(MEM_FREE);
  }

  auto PosixFactProvider::memoryTotal() const -> i64 {
    return meminfoField(MEM_TOTAL);
  }

  auto PosixFactProvider::memorySize() const -> i64 {
    return meminfoField(MEM_TOTAL);
  }

  auto PosixFactProvider::swapFree() const -> i64 {
    return meminfoField(SWAP_FREE);
  }

  auto PosixFactProvider::swapSize() const -> i64 {
    return meminfoField(SWAP_TOTAL);
  }

  auto PosixFactProvider::collectAll() const -> FactSet {
    FactSet facts = FactProvider::collectAll();

    facts[String(keys::Selinux)] = isSecurityEnforcementActive();

    return facts;
  }

  auto PosixFactProvider::renderSwap(const i64 amount) const -> FactValue {
    return parse::ConvertKilobytesToGigabytes(amount);
  }
} // namespace hostfacts::core::facts
