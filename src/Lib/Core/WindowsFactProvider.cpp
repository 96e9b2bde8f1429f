#include "HostFacts/Core/FactProvider.hpp"
#include "HostFacts/Core/Parsers.hpp"

#include "HostFacts/Utils/Logging.hpp"

using namespace hostfacts::utils::types;
using hostfacts::core::command::CommandResult;

namespace hostfacts::core::facts {
  namespace {
    // Prints "<free kB> <total kB>".
    constexpr StringView MEMORY_QUERY =
      R"ps($mem =(Get-WMIObject Win32_OperatingSystem -ComputerName "LocalHost" ); echo "$($mem.FreePhysicalMemory) $($mem.TotalVisibleMemorySize)")ps";

    // Prints "<allocated MB> <free MB>".
    constexpr StringView PAGE_FILE_QUERY =
      R"ps($pgo=(Get-WmiObject Win32_PageFileUsage); echo "$($pgo.AllocatedBaseSize) $($pgo.AllocatedBaseSize-$pgo.CurrentUsage)")ps";

    // Prints whole seconds since the last boot.
    constexpr StringView UPTIME_QUERY =
      R"ps(echo $([int]((get-date)-[system.management.managementdatetimeconverter]::todatetime((get-wmiobject -class win32_operatingsystem).Lastbootuptime)).TotalSeconds))ps";
  } // namespace

  WindowsFactProvider::WindowsFactProvider(
    const os::IOSClassifier& classifier,
    command::ICommandRunner& runner,
    const host::IHostProbe&  probe,
    ProviderOptions          options
  )
    : FactProvider(classifier, runner, probe), m_options(std::move(options)) {}

  auto WindowsFactProvider::queryToken(const StringView fact, const StringView script, const Pick pick) const -> i64 {
    Vec<String> argv = m_options.powershellPrefix;
    argv.emplace_back(script);

    const Result<CommandResult> result = m_runner.run(argv);

    if (!result) {
      warn_log("Can not get {}: {}", fact, result.error().message);
      return 0;
    }

    if (!result->succeeded()) {
      warn_log("Can not get {}: PowerShell exited with {}", fact, result->exitCode);
      return 0;
    }

    const Vec<String> tokens = parse::SplitTokens(result->stdOut);

    if (tokens.empty()) {
      warn_log("Can not get {}: empty output", fact);
      return 0;
    }

    const Result<i64> value = parse::ParseInteger(pick == Pick::First ? tokens.front() : tokens.back());

    if (!value) {
      warn_log("Can not get {}: {}", fact, value.error().message);
      return 0;
    }

    return *value;
  }

  auto WindowsFactProvider::ipAddress() const -> String {
    return resolveLocalAddress();
  }

  auto WindowsFactProvider::netmask() const -> String {
    return String(NOT_SUPPORTED);
  }

  auto WindowsFactProvider::interfaces() const -> String {
    return String(NOT_SUPPORTED);
  }

  auto WindowsFactProvider::uptimeSeconds() const -> i64 {
    return queryToken(keys::UptimeSeconds, UPTIME_QUERY, Pick::First);
  }

  auto WindowsFactProvider::memoryFree() const -> i64 {
    return queryToken(keys::MemoryFree, MEMORY_QUERY, Pick::First);
  }

  auto WindowsFactProvider::memoryTotal() const -> i64 {
    return queryToken(keys::MemoryTotal, MEMORY_QUERY, Pick::Last);
  }

  auto WindowsFactProvider::memorySize() const -> i64 {
    return queryToken(keys::MemorySize, MEMORY_QUERY, Pick::Last);
  }

  auto WindowsFactProvider::swapFree() const -> i64 {
    return queryToken(keys::SwapFree, PAGE_FILE_QUERY, Pick::Last);
  }

  auto WindowsFactProvider::swapSize() const -> i64 {
    return queryToken(keys::SwapSize, PAGE_FILE_QUERY, Pick::First);
  }

  auto WindowsFactProvider::renderSwap(const i64 amount) const -> FactValue {
    return parse::ConvertMegabytesToGigabytes(amount);
  }
} // namespace hostfacts::core::facts
