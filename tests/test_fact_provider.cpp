#include <boost/ut.hpp>

#include <HostFacts/Core/Command.hpp>
#include <HostFacts/Core/FactProvider.hpp>
#include <HostFacts/Core/Host.hpp>
#include <HostFacts/Core/OSClassifier.hpp>

#include <HostFacts/Utils/Error.hpp>
#include <HostFacts/Utils/Logging.hpp>
#include <HostFacts/Utils/Types.hpp>

using namespace boost::ut;
using namespace hostfacts::core;
using namespace hostfacts::utils::types;
using hostfacts::utils::error::FactsError;
using hostfacts::utils::error::FactsErrorCode;
using hostfacts::utils::logging::LogLevel;
using hostfacts::utils::logging::SetRuntimeLogLevel;

namespace {
  using command::CommandResult;
  using facts::FactSet;

  /// Replays canned results keyed by the full argument list.
  class FakeCommandRunner final : public command::ICommandRunner {
   public:
    auto script(const Vec<String>& argv, Result<CommandResult> result) -> FakeCommandRunner& {
      m_script.insert_or_assign(command::DescribeCommand(argv), std::move(result));
      return *this;
    }

    auto succeed(const Vec<String>& argv, String stdOut) -> FakeCommandRunner& {
      return script(argv, CommandResult { .exitCode = 0, .stdOut = std::move(stdOut), .stdErr = {} });
    }

    auto run(const Vec<String>& argv) -> Result<CommandResult> override {
      m_calls.push_back(argv);

      const auto iter = m_script.find(command::DescribeCommand(argv));

      if (iter == m_script.end())
        ERR_FMT(FactsErrorCode::NotFound, "{}: command not found", argv.empty() ? String() : argv.front());

      return iter->second;
    }

    [[nodiscard]] auto calls() const -> const Vec<Vec<String>>& {
      return m_calls;
    }

   private:
    Map<String, Result<CommandResult>> m_script;
    Vec<Vec<String>>                   m_calls;
  };

  /// Host probe with fixed answers; the hardware node can be made to change between reads.
  class FakeHostProbe final : public host::IHostProbe {
   public:
    String         user     = "ambari";
    String         host     = "Web01";
    Option<String> canonical = "WEB01.Example.COM";
    Option<String> address   = "10.1.2.3";
    String         arch     = "x86_64";
    String         release  = "5.14.0-362.8.1.el9_3.x86_64";
    String         zone     = "UTC";
    i64            cpus     = 8;
    Vec<u64>       nodes    = { 0x00163E5E6C00ULL };

    [[nodiscard]] auto currentUser() const -> Result<String> override {
      return user;
    }

    [[nodiscard]] auto kernelName() const -> Result<String> override {
      return String("Linux");
    }

    [[nodiscard]] auto hostName() const -> Result<String> override {
      return host;
    }

    [[nodiscard]] auto canonicalName(StringView /*host*/) const -> Result<String> override {
      if (!canonical)
        ERR(FactsErrorCode::NetworkError, "Name or service not known");

      return *canonical;
    }

    [[nodiscard]] auto resolveAddress(StringView /*host*/) const -> Result<String> override {
      if (!address)
        ERR(FactsErrorCode::NetworkError, "Name or service not known");

      return *address;
    }

    [[nodiscard]] auto machineArch() const -> Result<String> override {
      return arch;
    }

    [[nodiscard]] auto kernelRelease() const -> Result<String> override {
      return release;
    }

    [[nodiscard]] auto timeZoneName() const -> Result<String> override {
      return zone;
    }

    [[nodiscard]] auto processorCount() const -> i64 override {
      return cpus;
    }

    [[nodiscard]] auto hardwareNode() const -> Result<u64> override {
      if (nodes.empty())
        ERR(FactsErrorCode::NotFound, "no network adapter");

      const u64 node = nodes[m_reads % nodes.size()];
      ++m_reads;
      return node;
    }

   private:
    mutable usize m_reads = 0;
  };

  constexpr StringView MODERN_IFCONFIG =
    "eth0: flags=4163<UP,BROADCAST,RUNNING,MULTICAST>  mtu 1500\n"
    "        inet 10.0.0.5  netmask 255.255.255.0  broadcast 10.0.0.255\n"
    "\n"
    "lo: flags=73<UP,LOOPBACK,RUNNING>  mtu 65536\n"
    "        inet 127.0.0.1  netmask 255.0.0.0\n";

  constexpr StringView LEGACY_IFCONFIG =
    "eth0      Link encap:Ethernet  HWaddr 00:16:3E:5E:6C:00\n"
    "          inet addr:192.168.1.10  Bcast:192.168.1.255  Mask:255.255.255.0\n"
    "\n"
    "lo        Link encap:Local Loopback\n"
    "          inet addr:127.0.0.1  Mask:255.0.0.0\n";

  constexpr StringView MEMINFO =
    "MemTotal:       16384000 kB\n"
    "MemFree:         2048000 kB\n"
    "SwapTotal:       2097152 kB\n"
    "SwapFree:        1048576 kB\n";

  const facts::ProviderOptions DEFAULTS {};

  auto Rhel9() -> os::OSClassifier {
    return os::OSClassifier(os::OsDescription {
      .type     = "rhel",
      .version  = "9.3",
      .family   = String(os::family::RedHat),
      .netTools = os::NetToolsFormat::Modern,
      .windows  = false,
    });
  }

  auto Centos6() -> os::OSClassifier {
    return os::OSClassifier(os::OsDescription {
      .type     = "centos",
      .version  = "6.10",
      .family   = String(os::family::RedHat),
      .netTools = os::NetToolsFormat::Legacy,
      .windows  = false,
    });
  }

  auto WindowsServer() -> os::OSClassifier {
    return os::OSClassifier(os::OsDescription {
      .type     = "windows",
      .version  = "10.0.20348",
      .family   = String(os::family::WinSrv),
      .netTools = os::NetToolsFormat::Modern,
      .windows  = true,
    });
  }

  auto ScriptPosix(FakeCommandRunner& runner, const StringView ifconfig) -> Unit {
    runner.succeed(DEFAULTS.interfacesCommand, String(ifconfig))
      .succeed(DEFAULTS.uptimeCommand, "90061.02 360000.00\n")
      .succeed(DEFAULTS.meminfoCommand, String(MEMINFO))
      .succeed(DEFAULTS.selinuxCommand, "SELinux status:                 enabled\nCurrent mode:                   enforcing\n");
  }

  auto PowerShell(const StringView script) -> Vec<String> {
    Vec<String> argv = DEFAULTS.powershellPrefix;
    argv.emplace_back(script);
    return argv;
  }

  /// Returns the same result for every query and remembers the last script.
  class UniformPowerShellRunner final : public command::ICommandRunner {
   public:
    explicit UniformPowerShellRunner(Result<CommandResult> result)
      : m_result(std::move(result)) {}

    auto run(const Vec<String>& argv) -> Result<CommandResult> override {
      m_lastScript = argv.back();
      return m_result;
    }

    [[nodiscard]] auto lastScript() const -> const String& {
      return m_lastScript;
    }

   private:
    Result<CommandResult> m_result;
    String                m_lastScript;
  };

  /// Answers PowerShell queries by keyword: memory, page file and uptime.
  class WindowsRunner final : public command::ICommandRunner {
   public:
    String memory   = "2048000 16384000\r\n";
    String pageFile = "4096 3072\r\n";
    String uptime   = "172800\r\n";

    usize pageFileRuns = 0;

    auto run(const Vec<String>& argv) -> Result<CommandResult> override {
      const String& script = argv.back();

      if (script.contains("Win32_PageFileUsage")) {
        ++pageFileRuns;
        return CommandResult { .exitCode = 0, .stdOut = pageFile, .stdErr = {} };
      }

      if (script.contains("Lastbootuptime"))
        return CommandResult { .exitCode = 0, .stdOut = uptime, .stdErr = {} };

      if (script.contains("FreePhysicalMemory"))
        return CommandResult { .exitCode = 0, .stdOut = memory, .stdErr = {} };

      ERR(FactsErrorCode::NotFound, "unexpected script");
    }
  };
} // namespace

auto main() -> int {
  // Keep expected warnings out of the test output.
  SetRuntimeLogLevel(LogLevel::Error);

  "Factory selects the variant from the classifier"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier posix   = Rhel9();
    const os::OSClassifier windows = WindowsServer();

    const UniquePointer<facts::FactProvider> posixProvider   = facts::CreateFactProvider(posix, runner, probe);
    const UniquePointer<facts::FactProvider> windowsProvider = facts::CreateFactProvider(windows, runner, probe);

    expect(dynamic_cast<facts::PosixFactProvider*>(posixProvider.get()) != nullptr);
    expect(dynamic_cast<facts::WindowsFactProvider*>(windowsProvider.get()) != nullptr);
  };

  "POSIX provider with modern ifconfig"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.ipAddress() == String("10.0.0.5"));
    expect(provider.netmask() == String("255.255.255.0"));
    expect(provider.interfaces() == String("eth0,lo"));
    expect(provider.uptimeSeconds() == 90061_ll);
    expect(provider.uptimeHours() == 25_ll);
    expect(provider.uptimeDays() == 1_ll);
    expect(provider.memoryTotal() == 16384000_ll);
    expect(provider.memorySize() == 16384000_ll);
    expect(provider.memoryFree() == 2048000_ll);
    expect(provider.swapSize() == 2097152_ll);
    expect(provider.swapFree() == 1048576_ll);
    expect(provider.isSecurityEnforcementActive());
  };

  "POSIX provider with legacy ifconfig"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, LEGACY_IFCONFIG);

    const os::OSClassifier         classifier = Centos6();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.ipAddress() == String("192.168.1.10"));
    expect(provider.netmask() == String("255.255.255.0"));
    expect(provider.interfaces() == String("eth0,lo"));
  };

  "POSIX provider captures each snapshot once"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(runner.calls().size() == 3_ul);

    (void)provider.ipAddress();
    (void)provider.netmask();
    (void)provider.memoryFree();
    (void)provider.uptimeDays();

    expect(runner.calls().size() == 3_ul);
  };

  "POSIX provider falls back when ifconfig is missing"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    runner.succeed(DEFAULTS.uptimeCommand, "100.00 100.00\n").succeed(DEFAULTS.meminfoCommand, String(MEMINFO));

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.ipAddress() == String("10.1.2.3"));
    expect(provider.netmask() == String(facts::NOT_SUPPORTED));
    expect(provider.interfaces() == String(facts::NOT_SUPPORTED));
    expect(!provider.isSecurityEnforcementActive());
  };

  "POSIX provider keeps output of a failing command"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);
    runner.script(DEFAULTS.interfacesCommand, CommandResult { .exitCode = 1, .stdOut = String(MODERN_IFCONFIG), .stdErr = "partial" });

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.ipAddress() == String("10.0.0.5"));
  };

  "POSIX provider returns zero for unreadable uptime and memory"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    runner.succeed(DEFAULTS.interfacesCommand, String(MODERN_IFCONFIG)).succeed(DEFAULTS.uptimeCommand, "garbage");

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.uptimeSeconds() == 0_ll);
    expect(provider.memoryTotal() == 0_ll);
    expect(provider.swapFree() == 0_ll);
  };

  "POSIX provider lists only interfaces that are up by default"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(runner.calls().front() == Vec<String> { "ifconfig" });
    expect(provider.interfaces() == String("eth0,lo"));
  };

  "POSIX provider uses configured commands"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;

    facts::ProviderOptions options;
    options.interfacesCommand = { "/sbin/ifconfig", "-a" };

    runner.succeed(options.interfacesCommand, String(MODERN_IFCONFIG));

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe, options);

    expect(provider.ipAddress() == String("10.0.0.5"));
    expect(runner.calls().front() == Vec<String> { "/sbin/ifconfig", "-a" });
  };

  "SELinux disabled"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);
    runner.succeed(DEFAULTS.selinuxCommand, "SELinux status:                 disabled\n");

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(!provider.isSecurityEnforcementActive());
  };

  "Host facts derived from the probe"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.currentUser() == String("ambari"));
    expect(provider.kernelName() == String("Linux"));
    expect(provider.fullyQualifiedDomainName() == String("web01.example.com"));
    expect(provider.hostname() == String("web01"));
    expect(provider.domain() == String("example.com"));
    expect(provider.architecture() == String("x86_64"));
    expect(provider.operatingSystem() == String("rhel"));
    expect(provider.operatingSystemRelease() == String("9.3"));
    expect(provider.osFamily() == String("redhat"));
    expect(provider.timeZone() == String("UTC"));
    expect(provider.processorCount() == 8_ll);
    expect(provider.kernelRelease() == String("5.14.0-362.8.1.el9_3.x86_64"));
    expect(provider.kernelVersion() == String("5.14.0"));
    expect(provider.kernelMajorVersion() == String("5.14"));
    expect(provider.macAddress() == String("00:16:3E:5E:6C:00"));
  };

  "FQDN falls back to the host name"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    probe.canonical = None;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.fullyQualifiedDomainName() == String("web01"));
    expect(provider.hostname() == String("web01"));
    expect(provider.domain() == String(""));
  };

  "Architecture falls back when the OS reports none"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    probe.arch = "";
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.architecture() == String(facts::NOT_SUPPORTED));
  };

  "MAC address is UNKNOWN when reads disagree or fail"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    probe.nodes = { 0x020000000001ULL, 0x020000000002ULL };
    expect(provider.macAddress() == String(facts::UNKNOWN_MAC));

    probe.nodes.clear();
    expect(provider.macAddress() == String(facts::UNKNOWN_MAC));
  };

  "collectAll on POSIX has every key"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    const FactSet all = provider.collectAll();

    for (const StringView key : facts::COMMON_KEYS)
      expect(all.contains(key)) << String(key);

    expect(all.size() == facts::COMMON_KEYS.size() + 1);
    expect(all.at("selinux") == facts::FactValue(true));
    expect(all.at("swapsize") == facts::FactValue(String("2.00 GB")));
    expect(all.at("swapfree") == facts::FactValue(String("1.00 GB")));
    expect(all.at("memorytotal") == facts::FactValue(i64(16384000)));
    expect(all.at("uptime_seconds") == facts::FactValue(String("90061")));
    expect(all.at("uptime_hours") == facts::FactValue(String("25")));
    expect(all.at("uptime_days") == facts::FactValue(String("1")));
    expect(all.at("hardwareisa") == all.at("architecture"));
    expect(all.at("physicalprocessorcount") == facts::FactValue(i64(8)));
  };

  "collectAll is idempotent"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    ScriptPosix(runner, MODERN_IFCONFIG);

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    expect(provider.collectAll() == provider.collectAll());
  };

  "collectAll completes when every command fails"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;
    probe.address = None;

    const os::OSClassifier         classifier = Rhel9();
    const facts::PosixFactProvider provider(classifier, runner, probe);

    const FactSet all = provider.collectAll();

    for (const StringView key : facts::COMMON_KEYS)
      expect(all.contains(key)) << String(key);

    expect(all.at("ipaddress") == facts::FactValue(String("")));
    expect(all.at("netmask") == facts::FactValue(String(facts::NOT_SUPPORTED)));
    expect(all.at("swapsize") == facts::FactValue(String("0.00 GB")));
    expect(all.at("selinux") == facts::FactValue(false));
  };

  "Windows provider parses PowerShell tokens"_test = [] -> void {
    WindowsRunner runner;
    FakeHostProbe probe;

    const os::OSClassifier           classifier = WindowsServer();
    const facts::WindowsFactProvider provider(classifier, runner, probe);

    expect(provider.memoryFree() == 2048000_ll);
    expect(provider.memoryTotal() == 16384000_ll);
    expect(provider.memorySize() == 16384000_ll);
    expect(provider.swapSize() == 4096_ll);
    expect(provider.swapFree() == 3072_ll);
    expect(provider.uptimeSeconds() == 172800_ll);
    expect(provider.uptimeDays() == 2_ll);
    expect(provider.ipAddress() == String("10.1.2.3"));
    expect(provider.netmask() == String(facts::NOT_SUPPORTED));
    expect(provider.interfaces() == String(facts::NOT_SUPPORTED));
  };

  "Windows provider runs scripts through the configured prefix"_test = [] -> void {
    FakeCommandRunner runner;
    FakeHostProbe     probe;

    const os::OSClassifier           classifier = WindowsServer();
    const facts::WindowsFactProvider provider(classifier, runner, probe);

    (void)provider.uptimeSeconds();

    expect(runner.calls().size() == 1_ul);
    expect(runner.calls().front().size() == PowerShell("").size());
    expect(runner.calls().front().front() == String("powershell"));
  };

  "Windows provider returns zero on failures"_test = [] -> void {
    FakeHostProbe          probe;
    const os::OSClassifier classifier = WindowsServer();

    UniformPowerShellRunner missing(Result<CommandResult>(Err(FactsError(FactsErrorCode::NotFound, "powershell not found"))));
    UniformPowerShellRunner failed(CommandResult { .exitCode = 1, .stdOut = "12 34", .stdErr = "access denied" });
    UniformPowerShellRunner empty(CommandResult { .exitCode = 0, .stdOut = "\r\n", .stdErr = {} });
    UniformPowerShellRunner garbage(CommandResult { .exitCode = 0, .stdOut = "n/a n/a", .stdErr = {} });

    for (UniformPowerShellRunner* runner : { &missing, &failed, &empty, &garbage }) {
      const facts::WindowsFactProvider provider(classifier, *runner, probe);

      expect(provider.memoryFree() == 0_ll);
      expect(provider.swapSize() == 0_ll);
      expect(provider.uptimeSeconds() == 0_ll);
    }

    expect(garbage.lastScript().contains("Lastbootuptime"));
  };

  "collectAll on Windows has every key and converts swap from MB"_test = [] -> void {
    WindowsRunner runner;
    FakeHostProbe probe;

    const os::OSClassifier           classifier = WindowsServer();
    const facts::WindowsFactProvider provider(classifier, runner, probe);

    const FactSet all = provider.collectAll();

    for (const StringView key : facts::COMMON_KEYS)
      expect(all.contains(key)) << String(key);

    expect(!all.contains("selinux"));
    expect(all.size() == facts::COMMON_KEYS.size());
    expect(all.at("swapsize") == facts::FactValue(String("4.00 GB")));
    expect(all.at("swapfree") == facts::FactValue(String("3.00 GB")));
    expect(all.at("osfamily") == facts::FactValue(String("winsrv")));
    expect(all.at("uptime_days") == facts::FactValue(String("2")));
  };

  "collectAll on Windows queries the page file once per swap figure"_test = [] -> void {
    WindowsRunner runner;
    FakeHostProbe probe;

    const os::OSClassifier           classifier = WindowsServer();
    const facts::WindowsFactProvider provider(classifier, runner, probe);

    (void)provider.collectAll();

    expect(runner.pageFileRuns == 2_ul);
  };

  return 0;
}
