#include <boost/ut.hpp>

#include <HostFacts/Core/OSClassifier.hpp>
#include <HostFacts/Core/Parsers.hpp>

#include <HostFacts/Utils/Types.hpp>

using namespace boost::ut;
using namespace hostfacts::core::parse;
using namespace hostfacts::utils::types;
using hostfacts::core::os::NetToolsFormat;

namespace {
  constexpr StringView LEGACY_IFCONFIG =
    "eth0      Link encap:Ethernet  HWaddr 00:16:3E:5E:6C:00\n"
    "          inet addr:192.168.1.10  Bcast:192.168.1.255  Mask:255.255.255.0\n"
    "          UP BROADCAST RUNNING MULTICAST  MTU:1500  Metric:1\n"
    "\n"
    "lo        Link encap:Local Loopback\n"
    "          inet addr:127.0.0.1  Mask:255.0.0.0\n"
    "          UP LOOPBACK RUNNING  MTU:65536  Metric:1\n";

  constexpr StringView MODERN_IFCONFIG =
    "eth0: flags=4163<UP,BROADCAST,RUNNING,MULTICAST>  mtu 1500\n"
    "        inet 10.0.0.5  netmask 255.255.255.0  broadcast 10.0.0.255\n"
    "        ether 52:54:00:12:34:56  txqueuelen 1000  (Ethernet)\n"
    "\n"
    "lo: flags=73<UP,LOOPBACK,RUNNING>  mtu 65536\n"
    "        inet 127.0.0.1  netmask 255.0.0.0\n";

  constexpr StringView MEMINFO =
    "MemTotal:       16384000 kB\n"
    "MemFree:         2048000 kB\n"
    "MemAvailable:    8000000 kB\n"
    "SwapTotal:       2097152 kB\n"
    "SwapFree:        1048576 kB\n";
} // namespace

auto main() -> int {
  "Legacy ifconfig output"_test = [] -> void {
    expect(ExtractFirst(LEGACY_IFCONFIG, IpAddressPattern(NetToolsFormat::Legacy)) == String("192.168.1.10"));
    expect(ExtractFirst(LEGACY_IFCONFIG, NetmaskPattern(NetToolsFormat::Legacy)) == String("255.255.255.0"));
    expect(ExtractAll(LEGACY_IFCONFIG, InterfaceNamePattern(NetToolsFormat::Legacy)) == String("eth0,lo"));
  };

  "Modern ifconfig output"_test = [] -> void {
    expect(ExtractFirst(MODERN_IFCONFIG, IpAddressPattern(NetToolsFormat::Modern)) == String("10.0.0.5"));
    expect(ExtractFirst(MODERN_IFCONFIG, NetmaskPattern(NetToolsFormat::Modern)) == String("255.255.255.0"));
    expect(ExtractAll(MODERN_IFCONFIG, InterfaceNamePattern(NetToolsFormat::Modern)) == String("eth0,lo"));
  };

  "Mismatched format finds nothing"_test = [] -> void {
    expect(ExtractFirst(MODERN_IFCONFIG, IpAddressPattern(NetToolsFormat::Legacy)).empty());
    expect(ExtractFirst(LEGACY_IFCONFIG, NetmaskPattern(NetToolsFormat::Modern)).empty());
    expect(ExtractAll(MODERN_IFCONFIG, InterfaceNamePattern(NetToolsFormat::Legacy)).empty());
  };

  "Uptime parsing"_test = [] -> void {
    expect(ParseUptimeSeconds("12345.67 54321.00\n") == 12345);
    expect(ParseUptimeSeconds("90061.02 1.00") == 90061);
    expect(!ParseUptimeSeconds("").has_value());
    expect(!ParseUptimeSeconds("n/a").has_value());
  };

  "Meminfo parsing"_test = [] -> void {
    expect(ParseMeminfoField(MEMINFO, "MemTotal") == 16384000);
    expect(ParseMeminfoField(MEMINFO, "MemFree") == 2048000);
    expect(ParseMeminfoField(MEMINFO, "SwapTotal") == 2097152);
    expect(ParseMeminfoField(MEMINFO, "SwapFree") == 1048576);

    const Result<i64> missing = ParseMeminfoField(MEMINFO, "Hugepagesize");

    expect(!missing.has_value());
    expect(missing.error().code == hostfacts::utils::error::FactsErrorCode::ParseError);
  };

  "Integer parsing"_test = [] -> void {
    expect(ParseInteger(" 42\n") == 42);
    expect(ParseInteger("-7") == Result<i64>(-7));
    expect(!ParseInteger("").has_value());
    expect(!ParseInteger("12abc").has_value());
  };

  "Token splitting"_test = [] -> void {
    expect(SplitTokens("  2048000   16384000 \r\n") == Vec<String> { "2048000", "16384000" });
    expect(SplitTokens("ifconfig -a") == Vec<String> { "ifconfig", "-a" });
    expect(SplitTokens("   ").empty());
  };

  "Unit conversion"_test = [] -> void {
    expect(ConvertKilobytesToGigabytes(2097152) == String("2.00 GB"));
    expect(ConvertKilobytesToGigabytes(1572864) == String("1.50 GB"));
    expect(ConvertKilobytesToGigabytes(0) == String("0.00 GB"));
    expect(ConvertMegabytesToGigabytes(2048) == String("2.00 GB"));
    expect(ConvertMegabytesToGigabytes(512) == String("0.50 GB"));
  };

  "Unit conversion from raw output"_test = [] -> void {
    const Result<String> converted = ConvertKilobytesToGigabytes(StringView("2097152"));

    expect(converted.has_value());
    expect(*converted == String("2.00 GB"));

    const Result<String> invalid = ConvertMegabytesToGigabytes(StringView("lots"));

    expect(!invalid.has_value());
    expect(invalid.error().code == hostfacts::utils::error::FactsErrorCode::ParseError);
  };

  "Hostname and domain from FQDN"_test = [] -> void {
    expect(HostnameFromFqdn("web01.example.com") == String("web01"));
    expect(HostnameFromFqdn("localhost") == String("localhost"));

    expect(DomainFromFqdn("web01.example.com", "web01") == String("example.com"));
    expect(DomainFromFqdn("localhost", "localhost") == String(""));
    // Only the first occurrence of the host name is removed.
    expect(DomainFromFqdn("foo.foo.example.com", "foo") == String("foo.example.com"));
  };

  "Kernel version strings"_test = [] -> void {
    expect(KernelVersionFromRelease("5.14.0-362.8.1.el9_3.x86_64") == String("5.14.0"));
    expect(KernelVersionFromRelease("6.1.0") == String("6.1.0"));
    expect(KernelMajorVersion("5.14.0") == String("5.14"));
    expect(KernelMajorVersion("10.0.20348") == String("10.0"));
    expect(KernelMajorVersion("6") == String("6"));
  };

  "MAC address formatting"_test = [] -> void {
    expect(FormatMacAddress(0x00163E5E6C00ULL) == String("00:16:3E:5E:6C:00"));
    expect(FormatMacAddress(0xABCDEF012345ULL) == String("AB:CD:EF:01:23:45"));
  };

  "SELinux status detection"_test = [] -> void {
    expect(IsSelinuxActive("SELinux status:                 enabled\nCurrent mode:                   enforcing\n"));
    expect(IsSelinuxActive("Current mode: permissive"));
    expect(!IsSelinuxActive("SELinux status:                 disabled\n"));
    expect(!IsSelinuxActive(""));
  };

  return 0;
}
