#include "HostFacts/Core/Parsers.hpp"

#include <cctype>      // std::isspace
#include <charconv>    // std::from_chars
#include <format>      // std::format

using namespace hostfacts::utils::types;
using enum hostfacts::utils::error::FactsErrorCode;
using hostfacts::core::os::NetToolsFormat;

namespace {
  // Four dotted octets.
  constexpr PCStr IPV4 = R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))";

  auto MakePattern(const StringView prefix, const StringView capture) -> std::regex {
    return std::regex(std::format("{}{}", prefix, capture), std::regex::ECMAScript | std::regex::optimize);
  }

  auto Trim(StringView text) -> StringView {
    while (!text.empty() && std::isspace(static_cast<u8>(text.front())))
      text.remove_prefix(1);

    while (!text.empty() && std::isspace(static_cast<u8>(text.back())))
      text.remove_suffix(1);

    return text;
  }
} // namespace

namespace hostfacts::core::parse {
  auto ExtractFirst(const StringView text, const std::regex& pattern) -> String {
    std::cmatch match;

    if (std::regex_search(text.data(), text.data() + text.size(), match, pattern) && match.size() > 1)
      return match[1].str();

    return {};
  }

  auto ExtractAll(const StringView text, const std::regex& pattern) -> String {
    String joined;

    for (std::cregex_iterator iter(text.data(), text.data() + text.size(), pattern), end; iter != end; ++iter) {
      if (iter->size() < 2)
        continue;

      if (!joined.empty())
        joined += ',';

      joined += (*iter)[1].str();
    }

    return joined;
  }

  auto IpAddressPattern(const NetToolsFormat format) -> const std::regex& {
    static const std::regex Legacy = MakePattern("(?: inet addr:)", IPV4);
    static const std::regex Modern = MakePattern("(?: inet )", IPV4);

    return format == NetToolsFormat::Modern ? Modern : Legacy;
  }

  auto NetmaskPattern(const NetToolsFormat format) -> const std::regex& {
    static const std::regex Legacy = MakePattern("(?: Mask:)", IPV4);
    static const std::regex Modern = MakePattern("(?: netmask )", IPV4);

    return format == NetToolsFormat::Modern ? Modern : Legacy;
  }

  auto InterfaceNamePattern(const NetToolsFormat format) -> const std::regex& {
    // '.' stops at line ends, so the marker has to be on the name's own line.
    static const std::regex Legacy(R"((\w+)(?:.*Link encap:))");
    static const std::regex Modern(R"((\w+)(?:.*flags=))");

    return format == NetToolsFormat::Modern ? Modern : Legacy;
  }

  auto IsSelinuxActive(const StringView sestatusOutput) -> bool {
    static const std::regex Active("(enforcing|permissive|enabled)");

    return std::regex_search(sestatusOutput.data(), sestatusOutput.data() + sestatusOutput.size(), Active);
  }

  auto ParseInteger(const StringView text) -> Result<i64> {
    const StringView trimmed = Trim(text);

    i64 value = 0;

    const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

    if (trimmed.empty() || errc != std::errc() || ptr != trimmed.data() + trimmed.size())
      ERR_FMT(ParseError, "'{}' is not an integer", trimmed);

    return value;
  }

  auto ParseUptimeSeconds(const StringView text) -> Result<i64> {
    static const std::regex FirstNumber(R"((\d+))");

    const String digits = ExtractFirst(text, FirstNumber);

    if (digits.empty())
      ERR(ParseError, "no number in uptime output");

    return ParseInteger(digits);
  }

  auto ParseMeminfoField(const StringView text, const StringView label) -> Result<i64> {
    const std::regex pattern(std::format(R"({}:.*?(\d+) .*)", label));

    const String digits = ExtractFirst(text, pattern);

    if (digits.empty())
      ERR_FMT(ParseError, "{} not found in meminfo output", label);

    return ParseInteger(digits);
  }

  auto SplitTokens(const StringView text) -> Vec<String> {
    Vec<String> tokens;
    usize       pos = 0;

    while (pos < text.size()) {
      while (pos < text.size() && std::isspace(static_cast<u8>(text[pos])))
        ++pos;

      const usize start = pos;

      while (pos < text.size() && !std::isspace(static_cast<u8>(text[pos])))
        ++pos;

      if (pos > start)
        tokens.emplace_back(text.substr(start, pos - start));
    }

    return tokens;
  }

  auto HostnameFromFqdn(const StringView fqdn) -> String {
    return String(fqdn.substr(0, fqdn.find('.')));
  }

  auto DomainFromFqdn(const StringView fqdn, const StringView hostname) -> String {
    String domain(fqdn);

    if (!hostname.empty())
      if (const usize pos = domain.find(hostname); pos != String::npos)
        domain.erase(pos, hostname.size());

    if (const usize dot = domain.find('.'); dot != String::npos)
      domain.erase(dot, 1);

    return domain;
  }

  auto KernelVersionFromRelease(const StringView release) -> String {
    return String(release.substr(0, release.find('-')));
  }

  auto KernelMajorVersion(const StringView version) -> String {
    const usize first = version.find('.');

    if (first == StringView::npos)
      return String(version);

    return String(version.substr(0, version.find('.', first + 1)));
  }

  auto FormatMacAddress(const u64 node) -> String {
    String formatted;

    for (i32 shift = 40; shift >= 0; shift -= 8) {
      if (!formatted.empty())
        formatted += ':';

      formatted += std::format("{:02X}", (node >> shift) & 0xFF);
    }

    return formatted;
  }

  auto ConvertKilobytesToGigabytes(const i64 kilobytes) -> String {
    return std::format("{:.2f} GB", static_cast<f64>(kilobytes) / (1024.0 * 1024.0));
  }

  auto ConvertMegabytesToGigabytes(const i64 megabytes) -> String {
    return std::format("{:.2f} GB", static_cast<f64>(megabytes) / 1024.0);
  }

  auto ConvertKilobytesToGigabytes(const StringView kilobytes) -> Result<String> {
    return ParseInteger(kilobytes).transform([](const i64 value) -> String { return ConvertKilobytesToGigabytes(value); });
  }

  auto ConvertMegabytesToGigabytes(const StringView megabytes) -> Result<String> {
    return ParseInteger(megabytes).transform([](const i64 value) -> String { return ConvertMegabytesToGigabytes(value); });
  }
} // namespace hostfacts::core::parse
