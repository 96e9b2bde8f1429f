#include "HostFacts/Core/OSClassifier.hpp"

#include <charconv>    // std::from_chars
#include <matchit.hpp> // matchit::{match, is, or_, meet, _}
#include <ranges>      // std::views::split

#include "HostFacts/Utils/Logging.hpp"

using namespace hostfacts::utils::types;
using enum hostfacts::utils::error::FactsErrorCode;

namespace {
  auto Unquote(StringView value) -> String {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\'')))
      value = value.substr(1, value.size() - 2);

    return String(value);
  }

  auto MajorVersion(const StringView version) -> i32 {
    i32 major = 0;
    std::from_chars(version.data(), version.data() + version.size(), major);
    return major;
  }
} // namespace

namespace hostfacts::core::os {
  auto ParseOsRelease(const StringView content) -> Result<OsRelease> {
    OsRelease release;

    for (const auto part : content | std::views::split('\n')) {
      StringView line(part.begin(), part.end());

      if (line.ends_with('\r'))
        line.remove_suffix(1);

      if (line.starts_with("ID="))
        release.id = Unquote(line.substr(3));
      else if (line.starts_with("ID_LIKE="))
        release.idLike = Unquote(line.substr(8));
      else if (line.starts_with("VERSION_ID="))
        release.versionId = Unquote(line.substr(11));
      else if (line.starts_with("NAME="))
        release.name = Unquote(line.substr(5));
      else if (line.starts_with("PRETTY_NAME=") && release.name.empty())
        release.name = Unquote(line.substr(12));
    }

    if (release.id.empty())
      ERR(ParseError, "ID not found in os-release");

    return release;
  }

  auto ClassifyFamily(const StringView id, const StringView idLike) -> String {
    using namespace matchit;

    const auto familyOf = [](const StringView candidate) -> StringView {
      return match(candidate)(
        is | or_("rhel", "centos", "fedora", "rocky", "almalinux", "ol", "amzn", "redhat", "scientific", "cloudlinux") = family::RedHat,
        is | or_("ubuntu", "debian")                                                                                = family::Ubuntu,
        is | or_("sles", "sled", "suse")                                                                            = family::Suse,
        is | meet([](const StringView name) -> bool { return name.starts_with("opensuse"); })                       = family::Suse,
        is | _                                                                                                      = family::Unknown
      );
    };

    if (const StringView direct = familyOf(id); direct != family::Unknown)
      return String(direct);

    for (const auto part : idLike | std::views::split(' ')) {
      const StringView like(part.begin(), part.end());

      if (const StringView inherited = familyOf(like); inherited != family::Unknown)
        return String(inherited);
    }

    return String(family::Unknown);
  }

  auto ResolveNetToolsFormat(const StringView familyName, const StringView type, const StringView version) -> NetToolsFormat {
    using namespace matchit;
    using enum NetToolsFormat;

    const i32 major = MajorVersion(version);

    if (familyName == family::RedHat)
      return type == "fedora" || type == "amzn" || major >= 7 ? Modern : Legacy;

    if (familyName == family::Ubuntu)
      return match(type)(
        is | "ubuntu" = (major >= 18 ? Modern : Legacy),
        is | _        = (major >= 9 ? Modern : Legacy)
      );

    if (familyName == family::Suse)
      return major >= 15 ? Modern : Legacy;

    return Modern;
  }

  auto DescribeOsRelease(const OsRelease& release) -> OsDescription {
    String familyName = ClassifyFamily(release.id, release.idLike);

    debug_log("classified {} {} as family {}", release.id, release.versionId, familyName);

    return OsDescription {
      .type     = release.id,
      .version  = release.versionId,
      .family   = familyName,
      .netTools = ResolveNetToolsFormat(familyName, release.id, release.versionId),
      .windows  = false,
    };
  }
} // namespace hostfacts::core::os
