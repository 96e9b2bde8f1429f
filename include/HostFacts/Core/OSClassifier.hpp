/**
 * @file OSClassifier.hpp
 * @brief Classifies the running operating system into type, version and family.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace hostfacts::core::os {
  namespace types = ::hostfacts::utils::types;

  /**
   * @enum NetToolsFormat
   * @brief Output dialect of the interface listing tool (`ifconfig`).
   */
  enum class NetToolsFormat : types::u8 {
    Legacy, ///< net-tools 1.60: `Link encap:`, `inet addr:`, `Mask:`
    Modern, ///< net-tools 2.x: `flags=`, `inet `, `netmask `
  };

  namespace family {
    inline constexpr types::StringView RedHat  = "redhat";
    inline constexpr types::StringView Ubuntu  = "ubuntu";
    inline constexpr types::StringView Suse    = "suse";
    inline constexpr types::StringView WinSrv  = "winsrv";
    inline constexpr types::StringView Unknown = "unknown";
  } // namespace family

  /**
   * @struct OsDescription
   * @brief Everything the classifier reports about the host OS.
   */
  struct OsDescription {
    types::String  type;      ///< Distribution or product id, e.g. "centos", "ubuntu", "windows".
    types::String  version;   ///< Version string, e.g. "7.9.2009", "22.04", "10.0.20348".
    types::String  family;    ///< One of the `family::` names.
    NetToolsFormat netTools = NetToolsFormat::Legacy;
    bool           windows  = false;
  };

  /**
   * @brief Read-only view of the host OS classification.
   */
  class IOSClassifier {
   public:
    IOSClassifier()                                        = default;
    IOSClassifier(const IOSClassifier&)                    = default;
    IOSClassifier(IOSClassifier&&)                         = default;
    auto operator=(const IOSClassifier&) -> IOSClassifier& = default;
    auto operator=(IOSClassifier&&) -> IOSClassifier&      = default;
    virtual ~IOSClassifier()                               = default;

    [[nodiscard]] virtual auto osType() const -> types::String           = 0;
    [[nodiscard]] virtual auto osVersion() const -> types::String        = 0;
    [[nodiscard]] virtual auto osFamily() const -> types::String         = 0;
    [[nodiscard]] virtual auto netToolsFormat() const -> NetToolsFormat  = 0;
    [[nodiscard]] virtual auto isWindows() const -> bool                 = 0;
  };

  /**
   * @brief Classifier backed by a fixed description.
   *
   * Built from the running host with Detect(), or from explicit values.
   */
  class OSClassifier final : public IOSClassifier {
   public:
    explicit OSClassifier(OsDescription description)
      : m_description(std::move(description)) {}

    /**
     * @brief Classifies the running host.
     *
     * @details
     *  - Linux/BSD: parses `/etc/os-release`, falling back to `/usr/lib/os-release`
     *  - Windows: `RtlGetVersion`
     *
     * @return The classifier, or `NotFound`/`ParseError` if no release file can be used.
     */
    static auto Detect() -> types::Result<OSClassifier>;

    /// Replaces the detected interface listing format.
    auto overrideNetToolsFormat(NetToolsFormat format) -> types::Unit {
      m_description.netTools = format;
    }

    [[nodiscard]] auto osType() const -> types::String override {
      return m_description.type;
    }

    [[nodiscard]] auto osVersion() const -> types::String override {
      return m_description.version;
    }

    [[nodiscard]] auto osFamily() const -> types::String override {
      return m_description.family;
    }

    [[nodiscard]] auto netToolsFormat() const -> NetToolsFormat override {
      return m_description.netTools;
    }

    [[nodiscard]] auto isWindows() const -> bool override {
      return m_description.windows;
    }

    [[nodiscard]] auto description() const -> const OsDescription& {
      return m_description;
    }

   private:
    OsDescription m_description;
  };

  /**
   * @struct OsRelease
   * @brief The os-release fields the classifier needs.
   */
  struct OsRelease {
    types::String id;
    types::String idLike;
    types::String versionId;
    types::String name;
  };

  /**
   * @brief Parses the contents of an os-release file.
   * @return The fields, or `ParseError` when `ID` is missing or empty.
   */
  auto ParseOsRelease(types::StringView content) -> types::Result<OsRelease>;

  /**
   * @brief Maps an os-release `ID` (and `ID_LIKE` as fallback) to a family name.
   * @return One of `family::RedHat`, `family::Ubuntu`, `family::Suse`, or `family::Unknown`.
   */
  auto ClassifyFamily(types::StringView id, types::StringView idLike) -> types::String;

  /**
   * @brief Decides which `ifconfig` dialect a distribution ships.
   *
   * net-tools 2.x is the default from RHEL/CentOS 7, Debian 9, Ubuntu 18.04 and SLES 15 on.
   */
  auto ResolveNetToolsFormat(types::StringView familyName, types::StringView type, types::StringView version) -> NetToolsFormat;

  /// Combines the three helpers above into a full description.
  auto DescribeOsRelease(const OsRelease& release) -> OsDescription;
} // namespace hostfacts::core::os
