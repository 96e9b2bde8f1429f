/**
 * @file FactSet.hpp
 * @brief The flat fact-name to value mapping returned by a fact provider.
 */

#pragma once

#include <format> // std::format

#include "../Utils/Types.hpp"

namespace hostfacts::core::facts {
  namespace types = ::hostfacts::utils::types;

  /**
   * @brief A single fact value.
   *
   * Integers are kept in the units the host reports (kB for memory, seconds
   * for uptime); only the swap figures are pre-rendered into "x.yz GB" strings.
   */
  using FactValue = types::Variant<types::String, types::i64, bool>;

  /// Fact name to value, ordered by name.
  using FactSet = types::Map<types::String, FactValue>;

  /// Sentinel for facts the current OS cannot provide.
  inline constexpr types::StringView NOT_SUPPORTED = "OS NOT SUPPORTED";

  /// Sentinel for a hardware address that could not be read reliably.
  inline constexpr types::StringView UNKNOWN_MAC = "UNKNOWN";

  namespace keys {
    inline constexpr types::StringView Id                     = "id";
    inline constexpr types::StringView Kernel                 = "kernel";
    inline constexpr types::StringView Domain                 = "domain";
    inline constexpr types::StringView Fqdn                   = "fqdn";
    inline constexpr types::StringView Hostname               = "hostname";
    inline constexpr types::StringView MacAddress             = "macaddress";
    inline constexpr types::StringView Architecture           = "architecture";
    inline constexpr types::StringView OperatingSystem        = "operatingsystem";
    inline constexpr types::StringView OperatingSystemRelease = "operatingsystemrelease";
    inline constexpr types::StringView PhysicalProcessorCount = "physicalprocessorcount";
    inline constexpr types::StringView ProcessorCount         = "processorcount";
    inline constexpr types::StringView TimeZone               = "timezone";
    inline constexpr types::StringView HardwareIsa            = "hardwareisa";
    inline constexpr types::StringView HardwareModel          = "hardwaremodel";
    inline constexpr types::StringView KernelRelease          = "kernelrelease";
    inline constexpr types::StringView KernelVersion          = "kernelversion";
    inline constexpr types::StringView OsFamily               = "osfamily";
    inline constexpr types::StringView KernelMajVersion       = "kernelmajversion";
    inline constexpr types::StringView IpAddress              = "ipaddress";
    inline constexpr types::StringView Netmask                = "netmask";
    inline constexpr types::StringView Interfaces             = "interfaces";
    inline constexpr types::StringView UptimeSeconds          = "uptime_seconds";
    inline constexpr types::StringView UptimeHours            = "uptime_hours";
    inline constexpr types::StringView UptimeDays             = "uptime_days";
    inline constexpr types::StringView MemorySize             = "memorysize";
    inline constexpr types::StringView MemoryFree             = "memoryfree";
    inline constexpr types::StringView MemoryTotal            = "memorytotal";
    inline constexpr types::StringView Selinux                = "selinux";
    inline constexpr types::StringView SwapSize               = "swapsize";
    inline constexpr types::StringView SwapFree               = "swapfree";
  } // namespace keys

  /// Every key produced on both OS families.
  inline constexpr types::Array<types::StringView, 29> COMMON_KEYS = {
    keys::Id,
    keys::Kernel,
    keys::Domain,
    keys::Fqdn,
    keys::Hostname,
    keys::MacAddress,
    keys::Architecture,
    keys::OperatingSystem,
    keys::OperatingSystemRelease,
    keys::PhysicalProcessorCount,
    keys::ProcessorCount,
    keys::TimeZone,
    keys::HardwareIsa,
    keys::HardwareModel,
    keys::KernelRelease,
    keys::KernelVersion,
    keys::OsFamily,
    keys::KernelMajVersion,
    keys::IpAddress,
    keys::Netmask,
    keys::Interfaces,
    keys::UptimeSeconds,
    keys::UptimeHours,
    keys::UptimeDays,
    keys::MemorySize,
    keys::MemoryFree,
    keys::MemoryTotal,
    keys::SwapSize,
    keys::SwapFree,
  };

  /**
   * @brief Renders a fact value for display.
   * @return The string as-is, integers in decimal, booleans as "true"/"false".
   */
  inline auto RenderFactValue(const FactValue& value) -> types::String {
    return std::visit(
      []<typename T>(const T& val) -> types::String {
        if constexpr (std::is_same_v<T, types::String>)
          return val;
        else if constexpr (std::is_same_v<T, bool>)
          return val ? "true" : "false";
        else
          return std::format("{}", val);
      },
      value
    );
  }
} // namespace hostfacts::core::facts
