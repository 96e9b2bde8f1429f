/**
 * @file Parsers.hpp
 * @brief Pure text rules that turn raw tool output into fact values.
 *
 * Nothing in here touches the host; every function operates on the strings
 * it is given, so each rule can be checked against captured tool output.
 */

#pragma once

#include <regex> // std::regex

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

#include "OSClassifier.hpp"

namespace hostfacts::core::parse {
  namespace types = ::hostfacts::utils::types;

  // ─────────────────────────────────────────────────────────────────────────────
  // Regex extraction
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief First capture group of the first match of `pattern` in `text`.
   * @return The capture, or an empty string when nothing matches.
   */
  auto ExtractFirst(types::StringView text, const std::regex& pattern) -> types::String;

  /**
   * @brief First capture group of every match, joined with ','.
   * @return e.g. "eth0,lo", or an empty string when nothing matches.
   */
  auto ExtractAll(types::StringView text, const std::regex& pattern) -> types::String;

  /// IPv4 address following the `inet` marker of an interface listing.
  auto IpAddressPattern(os::NetToolsFormat format) -> const std::regex&;

  /// IPv4 netmask following the `Mask:`/`netmask` marker.
  auto NetmaskPattern(os::NetToolsFormat format) -> const std::regex&;

  /// Interface name at the start of a `Link encap:`/`flags=` line.
  auto InterfaceNamePattern(os::NetToolsFormat format) -> const std::regex&;

  /// Whether `sestatus` output reports SELinux as enabled, enforcing or permissive.
  auto IsSelinuxActive(types::StringView sestatusOutput) -> bool;

  // ─────────────────────────────────────────────────────────────────────────────
  // Numbers
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Parses a whole string (surrounding whitespace allowed) as a base-10 integer.
   * @return The value, or `ParseError`.
   */
  auto ParseInteger(types::StringView text) -> types::Result<types::i64>;

  /**
   * @brief Seconds since boot from `/proc/uptime` ("12345.67 54321.00").
   * @return The first integer in the text, or `ParseError` when there is none.
   */
  auto ParseUptimeSeconds(types::StringView text) -> types::Result<types::i64>;

  /**
   * @brief Reads one kB field from `/proc/meminfo`.
   * @param text The whole file.
   * @param label Field name without the colon, e.g. "MemTotal".
   * @return The numeric value, or `ParseError` when the field is absent.
   */
  auto ParseMeminfoField(types::StringView text, types::StringView label) -> types::Result<types::i64>;

  /// Splits on runs of whitespace, dropping empty tokens.
  auto SplitTokens(types::StringView text) -> types::Vec<types::String>;

  // ─────────────────────────────────────────────────────────────────────────────
  // Names and versions
  // ─────────────────────────────────────────────────────────────────────────────

  /// Everything before the first '.' ("web01.example.com" -> "web01").
  auto HostnameFromFqdn(types::StringView fqdn) -> types::String;

  /**
   * @brief The domain part of an FQDN.
   *
   * Removes the first occurrence of `hostname` anywhere in `fqdn`, then the
   * first '.' of what is left. For "foo.foo.example.com" with host "foo" the
   * result is "foo.example.com".
   */
  auto DomainFromFqdn(types::StringView fqdn, types::StringView hostname) -> types::String;

  /// Kernel release without its build tag ("5.14.0-362.el9" -> "5.14.0").
  auto KernelVersionFromRelease(types::StringView release) -> types::String;

  /// First two components of a dotted version ("5.14.0" -> "5.14").
  auto KernelMajorVersion(types::StringView version) -> types::String;

  /// 48-bit address as "AA:BB:CC:DD:EE:FF", most significant byte first.
  auto FormatMacAddress(types::u64 node) -> types::String;

  // ─────────────────────────────────────────────────────────────────────────────
  // Unit conversion
  // ─────────────────────────────────────────────────────────────────────────────

  /// kB to "x.yz GB" (divisor 1024²).
  auto ConvertKilobytesToGigabytes(types::i64 kilobytes) -> types::String;

  /// MB to "x.yz GB" (divisor 1024).
  auto ConvertMegabytesToGigabytes(types::i64 megabytes) -> types::String;

  /// Same as the integer overload for raw tool output; `ParseError` if not numeric.
  auto ConvertKilobytesToGigabytes(types::StringView kilobytes) -> types::Result<types::String>;

  /// Same as the integer overload for raw tool output; `ParseError` if not numeric.
  auto ConvertMegabytesToGigabytes(types::StringView megabytes) -> types::Result<types::String>;
} // namespace hostfacts::core::parse
