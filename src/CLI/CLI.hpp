/**
 * @file CLI.hpp
 * @brief Output helpers for the hostfacts CLI.
 */

#pragma once

#include <HostFacts/Core/FactSet.hpp>

#include <HostFacts/Utils/Types.hpp>

namespace hostfacts::cli {
  /**
   * @brief Restricts a fact set to the requested names.
   * @param facts Full fact set
   * @param names Requested fact names; empty keeps every fact
   * @return The subset, or `InvalidArgument` naming the first unknown fact
   */
  auto SelectFacts(const core::facts::FactSet& facts, const utils::types::Vec<utils::types::String>& names)
    -> utils::types::Result<core::facts::FactSet>;

  /**
   * @brief Renders facts as `name => value` lines, sorted by name.
   */
  auto FormatPlain(const core::facts::FactSet& facts) -> utils::types::String;

  /**
   * @brief Renders facts as a JSON object.
   * @param facts Facts to serialize
   * @param prettyJson Whether to indent the output
   */
  auto FormatJson(const core::facts::FactSet& facts, bool prettyJson) -> utils::types::Result<utils::types::String>;
} // namespace hostfacts::cli
