#include "CLI.hpp"

#include <glaze/glaze.hpp> // glz::write, glz::write_json, glz::format_error

#include <HostFacts/Utils/Error.hpp>

namespace hostfacts::cli {
  using namespace utils::types;
  using core::facts::FactSet;
  using core::facts::FactValue;
  using core::facts::RenderFactValue;
  using enum utils::error::FactsErrorCode;

  auto SelectFacts(const FactSet& facts, const Vec<String>& names) -> Result<FactSet> {
    if (names.empty())
      return facts;

    FactSet selected;

    for (const String& name : names) {
      const auto iter = facts.find(name);

      if (iter == facts.end())
        ERR_FMT(InvalidArgument, "Unknown fact '{}'", name);

      selected.insert(*iter);
    }

    return selected;
  }

  auto FormatPlain(const FactSet& facts) -> String {
    String output;

    for (const auto& [name, value] : facts) {
      if (!output.empty())
        output += '\n';

      output += std::format("{} => {}", name, RenderFactValue(value));
    }

    return output;
  }

  auto FormatJson(const FactSet& facts, const bool prettyJson) -> Result<String> {
    String jsonStr;

    const glz::error_ctx errorContext =
      prettyJson
      ? glz::write<glz::opts { .prettify = true }>(facts, jsonStr)
      : glz::write_json(facts, jsonStr);

    if (errorContext)
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }
} // namespace hostfacts::cli
