#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS
#include <format>  // std::format

#include <HostFacts/Core/Command.hpp>
#include <HostFacts/Core/FactProvider.hpp>
#include <HostFacts/Core/Host.hpp>
#include <HostFacts/Core/OSClassifier.hpp>

#include <HostFacts/Utils/ArgumentParser.hpp>
#include <HostFacts/Utils/Error.hpp>
#include <HostFacts/Utils/Logging.hpp>
#include <HostFacts/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"

#ifndef HOSTFACTS_VERSION
  #define HOSTFACTS_VERSION "0.0.0"
#endif

using namespace hostfacts::utils::types;
using namespace hostfacts::utils::logging;
using namespace hostfacts::config;
using namespace hostfacts::cli;

namespace command = hostfacts::core::command;
namespace facts   = hostfacts::core::facts;
namespace host    = hostfacts::core::host;
namespace os      = hostfacts::core::os;

struct CliOptions {
  // Output options
  bool jsonOutput = false;
  bool prettyJson = false;

  // Logging
  bool             verbose = false;
  Option<LogLevel> logLevel;

  // Overrides
  Option<String>        configPath;
  Option<NetworkFormat> networkFormat;

  Vec<String> facts;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  {
    using hostfacts::utils::argparse::ArgumentParser;
    using hostfacts::utils::argparse::ParseOutcome;

    ArgumentParser parser("hostfacts", std::format("hostfacts {}", HOSTFACTS_VERSION));

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag()
      .bindTo(opts.verbose);

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level. Overrides the config file.")
      .defaultValue(LogLevel::Info)
      .bindToEnum(opts.logLevel);

    parser
      .addArguments("--json")
      .help("Output facts as a JSON object.")
      .flag()
      .bindTo(opts.jsonOutput);

    parser
      .addArguments("--pretty")
      .help("Pretty-print JSON output. Only valid when --json is used.")
      .flag()
      .bindTo(opts.prettyJson);

    parser
      .addArguments("--config")
      .help("Read this configuration file instead of searching the default locations.")
      .defaultValue(String(""))
      .bindTo(opts.configPath);

    parser
      .addArguments("--network-format")
      .help("Force the ifconfig output dialect.")
      .defaultValue(NetworkFormat::Auto)
      .bindToEnum(opts.networkFormat);

    parser.positional("FACT", "Only print these facts.");

    const Result<ParseOutcome> outcome = parser.parseInto({ argv, static_cast<usize>(argc) });

    if (!outcome) {
      error_at(outcome.error());
      return EXIT_FAILURE;
    }

    if (*outcome == ParseOutcome::ShowHelp) {
      Println(parser.helpText());
      return EXIT_SUCCESS;
    }

    if (*outcome == ParseOutcome::ShowVersion) {
      Println(parser.version());
      return EXIT_SUCCESS;
    }

    opts.facts = parser.positionals();
  }

  // Command-line level first so config loading can already log.
  SetRuntimeLogLevel(opts.verbose ? LogLevel::Debug : opts.logLevel.value_or(LogLevel::Info));

  Result<Config> config = Config::load(opts.configPath);

  if (!config) {
    error_at(config.error());
    return EXIT_FAILURE;
  }

  if (!opts.verbose && !opts.logLevel && config->general.logLevel)
    SetRuntimeLogLevel(*config->general.logLevel);

  if (opts.networkFormat)
    config->network.format = *opts.networkFormat;

  Result<os::OSClassifier> classifier = os::OSClassifier::Detect();

  if (!classifier) {
    error_at(classifier.error());
    return EXIT_FAILURE;
  }

  if (const Option<os::NetToolsFormat> forced = config->network.forcedFormat())
    classifier->overrideNetToolsFormat(*forced);

  command::ProcessCommandRunner runner;
  host::SystemHostProbe         probe;

  const UniquePointer<facts::FactProvider> provider =
    facts::CreateFactProvider(*classifier, runner, probe, config->commands);

  Result<facts::FactSet> selected = SelectFacts(provider->collectAll(), opts.facts);

  if (!selected) {
    error_at(selected.error());
    return EXIT_FAILURE;
  }

  if (opts.jsonOutput) {
    Result<String> json = FormatJson(*selected, opts.prettyJson);

    if (!json) {
      error_at(json.error());
      return EXIT_FAILURE;
    }

    Println(*json);
  } else if (!selected->empty())
    Println(FormatPlain(*selected));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
