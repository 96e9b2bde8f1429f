#include "Config.hpp"

#include <glaze/toml.hpp>            // glz::read, glz::format_error, glz::file_to_buffer
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_cast
#include <system_error>              // std::error_code

#include <HostFacts/Core/Parsers.hpp>

#include <HostFacts/Utils/Env.hpp>

namespace fs = std::filesystem;

using namespace hostfacts::utils::types;
using enum hostfacts::utils::error::FactsErrorCode;
using hostfacts::utils::env::GetEnv;

// Intermediate structs for TOML parsing with glaze.
// Empty strings stand for "not provided".
namespace {
  struct TomlGeneral {
    String logLevel;
  };

  struct TomlNetwork {
    String format;
  };

  struct TomlCommands {
    String ifconfig;
    String uptime;
    String meminfo;
    String sestatus;
    String powershell;
  };

  struct TomlConfig {
    TomlGeneral  general;
    TomlNetwork  network;
    TomlCommands commands;
  };

  template <typename EnumType>
  auto ParseEnum(const StringView key, const StringView value) -> Result<EnumType> {
    const Option<EnumType> parsed = magic_enum::enum_cast<EnumType>(value, magic_enum::case_insensitive);

    if (!parsed)
      ERR_FMT(ConfigurationError, "Invalid value '{}' for {}", value, key);

    return *parsed;
  }

  auto ApplyCommand(const String& configured, Vec<String>& target) -> Unit {
    if (Vec<String> argv = hostfacts::core::parse::SplitTokens(configured); !argv.empty())
      target = std::move(argv);
  }
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object("log_level", &T::logLevel);
};

template <>
struct glz::meta<TomlNetwork> {
  using T                     = TomlNetwork;
  static constexpr auto value = object("format", &T::format);
};

template <>
struct glz::meta<TomlCommands> {
  using T                     = TomlCommands;
  static constexpr auto value = object(
    "ifconfig",
    &T::ifconfig,
    "uptime",
    &T::uptime,
    "meminfo",
    &T::meminfo,
    "sestatus",
    &T::sestatus,
    "powershell",
    &T::powershell
  );
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general, "network", &T::network, "commands", &T::commands);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace hostfacts::config {
  auto Network::forcedFormat() const -> Option<core::os::NetToolsFormat> {
    switch (format) {
      case NetworkFormat::Legacy: return core::os::NetToolsFormat::Legacy;
      case NetworkFormat::Modern: return core::os::NetToolsFormat::Modern;
      case NetworkFormat::Auto:   return None;
    }

    return None;
  }

  auto Config::getConfigPath() -> Option<fs::path> {
    Vec<fs::path> possiblePaths;

#ifdef _WIN32
    if (Result<String> result = GetEnv("LOCALAPPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "hostfacts" / "config.toml");

    if (Result<String> result = GetEnv("APPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "hostfacts" / "config.toml");
#else
    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "hostfacts" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "hostfacts" / "config.toml");
#endif

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::fromToml(const StringView text) -> Result<Config> {
    if (core::parse::SplitTokens(text).empty())
      return Config {};

    TomlConfig tomlCfg;
    String     buffer(text);

    // Unknown tables and keys are ignored so older binaries accept newer files.
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer); readError)
      ERR_FMT(ConfigurationError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    Config cfg;

    if (!tomlCfg.general.logLevel.empty())
      cfg.general.logLevel = TRY(ParseEnum<utils::logging::LogLevel>("general.log_level", tomlCfg.general.logLevel));

    if (!tomlCfg.network.format.empty())
      cfg.network.format = TRY(ParseEnum<NetworkFormat>("network.format", tomlCfg.network.format));

    ApplyCommand(tomlCfg.commands.ifconfig, cfg.commands.interfacesCommand);
    ApplyCommand(tomlCfg.commands.uptime, cfg.commands.uptimeCommand);
    ApplyCommand(tomlCfg.commands.meminfo, cfg.commands.meminfoCommand);
    ApplyCommand(tomlCfg.commands.sestatus, cfg.commands.selinuxCommand);
    ApplyCommand(tomlCfg.commands.powershell, cfg.commands.powershellPrefix);

    return cfg;
  }

  auto Config::load(const Option<fs::path>& explicitPath) -> Result<Config> {
    const Option<fs::path> configPath = explicitPath ? explicitPath : getConfigPath();

    if (!configPath) {
      debug_log("No config file found, using defaults");
      return Config {};
    }

    String buffer;

    if (const auto fileError = glz::file_to_buffer(buffer, configPath->string()); bool(fileError))
      ERR_FMT(ConfigurationError, "Failed to read config file {}", configPath->string());

    Result<Config> cfg = fromToml(buffer);

    if (cfg)
      debug_log("Config loaded from {}", configPath->string());

    return cfg;
  }
} // namespace hostfacts::config
