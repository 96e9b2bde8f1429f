#pragma once

#include <filesystem> // std::filesystem::path

#include <HostFacts/Core/FactProvider.hpp>
#include <HostFacts/Core/OSClassifier.hpp>

#include <HostFacts/Utils/Error.hpp>
#include <HostFacts/Utils/Logging.hpp>
#include <HostFacts/Utils/Types.hpp>

namespace hostfacts::config {
  namespace types = ::hostfacts::utils::types;

  /**
   * @enum NetworkFormat
   * @brief Which `ifconfig` dialect to parse.
   */
  enum class NetworkFormat : types::u8 {
    Auto,   ///< Decided by the OS classifier.
    Legacy, ///< Force `inet addr:` / `Mask:` / `Link encap:`.
    Modern, ///< Force `inet ` / `netmask ` / `flags=`.
  };

  /**
   * @struct General
   * @brief `[general]` table.
   */
  struct General {
    types::Option<utils::logging::LogLevel> logLevel; ///< Unset means the CLI default (info).
  };

  /**
   * @struct Network
   * @brief `[network]` table.
   */
  struct Network {
    NetworkFormat format = NetworkFormat::Auto;

    /// The forced format, or None when the classifier should decide.
    [[nodiscard]] auto forcedFormat() const -> types::Option<core::os::NetToolsFormat>;
  };

  /**
   * @struct Config
   * @brief Settings read from `config.toml`.
   *
   * Every key is optional; missing keys keep the defaults below.
   */
  struct Config {
    General                     general;
    Network                     network;
    core::facts::ProviderOptions commands; ///< `[commands]` table, each value split on whitespace.

    /**
     * @brief Finds the configuration file.
     *
     * Looks at, in order:
     *  - Windows: `%LOCALAPPDATA%\hostfacts\config.toml`, `%APPDATA%\hostfacts\config.toml`
     *  - Others: `$XDG_CONFIG_HOME/hostfacts/config.toml`, `$HOME/.config/hostfacts/config.toml`
     *  - `./config.toml`
     *
     * @return The first path that exists, or None.
     */
    static auto getConfigPath() -> types::Option<std::filesystem::path>;

    /**
     * @brief Parses TOML text.
     * @return The configuration, or `ConfigurationError` for malformed TOML or unknown enum values.
     */
    static auto fromToml(types::StringView text) -> types::Result<Config>;

    /**
     * @brief Loads the configuration.
     * @param explicitPath Path given on the command line; must exist when set.
     * @return Defaults when no file is found, otherwise the parsed file.
     */
    static auto load(const types::Option<std::filesystem::path>& explicitPath) -> types::Result<Config>;
  };
} // namespace hostfacts::config
