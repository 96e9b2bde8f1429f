/**
 * @file ArgumentParser.hpp
 * @brief Small command-line parser used by the hostfacts CLI.
 *
 * Supports flags, valued options, enum-style options backed by magic_enum and
 * trailing positional values. Parsed values can be bound directly into an
 * options struct with bindTo().
 */

#pragma once

#include <algorithm>                 // std::ranges::equal, std::ranges::transform
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to, std::same_as
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_cast, magic_enum::enum_name, magic_enum::enum_values
#include <utility>                   // std::forward, std::move

#include "Error.hpp"
#include "Types.hpp"

namespace hostfacts::utils::argparse {
  namespace error = ::hostfacts::utils::error;
  namespace types = ::hostfacts::utils::types;

  using enum error::FactsErrorCode;

  class Argument;

  using ArgValue   = types::Variant<bool, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::StringView text) -> types::String {
    types::String lower(text);
    std::ranges::transform(lower, lower.begin(), [](const types::u8 chr) -> types::CStr { return static_cast<types::CStr>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief String conversion for scoped enums, case-insensitive on input.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> ArgChoices {
      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(ToLower(magic_enum::enum_name(value)));

      return choices;
    }

    static auto stringToEnum(types::StringView str) -> types::Option<EnumType> {
      return magic_enum::enum_cast<EnumType>(str, [](const char lhs, const char rhs) -> bool {
        return std::tolower(static_cast<types::u8>(lhs)) == std::tolower(static_cast<types::u8>(rhs));
      });
    }
  };

  /**
   * @brief A single option with its aliases, metadata and parsed value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    /// Marks the argument as taking a value; the default fixes the value's type.
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto defaultValue(T value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /// Enum default: restricts accepted values to the enum's names.
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(EnumType value) -> Argument& {
      m_defaultValue = ToLower(magic_enum::enum_name(value));
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>()).value_or(magic_enum::enum_values<EnumType>()[0]);
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.back();
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> const types::Option<ArgChoices>& {
      return m_choices;
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;
      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Stores a raw command-line value.
     * @return An `InvalidArgument` error for a value outside the argument's choices.
     */
    auto setValue(const types::String& raw) -> types::Result<> {
      if (m_choices && !std::ranges::contains(*m_choices, ToLower(raw))) {
        types::String allowed;

        for (const types::String& choice : *m_choices)
          allowed += allowed.empty() ? choice : ", " + choice;

        ERR_FMT(InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", raw, getPrimaryName(), allowed);
      }

      m_value  = raw;
      m_isUsed = true;
      return {};
    }

    /**
     * @brief Copies the parsed value (or default) into `member` once parsing finishes.
     *
     * @code
     *   struct Options { bool json; String config; };
     *   parser.addArguments("--json").flag().bindTo(opts.json);
     * @endcode
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void { member = arg.get<T>(); };
      return *this;
    }

    /// Binds to an `Option<T>` that stays empty unless the argument was given.
    template <typename T>
    auto bindTo(types::Option<T>& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void {
        if (arg.isUsed())
          member = arg.get<T>();
      };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(types::Option<EnumType>& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void {
        if (arg.isUsed())
          member = arg.getEnum<EnumType>();
      };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;        ///< Aliases, e.g. {"-l", "--log-level"}
    types::String             m_helpText;     ///< One line shown by --help
    types::Option<ArgValue>   m_value;        ///< Parsed value
    types::Option<ArgValue>   m_defaultValue; ///< Value used when absent; also fixes the type
    types::Option<ArgChoices> m_choices;      ///< Accepted lower-case values, if restricted
    ArgBinding                m_binding;      ///< Optional struct member binding
    bool                      m_isFlag {};
    bool                      m_isUsed {};
  };

  /**
   * @enum ParseOutcome
   * @brief What the caller should do after a successful parse.
   */
  enum class ParseOutcome : types::u8 {
    Continue,    ///< Normal run.
    ShowHelp,    ///< `-h`/`--help` was given.
    ShowVersion, ///< `-v`/`--version` was given.
  };

  class ArgumentParser {
   public:
    ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Names the trailing positional values in the help text.
     * @param metavar Placeholder, e.g. "FACT".
     * @param helpText Description shown under the usage line.
     */
    auto positional(types::String metavar, types::String helpText) -> ArgumentParser& {
      m_positionalName = std::move(metavar);
      m_positionalHelp = std::move(helpText);
      return *this;
    }

    /**
     * @brief Parses `args` (including the program name at index 0).
     *
     * Anything not starting with '-' is collected as a positional value when
     * positional() was declared, otherwise it is rejected.
     */
    auto parseArgs(types::Span<const types::PCStr> args) -> types::Result<ParseOutcome> {
      for (types::usize i = 1; i < args.size(); ++i) {
        const types::StringView arg = args[i];

        if (arg == "-h" || arg == "--help")
          return ParseOutcome::ShowHelp;

        if (arg == "-v" || arg == "--version")
          return ParseOutcome::ShowVersion;

        if (!arg.starts_with('-') && m_positionalName) {
          m_positionals.emplace_back(arg);
          continue;
        }

        const auto iter = m_argumentMap.find(arg);
        if (iter == m_argumentMap.end())
          ERR_FMT(InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return ParseOutcome::Continue;
    }

    /// parseArgs() followed by applying every bindTo() binding.
    auto parseInto(types::Span<const types::PCStr> args) -> types::Result<ParseOutcome> {
      const ParseOutcome outcome = TRY(parseArgs(args));

      for (const types::UniquePointer<Argument>& arg : m_arguments)
        arg->applyBinding();

      return outcome;
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(types::StringView name) const -> T {
      const auto iter = m_argumentMap.find(name);
      return iter == m_argumentMap.end() ? T {} : iter->second->get<T>();
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum(types::StringView name) const -> EnumType {
      const auto iter = m_argumentMap.find(name);
      return iter == m_argumentMap.end() ? magic_enum::enum_values<EnumType>()[0] : iter->second->template getEnum<EnumType>();
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto positionals() const -> const types::Vec<types::String>& {
      return m_positionals;
    }

    [[nodiscard]] auto version() const -> const types::String& {
      return m_version;
    }

    /// Usage line followed by one block per argument.
    [[nodiscard]] auto helpText() const -> types::String {
      types::String text = std::format("Usage: {}", m_programName);

      for (const types::UniquePointer<Argument>& arg : m_arguments)
        text += std::format(" [{}{}]", arg->getNames().front(), arg->isFlag() ? "" : " VALUE");

      if (m_positionalName)
        text += std::format(" [{}...]", *m_positionalName);

      text += "\n\n";

      if (m_positionalName)
        text += std::format("Positional:\n  {}\n    {}\n\n", *m_positionalName, m_positionalHelp);

      text += "Arguments:\n";

      for (const types::UniquePointer<Argument>& arg : m_arguments) {
        types::String names;

        for (const types::String& name : arg->getNames())
          names += names.empty() ? name : ", " + name;

        text += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          text += std::format("    {}\n", arg->getHelpText());

        if (const types::Option<ArgChoices>& choices = arg->getChoices()) {
          types::String joined;
          for (const types::String& choice : *choices)
            joined += joined.empty() ? choice : ", " + choice;

          text += std::format("    Available values: {}\n    Default: {}\n", joined, arg->get<types::String>());
        }
      }

      return text;
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Option<types::String>               m_positionalName;
    types::String                              m_positionalHelp;
    types::Vec<types::String>                  m_positionals;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace hostfacts::utils::argparse
