/**
 * @file Command.hpp
 * @brief Runs external programs and captures their output.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace hostfacts::core::command {
  namespace types = ::hostfacts::utils::types;

  /**
   * @struct CommandResult
   * @brief Outcome of a program that was started successfully.
   */
  struct CommandResult {
    types::i32    exitCode = 0; ///< Exit status; 128 + signal number if the process was killed.
    types::String stdOut;       ///< Everything written to standard output.
    types::String stdErr;       ///< Everything written to standard error.

    [[nodiscard]] auto succeeded() const -> bool {
      return exitCode == 0;
    }
  };

  /**
   * @brief Executes an argument list and waits for it to finish.
   *
   * Implementations block until the program exits. A non-zero exit status is
   * still a successful `Result`; only failing to start the program is an error.
   */
  class ICommandRunner {
   public:
    ICommandRunner()                                         = default;
    ICommandRunner(const ICommandRunner&)                    = delete;
    ICommandRunner(ICommandRunner&&)                         = delete;
    auto operator=(const ICommandRunner&) -> ICommandRunner& = delete;
    auto operator=(ICommandRunner&&) -> ICommandRunner&      = delete;
    virtual ~ICommandRunner()                                = default;

    /**
     * @brief Runs `argv[0]` with the remaining elements as arguments.
     * @return The captured output, or an error:
     *  - `InvalidArgument` if `argv` is empty
     *  - `NotFound` if the executable does not exist
     *  - `PermissionDenied` if it cannot be executed
     *  - `IoError`/`ResourceExhausted` if pipes or the process cannot be created
     */
    virtual auto run(const types::Vec<types::String>& argv) -> types::Result<CommandResult> = 0;
  };

  /**
   * @brief Spawns real child processes.
   *
   * @details
   *  - POSIX: `fork` + `execvp`, with stdout/stderr drained through `poll`
   *  - Windows: `CreateProcessW` with inherited pipes
   *
   * The program is looked up on `PATH`.
   */
  class ProcessCommandRunner final : public ICommandRunner {
   public:
    auto run(const types::Vec<types::String>& argv) -> types::Result<CommandResult> override;
  };

  /**
   * @brief Joins an argument list for log messages.
   */
  inline auto DescribeCommand(const types::Vec<types::String>& argv) -> types::String {
    types::String joined;

    for (const types::String& arg : argv) {
      if (!joined.empty())
        joined += ' ';
      joined += arg;
    }

    return joined;
  }
} // namespace hostfacts::core::command
