/**
 * @file CommandRunner.hpp
 * @brief Runs shell commands and captures their standard output.
 */

#pragma once

#include <chrono>
#include <string>

namespace openfing::infra {

/**
 * @brief Result of a finished shell command.
 */
struct CommandResult {
    int exitCode{-1};    ///< Exit status; -1 if the command could not be started
    std::string output;  ///< Captured standard output

    [[nodiscard]] bool succeeded() const { return exitCode == 0; }
};

/**
 * @brief Executes commands through `sh -c` with a wall-clock limit.
 *
 * Every command is wrapped in `timeout N` so a hung tool cannot stall a
 * discovery run. Standard error is discarded by the caller's command line.
 * Methods are virtual so tests can substitute scripted output.
 */
class CommandRunner {
public:
    /**
     * @brief Constructs a runner.
     * @param timeout Limit applied to every command; zero disables the wrapper.
     */
    explicit CommandRunner(std::chrono::seconds timeout = std::chrono::seconds(10));
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs a command and waits for it to exit.
     * @param command Shell command line.
     * @return Exit status and captured output.
     */
    virtual CommandResult run(const std::string& command);

    /**
     * @brief Runs a command and returns its output only on success.
     * @param command Shell command line.
     * @return Captured output, or empty text on start failure or non-zero exit.
     */
    std::string captureOutput(const std::string& command);

    /**
     * @brief Checks whether an executable is reachable on PATH (or by path).
     * @param program Program name or absolute path.
     */
    bool commandExists(const std::string& program);

    /**
     * @brief Quotes an argument for safe inclusion in a shell command line.
     */
    static std::string shellQuote(const std::string& argument);

    [[nodiscard]] std::chrono::seconds timeout() const { return timeout_; }

private:
    std::chrono::seconds timeout_;
};

} // namespace openfing::infra
