#include "infrastructure/system/CommandRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace openfing::infra {

CommandRunner::CommandRunner(std::chrono::seconds timeout) : timeout_(timeout) {}

CommandResult CommandRunner::run(const std::string& command) {
    CommandResult result;

    std::string wrapped = "sh -c " + shellQuote(command);
    if (timeout_.count() > 0) {
        wrapped = "timeout " + std::to_string(timeout_.count()) + " " + wrapped;
    }

    FILE* pipe = popen(wrapped.c_str(), "r");
    if (!pipe) {
        spdlog::debug("Failed to start command: {}", command);
        return result;
    }

    std::array<char, 4096> buffer{};
    size_t bytesRead = 0;
    while ((bytesRead = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), bytesRead);
    }

    int status = pclose(pipe);
    if (status == -1) {
        spdlog::debug("Failed to reap command: {}", command);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }

    // timeout(1) reports an expired limit as 124
    if (result.exitCode == 124) {
        spdlog::debug("Command timed out after {}s: {}", timeout_.count(), command);
    } else {
        spdlog::trace("Command exited with {}: {}", result.exitCode, command);
    }

    return result;
}

std::string CommandRunner::captureOutput(const std::string& command) {
    auto result = run(command);
    if (!result.succeeded()) {
        return {};
    }
    return std::move(result.output);
}

bool CommandRunner::commandExists(const std::string& program) {
    return run("command -v " + shellQuote(program) + " >/dev/null 2>&1").succeeded();
}

std::string CommandRunner::shellQuote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace openfing::infra
