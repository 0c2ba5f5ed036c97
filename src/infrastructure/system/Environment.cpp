#include "infrastructure/system/Environment.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace openfing::infra {

namespace {

// POSIX shell exit statuses for a command that cannot run
constexpr int kNotExecutable = 126;
constexpr int kNotFound = 127;

} // namespace

Environment::Environment(CommandRunner& runner, std::vector<std::string> fullScanPaths)
    : runner_(runner), fullScanPaths_(std::move(fullScanPaths)) {}

bool Environment::hasPrivilege() const {
    return geteuid() == 0;
}

std::optional<std::string> Environment::findFullScanTool() {
    if (cachedTool_) {
        return *cachedTool_;
    }

    for (const auto& candidate : fullScanPaths_) {
        // The tool exits non-zero for --version on some builds, so look for its name instead.
        // The shell's own "not found" message names the candidate too, hence the status check.
        auto result = runner_.run(CommandRunner::shellQuote(candidate) + " --version 2>&1");
        if (result.exitCode == kNotExecutable || result.exitCode == kNotFound) {
            spdlog::trace("Full-scan candidate {} is not installed", candidate);
            continue;
        }
        if (result.output.find("arp-scan") != std::string::npos) {
            spdlog::debug("Full-scan tool found at {}", candidate);
            cachedTool_.emplace(candidate);
            return candidate;
        }
    }

    spdlog::debug("No full-scan tool among {} candidates", fullScanPaths_.size());
    cachedTool_.emplace(std::nullopt);
    return std::nullopt;
}

} // namespace openfing::infra
