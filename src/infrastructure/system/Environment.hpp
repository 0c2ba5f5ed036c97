/**
 * @file Environment.hpp
 * @brief Per-run facts about the host: privilege and installed tools.
 */

#pragma once

#include "infrastructure/system/CommandRunner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace openfing::infra {

/**
 * @brief Answers the questions the discovery engine is given once per run.
 */
class Environment {
public:
    /**
     * @brief Constructs an environment probe.
     * @param runner Runner used for tool lookups.
     * @param fullScanPaths Candidate locations of the full-scan tool, tried in order.
     */
    Environment(CommandRunner& runner, std::vector<std::string> fullScanPaths);

    /**
     * @brief Whether the process runs with an effective user id of 0.
     */
    [[nodiscard]] bool hasPrivilege() const;

    /**
     * @brief First full-scan tool candidate that answers `--version`.
     * @return Path or name of the tool, or nullopt if none is installed.
     */
    std::optional<std::string> findFullScanTool();

    /**
     * @brief Whether any full-scan tool candidate is installed.
     */
    bool fullScanToolAvailable() { return findFullScanTool().has_value(); }

private:
    CommandRunner& runner_;
    std::vector<std::string> fullScanPaths_;
    std::optional<std::optional<std::string>> cachedTool_;
};

} // namespace openfing::infra
