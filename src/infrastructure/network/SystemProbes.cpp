#include "infrastructure/network/SystemProbes.hpp"

#include "core/discovery/AddressUtils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>

namespace openfing::infra {

namespace {

struct SweepState {
    std::vector<std::string> hosts;
    std::atomic<size_t> nextHost{0};
    std::atomic<bool> expired{false};
    std::mutex mutex;
    std::condition_variable done;
    size_t finishedHosts{0};
};

void pingWorker(const std::shared_ptr<SweepState>& state, CommandRunner& runner,
                int timeoutSeconds) {
    for (;;) {
        if (state->expired) {
            return;
        }
        auto index = state->nextHost.fetch_add(1);
        if (index >= state->hosts.size()) {
            return;
        }

        // Only the cache side effect matters; the exit status is ignored
        runner.run("ping -c 1 -W " + std::to_string(timeoutSeconds) + " " + state->hosts[index] +
                   " >/dev/null 2>&1");

        std::lock_guard lock(state->mutex);
        if (++state->finishedHosts == state->hosts.size()) {
            state->done.notify_all();
        }
    }
}

std::string withCache(std::string output, const std::string& cache) {
    if (!output.empty() && output.back() != '\n') {
        output += '\n';
    }
    output += cache;
    return output;
}

} // namespace

SystemProbes::SystemProbes(CommandRunner& runner, WorkerPool& executor, Environment& environment,
                           TimingConfig timing)
    : runner_(runner), executor_(executor), environment_(environment), timing_(timing),
      connector_(executor), ssdp_(executor) {}

std::vector<std::string> SystemProbes::hostAddresses(const std::string& subnetPrefix) {
    std::vector<std::string> hosts;
    if (!core::AddressUtils::isValidIPv4(subnetPrefix + "1")) {
        return hosts;
    }
    hosts.reserve(254);
    for (int host = 1; host <= 254; ++host) {
        hosts.push_back(subnetPrefix + std::to_string(host));
    }
    return hosts;
}

std::string SystemProbes::runFullScan(const std::string& interfaceName) {
    auto tool = environment_.findFullScanTool();
    if (!tool) {
        return {};
    }

    std::string command = CommandRunner::shellQuote(*tool) + " --localnet";
    if (!interfaceName.empty()) {
        command += " -I " + CommandRunner::shellQuote(interfaceName);
    }
    command += " 2>/dev/null";

    auto output = runner_.captureOutput(command);
    spdlog::debug("Full scan returned {} bytes", output.size());
    return output;
}

std::string SystemProbes::sweepAndReadCache(const std::string& subnetPrefix) {
    pingSweep(subnetPrefix);
    return readAddressCache();
}

void SystemProbes::pingSweep(const std::string& subnetPrefix) {
    auto state = std::make_shared<SweepState>();
    state->hosts = hostAddresses(subnetPrefix);
    if (state->hosts.empty()) {
        spdlog::debug("Invalid sweep prefix '{}', skipping sweep", subnetPrefix);
        return;
    }

    auto workers = std::clamp<size_t>(static_cast<size_t>(timing_.sweepConcurrency), 1,
                                      state->hosts.size());
    int timeoutSeconds = std::max(1, timing_.pingTimeoutMs / 1000);

    spdlog::debug("Sweeping {} hosts with {} workers", state->hosts.size(), workers);
    for (size_t i = 0; i < workers; ++i) {
        executor_.post([state, &runner = runner_, timeoutSeconds]() {
            pingWorker(state, runner, timeoutSeconds);
        });
    }

    std::unique_lock lock(state->mutex);
    bool complete = state->done.wait_for(lock, std::chrono::milliseconds(timing_.sweepSettleMs),
                                         [&state]() {
                                             return state->finishedHosts == state->hosts.size();
                                         });
    state->expired = true;

    if (!complete) {
        spdlog::debug("Sweep settle interval elapsed after {} of {} hosts",
                      state->finishedHosts, state->hosts.size());
    }
}

std::string SystemProbes::readAddressCache() {
    return runner_.captureOutput("arp -a 2>/dev/null");
}

std::string SystemProbes::lookupCacheEntry(const std::string& ip) {
    if (!core::AddressUtils::isValidIPv4(ip)) {
        return {};
    }
    return runner_.captureOutput("arp -n " + ip + " 2>/dev/null");
}

std::string SystemProbes::nameServiceBrowse() {
    if (!runner_.commandExists("avahi-browse")) {
        spdlog::debug("avahi-browse not installed");
        return {};
    }

    auto browse = runner_.captureOutput("avahi-browse -a -t -r -p 2>/dev/null");

    spdlog::debug("Name-service browse returned {} bytes", browse.size());
    return withCache(std::move(browse), readAddressCache());
}

std::string SystemProbes::serviceLocationQuery() {
    auto responses = ssdp_.search(std::chrono::milliseconds(timing_.serviceLocationWindowMs));
    return withCache(std::move(responses), readAddressCache());
}

std::string SystemProbes::nameQuery(const std::string& subnetPrefix) {
    if (!core::AddressUtils::isValidIPv4(subnetPrefix + "255")) {
        return {};
    }
    if (!runner_.commandExists("nmblookup")) {
        spdlog::debug("nmblookup not installed");
        return {};
    }

    auto responders = runner_.captureOutput("nmblookup -B " + subnetPrefix +
                                            "255 '*' 2>/dev/null | awk '/<00>/ {print $1}'");
    return withCache(std::move(responders), readAddressCache());
}

std::string SystemProbes::portReachabilityProbe(const std::string& subnetPrefix,
                                                const std::vector<uint16_t>& ports) {
    auto hosts = hostAddresses(subnetPrefix);
    if (hosts.empty() || ports.empty()) {
        return {};
    }

    struct Target {
        const std::string* host;
        uint16_t port;
    };
    std::vector<Target> targets;
    targets.reserve(hosts.size() * ports.size());
    for (const auto& host : hosts) {
        for (auto port : ports) {
            targets.push_back({&host, port});
        }
    }

    auto chunkSize = static_cast<size_t>(std::max(1, timing_.reachabilityConcurrency));
    auto timeout = std::chrono::milliseconds(timing_.reachabilityTimeoutMs);

    std::string reachable;
    size_t reachableCount = 0;
    for (size_t start = 0; start < targets.size(); start += chunkSize) {
        auto end = std::min(targets.size(), start + chunkSize);

        std::vector<std::future<bool>> attempts;
        attempts.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            attempts.push_back(connector_.connectAsync(*targets[i].host, targets[i].port, timeout));
        }

        for (size_t i = start; i < end; ++i) {
            if (attempts[i - start].get()) {
                reachable += *targets[i].host + ":" + std::to_string(targets[i].port) + "\n";
                ++reachableCount;
            }
        }
    }

    spdlog::debug("Reachability probe found {} open host:port pairs", reachableCount);
    return withCache(std::move(reachable), readAddressCache());
}

} // namespace openfing::infra
