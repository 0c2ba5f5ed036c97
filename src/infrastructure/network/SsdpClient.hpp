/**
 * @file SsdpClient.hpp
 * @brief SSDP multicast search on the local segment.
 */

#pragma once

#include "infrastructure/network/WorkerPool.hpp"

#include <chrono>
#include <string>

namespace openfing::infra {

/**
 * @brief Sends an SSDP M-SEARCH and gathers the unicast replies.
 */
class SsdpClient {
public:
    static constexpr const char* kMulticastAddress = "239.255.255.250";
    static constexpr unsigned short kPort = 1900;

    explicit SsdpClient(WorkerPool& executor);

    /**
     * @brief Multicasts one search request and collects replies for a window.
     * @param window How long to listen after sending.
     * @return All reply datagrams concatenated, each ending with a newline;
     *         empty text if the socket could not be opened or nothing answered.
     */
    std::string search(std::chrono::milliseconds window);

    /**
     * @brief Builds the M-SEARCH request for all devices.
     */
    static std::string buildSearchRequest();

private:
    WorkerPool& executor_;
};

} // namespace openfing::infra
