/**
 * @file TcpConnector.hpp
 * @brief TCP connect attempts bounded by a timeout.
 */

#pragma once

#include "infrastructure/network/WorkerPool.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace openfing::infra {

/**
 * @brief TCP connect checks with a per-attempt timeout.
 *
 * Each attempt races an async_connect against a steady_timer on a private
 * strand; whichever handler runs first decides the result and closes the
 * socket. Handlers run on the WorkerPool.
 */
class TcpConnector {
public:
    /**
     * @brief Constructs a connector over the given executor.
     * @param executor Pool that runs the socket handlers.
     */
    explicit TcpConnector(WorkerPool& executor);

    /**
     * @brief Starts a connect attempt.
     * @param address IPv4 address in dotted-quad form.
     * @param port Target port.
     * @param timeout Time allowed for the handshake.
     * @return Future that becomes true if the connection was accepted in time.
     */
    std::future<bool> connectAsync(const std::string& address, uint16_t port,
                                   std::chrono::milliseconds timeout);

    /**
     * @brief Blocking variant of connectAsync().
     * @return True if the connection was accepted in time. An invalid address yields false.
     */
    bool connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout);

private:
    struct AttemptState {
        explicit AttemptState(WorkerPool::Strand strand)
            : socket(strand), timer(strand) {}

        asio::ip::tcp::socket socket;
        asio::steady_timer timer;
        std::promise<bool> promise;
        std::atomic<bool> completed{false};
    };

    static void finish(const std::shared_ptr<AttemptState>& state, bool connected);

    WorkerPool& executor_;
};

} // namespace openfing::infra
