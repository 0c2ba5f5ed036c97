#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

namespace openfing::infra {

TcpConnector::TcpConnector(WorkerPool& executor) : executor_(executor) {}

std::future<bool> TcpConnector::connectAsync(const std::string& address, uint16_t port,
                                             std::chrono::milliseconds timeout) {
    auto state = std::make_shared<AttemptState>(executor_.makeStrand());
    auto future = state->promise.get_future();

    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        spdlog::debug("Invalid connect target {}:{} - {}", address, port, ec.message());
        finish(state, false);
        return future;
    }

    asio::ip::tcp::endpoint endpoint(ip, port);

    // Both handlers run on the attempt's strand, so close() never races async_connect
    asio::post(state->socket.get_executor(), [state, endpoint, timeout]() {
        state->timer.expires_after(timeout);
        state->timer.async_wait([state](const asio::error_code& timerEc) {
            if (timerEc) {
                return; // Timer cancelled
            }
            finish(state, false);
        });

        state->socket.async_connect(endpoint, [state](const asio::error_code& connectEc) {
            state->timer.cancel();
            finish(state, !connectEc);
        });
    });

    return future;
}

bool TcpConnector::connect(const std::string& address, uint16_t port,
                           std::chrono::milliseconds timeout) {
    return connectAsync(address, port, timeout).get();
}

void TcpConnector::finish(const std::shared_ptr<AttemptState>& state, bool connected) {
    if (state->completed.exchange(true)) {
        return;
    }

    asio::error_code ignored;
    state->socket.close(ignored);
    state->promise.set_value(connected);
}

} // namespace openfing::infra
