#include "infrastructure/network/SsdpClient.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <future>
#include <memory>

namespace openfing::infra {

namespace {

struct SearchState {
    explicit SearchState(WorkerPool::Strand strand)
        : socket(strand), timer(strand) {}

    asio::ip::udp::socket socket;
    asio::steady_timer timer;
    asio::ip::udp::endpoint sender;
    std::array<char, 2048> buffer{};
    std::string responses;
    std::promise<std::string> promise;
    bool finished{false};
};

void finishSearch(const std::shared_ptr<SearchState>& state) {
    if (state->finished) {
        return;
    }
    state->finished = true;

    asio::error_code ignored;
    state->timer.cancel();
    state->socket.close(ignored);
    state->promise.set_value(std::move(state->responses));
}

void receiveNext(const std::shared_ptr<SearchState>& state) {
    state->socket.async_receive_from(
        asio::buffer(state->buffer), state->sender,
        [state](const asio::error_code& ec, size_t bytes) {
            if (ec || state->finished) {
                return;
            }
            state->responses.append(state->buffer.data(), bytes);
            state->responses += '\n';
            receiveNext(state);
        });
}

} // namespace

SsdpClient::SsdpClient(WorkerPool& executor) : executor_(executor) {}

std::string SsdpClient::buildSearchRequest() {
    return std::string("M-SEARCH * HTTP/1.1\r\n") + "HOST: " + kMulticastAddress + ":" +
           std::to_string(kPort) +
           "\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 2\r\n"
           "ST: ssdp:all\r\n"
           "\r\n";
}

std::string SsdpClient::search(std::chrono::milliseconds window) {
    auto state = std::make_shared<SearchState>(executor_.makeStrand());
    auto future = state->promise.get_future();

    asio::error_code ec;
    auto group = asio::ip::make_address_v4(kMulticastAddress, ec);
    state->socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        spdlog::debug("SSDP socket unavailable: {}", ec.message());
        return {};
    }

    auto request = std::make_shared<std::string>(buildSearchRequest());
    asio::ip::udp::endpoint target(group, kPort);

    asio::post(state->socket.get_executor(), [state, request, target, window]() {
        state->timer.expires_after(window);
        state->timer.async_wait([state](const asio::error_code& timerEc) {
            if (!timerEc) {
                finishSearch(state);
            }
        });

        state->socket.async_send_to(
            asio::buffer(*request), target,
            [state, request](const asio::error_code& sendEc, size_t) {
                if (sendEc) {
                    spdlog::debug("SSDP search send failed: {}", sendEc.message());
                    finishSearch(state);
                    return;
                }
                receiveNext(state);
            });
    });

    auto responses = future.get();
    spdlog::debug("SSDP search collected {} bytes of replies", responses.size());
    return responses;
}

} // namespace openfing::infra
