#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/WorkerPool.hpp"
#include "infrastructure/network/TcpConnector.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace openfing::infra;

TEST_CASE("WorkerPool", "[WorkerPool]") {
    WorkerPool executor(2);
    REQUIRE(executor.workerCount() == 2);

    SECTION("Zero workers is treated as one") {
        WorkerPool single(0);
        REQUIRE(single.workerCount() == 1);
    }

    SECTION("Posted work runs on the workers") {
        std::promise<std::thread::id> promise;
        auto future = promise.get_future();
        executor.post([&promise]() { promise.set_value(std::this_thread::get_id()); });

        REQUIRE(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
        REQUIRE(future.get() != std::this_thread::get_id());
    }

    SECTION("Handlers on one strand never overlap") {
        auto strand = executor.makeStrand();
        std::atomic<int> inside{0};
        std::atomic<bool> overlapped{false};
        std::promise<void> done;
        std::atomic<int> remaining{50};

        for (int i = 0; i < 50; ++i) {
            asio::post(strand, [&]() {
                if (inside.fetch_add(1) != 0) {
                    overlapped = true;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                inside.fetch_sub(1);
                if (remaining.fetch_sub(1) == 1) {
                    done.set_value();
                }
            });
        }

        REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        REQUIRE_FALSE(overlapped);
    }

    SECTION("Shutdown is idempotent") {
        executor.shutdown();
        executor.shutdown();
        REQUIRE(executor.workerCount() == 0);
    }
}

TEST_CASE("TcpConnector::connect", "[TcpConnector]") {
    WorkerPool executor(2);
    TcpConnector connector(executor);

    asio::ip::tcp::acceptor acceptor(executor.context(),
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    auto openPort = acceptor.local_endpoint().port();

    SECTION("Listening port is reachable") {
        REQUIRE(connector.connect("127.0.0.1", openPort, std::chrono::milliseconds(1000)));
    }

    SECTION("Closed port is not reachable") {
        acceptor.close();
        REQUIRE_FALSE(connector.connect("127.0.0.1", openPort, std::chrono::milliseconds(1000)));
    }

    SECTION("Invalid address fails without throwing") {
        REQUIRE_FALSE(connector.connect("not-an-ip", 80, std::chrono::milliseconds(100)));
        REQUIRE_FALSE(connector.connect("999.1.1.1", 80, std::chrono::milliseconds(100)));
    }

    SECTION("Unanswered connect gives up after the timeout") {
        auto start = std::chrono::steady_clock::now();
        // TEST-NET-1 is never routed
        bool connected = connector.connect("192.0.2.1", 9, std::chrono::milliseconds(200));
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(connected);
        REQUIRE(elapsed < std::chrono::seconds(2));
    }

    SECTION("Many attempts in flight") {
        std::vector<std::future<bool>> attempts;
        for (int i = 0; i < 32; ++i) {
            attempts.push_back(
                connector.connectAsync("127.0.0.1", openPort, std::chrono::milliseconds(1000)));
        }
        for (auto& attempt : attempts) {
            REQUIRE(attempt.get());
        }
    }

    acceptor.close();
}
