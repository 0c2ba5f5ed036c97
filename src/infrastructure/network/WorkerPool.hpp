/**
 * @file WorkerPool.hpp
 * @brief Worker threads shared by the socket checks and the liveness sweep.
 */

#pragma once

#include <asio.hpp>
#include <thread>
#include <utility>
#include <vector>

namespace openfing::infra {

/**
 * @brief Runs one io_context on a fixed set of worker threads.
 *
 * Workers start on construction and keep running until shutdown(), even when
 * no work is queued. Sweep tasks block on child processes, so size the pool
 * for the sweep rather than for the CPU.
 */
class WorkerPool {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    /**
     * @param workers Number of threads; zero is treated as one.
     */
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Stops the context and joins the workers. Pending handlers are dropped.
     */
    void shutdown();

    size_t workerCount() const { return workers_.size(); }

    asio::io_context& context() { return io_; }

    /**
     * @brief Strand for one network operation, so its socket and timer handlers never overlap.
     */
    Strand makeStrand() { return asio::make_strand(io_); }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(io_, std::forward<Handler>(handler));
    }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> keepAlive_;
    std::vector<std::thread> workers_;
};

} // namespace openfing::infra
