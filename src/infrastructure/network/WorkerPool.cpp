#include "infrastructure/network/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace openfing::infra {

WorkerPool::WorkerPool(size_t workers) : keepAlive_(asio::make_work_guard(io_)) {
    workers = std::max<size_t>(workers, 1);
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { io_.run(); });
    }
    spdlog::debug("Worker pool running {} workers", workers);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    if (workers_.empty()) {
        return;
    }

    keepAlive_.reset();
    io_.stop();
    for (auto& worker : workers_) {
        worker.join();
    }
    spdlog::debug("Worker pool joined {} workers", workers_.size());
    workers_.clear();
}

} // namespace openfing::infra
