#include <codegraph/concurrency/worker_pool.h>

#include <spdlog/spdlog.h>

namespace codegraph::concurrency {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads ? threads : 1)) {
    if (threads == 0)
        threads = 1;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this, i] { run_thread(i); });
    }
    size_ = threads;
    spdlog::debug("WorkerPool started with {} threads", threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::join() {
    // Releasing the guard lets run() return once the queue is empty
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    for (std::size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("WorkerPool thread {} join failed: {}", i, e.what());
            }
        }
    }
    threads_.clear();
}

void WorkerPool::stop() {
    if (!io_.stopped()) {
        io_.stop();
    }
    join();
}

void WorkerPool::run_thread(std::size_t index) {
    try {
        io_.run();
    } catch (const std::exception& e) {
        spdlog::warn("WorkerPool thread {} exited: {}", index, e.what());
    }
}

} // namespace codegraph::concurrency
