#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace codegraph::concurrency {

// Fixed-size worker pool backed by an io_context and std::jthread workers.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn> void post(Fn&& fn) { boost::asio::post(io_, std::forward<Fn>(fn)); }

    // Let queued work drain, then join all threads. Idempotent.
    void join();

    // Drop queued work and join.
    void stop();

    std::size_t threads() const noexcept { return size_; }

private:
    void run_thread(std::size_t index);

    boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::size_t size_{0};
};

} // namespace codegraph::concurrency
