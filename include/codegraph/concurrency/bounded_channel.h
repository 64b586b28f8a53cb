#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace codegraph::concurrency {

// Bounded MPMC ring buffer. try_* never block; push() waits for space and pop()
// waits for data until the channel is closed and drained.
template <typename T> class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : buf_(capacity ? capacity + 1 : 2), cap_(capacity ? capacity + 1 : 2) {}

    bool try_push(T&& v) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || inc(head_) == tail_)
            return false; // full or closed
        buf_[head_] = std::move(v);
        head_ = inc(head_);
        notEmpty_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (tail_ == head_)
            return false; // empty
        out = std::move(*buf_[tail_]);
        buf_[tail_].reset();
        tail_ = inc(tail_);
        notFull_.notify_one();
        return true;
    }

    // Returns false if the channel was closed before space became available.
    bool push(T&& v) {
        std::unique_lock<std::mutex> lk(mu_);
        notFull_.wait(lk, [&] { return closed_ || inc(head_) != tail_; });
        if (closed_)
            return false;
        buf_[head_] = std::move(v);
        head_ = inc(head_);
        notEmpty_.notify_one();
        return true;
    }

    // nullopt once the channel is closed and empty.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mu_);
        notEmpty_.wait(lk, [&] { return closed_ || tail_ != head_; });
        if (tail_ == head_)
            return std::nullopt;
        std::optional<T> out = std::move(buf_[tail_]);
        buf_[tail_].reset();
        tail_ = inc(tail_);
        notFull_.notify_one();
        return out;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ == tail_;
    }

    std::size_t capacity() const noexcept { return cap_ - 1; }

private:
    std::size_t inc(std::size_t i) const noexcept { return (i + 1) % cap_; }

    std::vector<std::optional<T>> buf_;
    std::size_t cap_;
    std::size_t head_{0};
    std::size_t tail_{0};
    bool closed_{false};
    mutable std::mutex mu_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace codegraph::concurrency
