#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace voxpipe {

// Many-producer, single-consumer event inbox. Every dispatch loop owns one;
// producers never touch the loop's state directly, they post here.
template<typename T>
class Inbox {
public:
    // Returns false once the inbox has been closed.
    bool post(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Waits up to `timeout` for at least one item, then moves out everything
    // queued. An empty result means timeout (or closed and drained).
    std::vector<T> drain(std::chrono::milliseconds timeout) {
        std::vector<T> out;
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, timeout, [&]{ return !items_.empty() || closed_; });
        out.reserve(items_.size());
        while (!items_.empty()) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace voxpipe
