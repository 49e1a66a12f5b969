#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace utils {

// Thread-safe FIFO shared between a producer callback and a consumer thread
template <typename T>
class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Channel() = default;
    ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an item to the back of the queue, returns false once closed
    bool produce(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                BOOST_LOG_TRIVIAL(debug) << "Channel: Dropping item, channel closed";
                return false;
            }
            queue_.push(std::move(item));
            BOOST_LOG_TRIVIAL(trace) << "Channel: Added item. Channel size: " << queue_.size();
        }
        not_empty_.notify_one();
        return true;
    }

    // Retrieves and removes the next item without waiting
    bool consume(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked(item);
    }

    // Waits up to timeout for an item; false on timeout or when closed and drained
    template <typename Rep, typename Period>
    bool consume_for(T& item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return pop_locked(item);
    }

    // Wakes all waiting consumers; queued items can still be drained
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }


    // ---- QUERY METHODS ----
    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::queue<T> queue_;
    bool closed_{false};

    bool pop_locked(T& item) {
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        BOOST_LOG_TRIVIAL(trace) << "Channel: Retrieved item. Channel size: " << queue_.size();
        return true;
    }
};

} // namespace utils
} // namespace blobdvm
