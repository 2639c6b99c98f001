#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace dotvid {

/**
 * @brief Blocking queue connecting pipeline stages
 *
 * Any number of senders and receivers. send() blocks while the queue
 * holds `capacity` items, receive() blocks while it is empty. After
 * close(), senders fail immediately and receivers drain what is left.
 */
template<typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 1)
        : capacity_(capacity == 0 ? 1 : capacity)
        , closed_(false)
    {
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @return false if the channel was closed; the item is dropped
     */
    bool send(T&& item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @return false once the channel is closed and drained
     */
    bool receive(T& item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    size_t capacity_;
    bool closed_;
};

} // namespace dotvid
