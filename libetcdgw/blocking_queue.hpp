#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace libetcdgw::detail {

class QueueClosed : public std::runtime_error
{
public:
    QueueClosed() : std::runtime_error("queue closed for puts") {}
};

// capacity == 0 means the queue is unbounded
template<typename T, class Container = std::deque<T>>
class BlockingQueue
{
    Container items_;
    size_t capacity_;
    bool closed_{false};
    std::mutex lock_;
    std::condition_variable consumer_cv_;
    std::condition_variable producer_cv_;

    bool full_() const { return capacity_ != 0 && items_.size() >= capacity_; }

public:
    explicit BlockingQueue(size_t capacity = 0)
        : capacity_{capacity}
    {}

    // blocks while full; throws QueueClosed after close()
    void put(T item)
    {
        std::unique_lock<std::mutex> lock(lock_);

        producer_cv_.wait(lock, [this]() { return closed_ || !full_(); });

        if (closed_)
            throw QueueClosed();

        items_.push_back(std::move(item));
        consumer_cv_.notify_one();
    }

    // returns false if the queue is empty and closed
    bool get(T &item)
    {
        std::unique_lock<std::mutex> lock(lock_);

        consumer_cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });

        if (items_.empty())
            return false;

        item = std::move(items_.front());
        items_.pop_front();
        producer_cv_.notify_one();

        return true;
    }

    void close()
    {
        std::unique_lock<std::mutex> lock(lock_);

        closed_ = true;
        consumer_cv_.notify_all();
        producer_cv_.notify_all();
    }

    // Drops whatever is queued and wakes everyone.
    void close_and_clear()
    {
        std::unique_lock<std::mutex> lock(lock_);

        closed_ = true;
        items_.clear();
        consumer_cv_.notify_all();
        producer_cv_.notify_all();
    }

    size_t size()
    {
        std::unique_lock<std::mutex> lock(lock_);
        return items_.size();
    }
};

} // namespace libetcdgw::detail
