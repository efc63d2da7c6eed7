#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>

namespace relay::server
{
    /**
     * Fixed-capacity FIFO shared by many producers and one consumer.
     * Producers never block: a full queue rejects the item. The consumer
     * blocks in pop() until an item arrives or the queue is closed; items
     * queued before close() are still handed out.
     */
    template <class T>
    class BoundedQueue
    {
    public:
        explicit BoundedQueue(const size_t capacity)
            : capacity_(capacity)
        {
        }

        BoundedQueue(const BoundedQueue&)            = delete;
        BoundedQueue& operator=(const BoundedQueue&) = delete;

        // false if the queue is full or closed
        bool try_push(T item)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || items_.size() >= capacity_)
                    return false;
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        // false once the queue is closed and drained
        bool pop(T& out)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !items_.empty(); });

            if (items_.empty())
                return false;

            out = std::move(items_.front());
            items_.pop_front();
            return true;
        }

        bool try_pop(T& out)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty())
                return false;

            out = std::move(items_.front());
            items_.pop_front();
            return true;
        }

        // true only for the call that actually closed the queue
        bool close()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_)
                    return false;
                closed_ = true;
            }
            cv_.notify_all();
            return true;
        }

        [[nodiscard]] bool is_closed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        [[nodiscard]] size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        [[nodiscard]] size_t capacity() const { return capacity_; }

    private:
        const size_t capacity_;
        std::deque<T> items_;
        bool closed_{false};

        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };
} // namespace relay::server
