#pragma once

#include <deque>
#include <mutex>
#include <memory>

namespace looper {

inline namespace v1 {

/**
 * @brief      FIFO queue that can be used concurrently by multiple producers and consumers.
 *
 * @tparam     T     The type of elements to store
 *
 * This is the structure behind both the mailbox of an @ref execution_context and the work queue of
 * a @ref dispatcher_pool. All the operations are guarded by one mutex; the operations never block
 * for longer than it takes to manipulate the underlying deque.
 *
 * Besides pushing and popping, elements can be removed from the middle of the queue with
 * @ref erase_if(). This is used to drop jobs cancelled before a worker picks them up.
 */
template <typename T, typename A = std::allocator<T>>
class concurrent_queue {
public:
    using value_type = T;
    using size_type = size_t;
    using allocator_type = A;

    explicit concurrent_queue(const allocator_type& alloc = allocator_type())
        : queue_(alloc) {}
    ~concurrent_queue() = default;

    concurrent_queue(const concurrent_queue&) = delete;
    concurrent_queue& operator=(const concurrent_queue&) = delete;

    //! Pushes one element at the back of the queue; returns the size of the queue after the push
    size_type push(T val) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace_back(std::move(val));
        return queue_.size();
    }

    /**
     * @brief      Pushes one element at the back of the queue, if the queue is not full
     *
     * @param      val       The value to be pushed
     * @param      capacity  The maximum number of elements allowed; 0 means unbounded
     *
     * @return     True if the value was pushed; false if the queue was full.
     */
    bool try_push(T&& val, size_type capacity) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity > 0 && queue_.size() >= capacity)
            return false;
        queue_.emplace_back(std::move(val));
        return true;
    }

    //! Try to pop one element from the front of the queue. Returns false if the queue is empty.
    bool try_pop(T& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
            return false;
        result = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    //! Removes all the elements matching the predicate. Returns the number of removed elements.
    template <typename Pred>
    size_type erase_if(Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_type removed = 0;
        for (auto it = queue_.begin(); it != queue_.end();) {
            if (pred(*it)) {
                it = queue_.erase(it);
                removed++;
            } else
                ++it;
        }
        return removed;
    }

    size_type size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    std::deque<T, A> queue_;
    mutable std::mutex mutex_;
};

} // namespace v1
} // namespace looper
