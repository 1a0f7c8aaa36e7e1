#pragma once

#include "../detail/platform.hpp"

#include <type_traits>

#if !LOOPER_PLATFORM(LINUX)
#include <condition_variable>
#include <mutex>
#endif

namespace looper {

inline namespace v1 {

/**
 * @brief      The classic "semaphore" synchronization primitive.
 *
 * It atomically maintains an internal count. The count can always be increased by calling signal(),
 * which is always a non-blocking call. When calling wait(), the count is decremented; if the count
 * is still positive the call will be non-blocking; if the count goes below zero, the call to wait()
 * will block until some other thread calls signal().
 *
 * The dispatcher pool workers sleep on a semaphore while their work queue is empty.
 */
class semaphore {
public:
    /**
     * @brief      Constructs a new semaphore instance
     *
     * @param      start_count  The value that the semaphore count should have at start
     *
     * Throws `std::system_error` if the OS primitive cannot be created.
     */
    explicit semaphore(int start_count = 0);
    //! Destructor
    ~semaphore();

    //! Copy constructor is DISABLED
    semaphore(const semaphore&) = delete;
    //! Copy assignment is DISABLED
    void operator=(const semaphore&) = delete;

    /**
     * @brief      Decrement the internal count and wait on the count to be positive
     *
     * @see signal()
     */
    void wait();

    /**
     * @brief      Increment the internal count
     *
     * @param      count  How many times to increment the count
     *
     * Wakes up to `count` threads blocked inside @ref wait().
     */
    void signal(int count = 1);

private:
#if LOOPER_PLATFORM(LINUX)
    // Storage for a sem_t; avoids pulling <semaphore.h> in the public header
    std::aligned_storage<32>::type sem_;
#else
    std::condition_variable cond_var_;
    std::mutex mutex_;
    int count_;
#endif
};

} // namespace v1
} // namespace looper
