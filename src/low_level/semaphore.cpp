#include "looper/low_level/semaphore.hpp"

#include <cerrno>
#include <system_error>

#if LOOPER_PLATFORM(LINUX)

#include <semaphore.h>

namespace looper {
inline namespace v1 {

semaphore::semaphore(int start_count) {
    static_assert(sizeof(sem_t) <= sizeof(sem_), "Did not find the right size of sem_t");
    if (sem_init(reinterpret_cast<sem_t*>(&sem_), 0, static_cast<unsigned>(start_count)) != 0)
        throw std::system_error(errno, std::generic_category(), "sem_init");
}

semaphore::~semaphore() { sem_destroy(reinterpret_cast<sem_t*>(&sem_)); }

void semaphore::wait() {
    // Retry if interrupted by a signal handler
    while (sem_wait(reinterpret_cast<sem_t*>(&sem_)) != 0)
        ;
}

void semaphore::signal(int count) {
    for (int i = 0; i < count; i++)
        sem_post(reinterpret_cast<sem_t*>(&sem_));
}

} // namespace v1
} // namespace looper

#else

namespace looper {
inline namespace v1 {

semaphore::semaphore(int start_count)
    : count_(start_count) {}

semaphore::~semaphore() = default;

void semaphore::wait() {
    std::unique_lock<std::mutex> lock{mutex_};
    cond_var_.wait(lock, [this] { return count_ > 0; });
    count_--;
}

void semaphore::signal(int count) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        count_ += count;
    }
    if (count == 1)
        cond_var_.notify_one();
    else
        cond_var_.notify_all();
}

} // namespace v1
} // namespace looper

#endif
