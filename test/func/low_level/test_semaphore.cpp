#include <catch2/catch.hpp>
#include <looper/low_level/semaphore.hpp>
#include <looper/profiling.hpp>

#include <thread>
#include <atomic>
#include <chrono>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("semaphore wait doesn't block after signal", "[semaphore]") {
    LOOPER_PROFILING_FUNCTION();
    constexpr int repetion_count = 100;
    looper::semaphore sem;
    int count = 0;
    for (int i = 0; i < repetion_count; i++) {
        sem.signal();
        count++;
        sem.wait();
    }
    REQUIRE(count == repetion_count);
}

TEST_CASE("semaphore can be signaled multiple times at once", "[semaphore]") {
    LOOPER_PROFILING_FUNCTION();
    looper::semaphore sem;
    sem.signal(5);
    // None of these should block
    for (int i = 0; i < 5; i++)
        sem.wait();
    SUCCEED("all waits passed");
}

TEST_CASE("semaphore can be used to synchronize access", "[semaphore]") {
    LOOPER_PROFILING_FUNCTION();

    constexpr int repetion_count = 100;
    constexpr int num_threads = 8;

    // Start with one token; used as a mutex
    looper::semaphore sem{1};

    // Variable that will be continuously incremented by threads
    int counter = 0;

    std::vector<std::thread> threads{num_threads};
    for (int i = 0; i < num_threads; i++) {
        threads[i] = std::thread([&counter, &sem]() {
            for (int i = 0; i < repetion_count; i++) {
                sem.wait();
                counter++;
                sem.signal();
            }
        });
    }
    for (int i = 0; i < num_threads; i++)
        threads[i].join();

    // Check that we don't have data races
    REQUIRE(counter == num_threads * repetion_count);
}

TEST_CASE("semaphore limits the number of threads passing the barrier", "[semaphore]") {
    LOOPER_PROFILING_FUNCTION();

    constexpr int allowed_conc_access = 5;
    constexpr int num_threads = 10;

    looper::semaphore sem{allowed_conc_access};
    std::atomic<int> num_entries{0};

    std::vector<std::thread> threads{num_threads};
    for (int i = 0; i < num_threads; i++) {
        threads[i] = std::thread([&sem, &num_entries]() {
            sem.wait();
            num_entries++;
        });
    }

    // Wait a bit for the threads to start
    std::this_thread::sleep_for(5ms);

    // We should have exactly allowed_conc_access threads pass the wait() barrier
    REQUIRE(num_entries.load() == allowed_conc_access);

    // Unblock the rest of the threads
    sem.signal(num_threads - allowed_conc_access);

    for (int i = 0; i < num_threads; i++)
        threads[i].join();
    REQUIRE(num_entries.load() == num_threads);
}
