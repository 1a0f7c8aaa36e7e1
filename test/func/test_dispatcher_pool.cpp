#include <catch2/catch.hpp>
#include <looper/dispatcher_pool.hpp>
#include <looper/execution_context.hpp>
#include <looper/errors.hpp>
#include <looper/profiling.hpp>

#include "test_common/task_countdown.hpp"
#include "test_common/task_utils.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("dispatcher_pool creates the requested number of workers", "[dispatcher_pool]") {
    SECTION("explicit count") {
        looper::dispatcher_pool pool{3};
        REQUIRE(pool.num_workers() == 3);
        REQUIRE_FALSE(pool.is_shut_down());
    }
    SECTION("zero means the number of cores") {
        looper::dispatcher_pool pool{0};
        REQUIRE(pool.num_workers() >= 1);
    }
    SECTION("from a configuration object") {
        looper::init_data config;
        config.num_workers_ = 2;
        looper::dispatcher_pool pool{config};
        REQUIRE(pool.num_workers() == 2);
    }
}

TEST_CASE("dispatcher_pool calls the worker start function", "[dispatcher_pool]") {
    std::atomic<int> init_count{0};
    looper::init_data config;
    config.num_workers_ = 4;
    config.worker_start_fun_ = [&]() { init_count++; };
    looper::dispatcher_pool pool{config};

    for (int j = 0; j < 100 && init_count.load() < 4; j++)
        std::this_thread::sleep_for(1ms);
    REQUIRE(init_count.load() == 4);
}

TEST_CASE("dispatcher_pool executes submitted closures", "[dispatcher_pool]") {
    LOOPER_PROFILING_FUNCTION();
    constexpr int num_jobs = 100;
    looper::dispatcher_pool pool{4};
    task_countdown tc{num_jobs};
    std::atomic<int> executed{0};
    for (int i = 0; i < num_jobs; i++)
        pool.submit([&]() {
            executed++;
            tc.task_finished();
        });
    REQUIRE(tc.wait_for_all());
    REQUIRE(bounded_wait(pool));
    REQUIRE(executed.load() == num_jobs);
    REQUIRE(pool.num_active() == 0);
}

TEST_CASE("dispatcher_pool runs closures on its workers", "[dispatcher_pool]") {
    looper::dispatcher_pool pool{2};
    REQUIRE_FALSE(pool.running_in_this_thread());

    std::mutex mutex;
    std::set<std::thread::id> ids;
    std::vector<looper::deferred<bool>> results;
    for (int i = 0; i < 20; i++) {
        results.push_back(pool.submit([&]() {
            std::lock_guard<std::mutex> lock{mutex};
            ids.insert(std::this_thread::get_id());
            std::this_thread::sleep_for(100us);
            return pool.running_in_this_thread();
        }));
    }
    for (auto& r : results)
        REQUIRE(r.await());
    REQUIRE(ids.size() <= 2);
    REQUIRE(ids.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("dispatcher_pool never runs more closures than workers", "[dispatcher_pool]") {
    LOOPER_PROFILING_FUNCTION();
    constexpr int num_workers = 3;
    constexpr int num_jobs = 30;
    looper::dispatcher_pool pool{num_workers};
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    task_countdown tc{num_jobs};

    for (int i = 0; i < num_jobs; i++) {
        pool.submit([&]() {
            int cur = ++running;
            int prev = max_running.load();
            while (cur > prev && !max_running.compare_exchange_weak(prev, cur))
                ;
            std::this_thread::sleep_for(1ms);
            running--;
            tc.task_finished();
        });
    }
    REQUIRE(tc.wait_for_all(5000ms));
    REQUIRE(pool.num_active() <= num_workers);
    REQUIRE(max_running.load() <= num_workers);
    REQUIRE(max_running.load() >= 1);
}

TEST_CASE("dispatcher_pool starts jobs in submission order", "[dispatcher_pool]") {
    // With a single worker, the start order is fully observable
    looper::dispatcher_pool pool{1};
    std::vector<int> order;
    std::vector<looper::deferred<void>> results;
    for (int i = 0; i < 50; i++)
        results.push_back(pool.submit([&order, i]() { order.push_back(i); }));
    for (auto& r : results)
        r.await();
    REQUIRE(order.size() == 50);
    for (int i = 0; i < 50; i++)
        REQUIRE(order[i] == i);
}

TEST_CASE("dispatcher_pool delivers the outcome to the return context", "[dispatcher_pool]") {
    looper::dispatcher_pool pool{2};
    looper::execution_context main_ctx;

    SECTION("completed job") {
        int value = 0;
        int num_calls = 0;
        std::thread::id delivery_thread;
        pool.submit([]() { return 42; }, main_ctx, [&](looper::deferred<int> d) {
            value = d.await();
            num_calls++;
            delivery_thread = std::this_thread::get_id();
        });
        REQUIRE(run_until(main_ctx, [&]() { return num_calls > 0; }));
        run_for(main_ctx, 2ms);
        REQUIRE(value == 42);
        REQUIRE(num_calls == 1);
        REQUIRE(delivery_thread == std::this_thread::get_id());
    }
    SECTION("failed job") {
        bool got_error = false;
        pool.submit([]() -> int { throw std::runtime_error("oops"); }, main_ctx,
                [&](looper::deferred<int> d) {
                    REQUIRE(d.state() == looper::job_state::failed);
                    REQUIRE_THROWS_AS(d.await(), std::runtime_error);
                    got_error = true;
                });
        REQUIRE(run_until(main_ctx, [&]() { return got_error; }));
    }
}

TEST_CASE("cancelling a queued job removes it from the pool", "[dispatcher_pool]") {
    looper::dispatcher_pool pool{1};
    std::atomic<bool> release{false};
    std::atomic<bool> blocker_started{false};

    // Keep the single worker busy
    auto blocker = pool.submit([&]() {
        blocker_started = true;
        while (!release.load())
            std::this_thread::sleep_for(100us);
    });
    while (!blocker_started.load())
        std::this_thread::sleep_for(100us);

    std::atomic<bool> executed{false};
    auto queued = pool.submit([&]() { executed = true; });
    REQUIRE(pool.num_pending() == 1);

    REQUIRE(queued.cancel());
    REQUIRE(queued.state() == looper::job_state::cancelled);
    REQUIRE(pool.num_pending() == 0);

    release = true;
    blocker.await();
    // Give the worker a chance to (wrongly) run the cancelled job
    auto after = pool.submit([]() { return 1; });
    REQUIRE(after.await() == 1);
    REQUIRE_FALSE(executed.load());
    REQUIRE_THROWS_AS(queued.await(), looper::cancellation_error);
}

TEST_CASE("dispatcher_pool rejects jobs over capacity", "[dispatcher_pool]") {
    looper::init_data config;
    config.num_workers_ = 1;
    config.max_pending_ = 2;
    looper::dispatcher_pool pool{config};

    std::atomic<bool> release{false};
    std::atomic<bool> blocker_started{false};
    auto blocker = pool.submit([&]() {
        blocker_started = true;
        while (!release.load())
            std::this_thread::sleep_for(100us);
    });
    while (!blocker_started.load())
        std::this_thread::sleep_for(100us);

    std::atomic<int> executed{0};
    pool.submit([&]() { executed++; });
    pool.submit([&]() { executed++; });
    REQUIRE_THROWS_AS(pool.submit([&]() { executed += 100; }), looper::rejected_submission_error);

    release = true;
    pool.shutdown();
    REQUIRE(executed.load() == 2);
}

TEST_CASE("dispatcher_pool shutdown finishes the submitted work", "[dispatcher_pool]") {
    LOOPER_PROFILING_FUNCTION();
    looper::dispatcher_pool pool{2};
    std::atomic<int> executed{0};
    for (int i = 0; i < 20; i++)
        pool.submit([&]() {
            std::this_thread::sleep_for(100us);
            executed++;
        });
    pool.shutdown();
    REQUIRE(pool.is_shut_down());
    REQUIRE(executed.load() == 20);
    REQUIRE(pool.num_pending() == 0);

    SECTION("later submissions are rejected") {
        REQUIRE_THROWS_AS(pool.submit([]() {}), looper::rejected_submission_error);
    }
    SECTION("shutdown can be called again") {
        pool.shutdown();
        REQUIRE(pool.is_shut_down());
    }
}

TEST_CASE("dispatcher_pool cannot be shut down from its own workers", "[dispatcher_pool]") {
    looper::dispatcher_pool pool{1};
    auto res = pool.submit([&]() {
        try {
            pool.shutdown();
        } catch (const std::logic_error&) {
            return true;
        }
        return false;
    });
    REQUIRE(res.await());
    REQUIRE_FALSE(pool.is_shut_down());
}

TEST_CASE("dispatcher_pool can be shut down from multiple threads at once", "[dispatcher_pool]") {
    looper::dispatcher_pool pool{4};
    std::atomic<int> executed{0};
    for (int i = 0; i < 20; i++)
        pool.submit([&]() {
            std::this_thread::sleep_for(100us);
            executed++;
        });

    std::thread t1{[&]() { pool.shutdown(); }};
    std::thread t2{[&]() { pool.shutdown(); }};
    t1.join();
    t2.join();
    REQUIRE(pool.is_shut_down());
    REQUIRE(executed.load() == 20);
}
