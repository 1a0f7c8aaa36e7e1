#include <catch2/catch.hpp>
#include <looper/scope.hpp>
#include <looper/dispatcher_pool.hpp>
#include <looper/execution_context.hpp>
#include <looper/clock.hpp>
#include <looper/errors.hpp>

#include "test_common/task_utils.hpp"

#include <atomic>
#include <exception>
#include <thread>

using namespace std::chrono_literals;

namespace {
//! Records the errors that reach a scope's exception handler
struct error_recorder {
    int num_timeouts_{0};
    int num_other_{0};

    void operator()(std::exception_ptr ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const looper::timeout_error&) {
            num_timeouts_++;
        } catch (...) {
            num_other_++;
        }
    }
};
} // namespace

TEST_CASE("a slow job loses against its timeout", "[timeout]") {
    looper::dispatcher_pool pool{2};
    looper::execution_context main_ctx;
    auto sc = looper::scope::create(pool);

    error_recorder errors;
    sc.set_exception_handler([&](std::exception_ptr ex) { errors(ex); });

    std::atomic<bool> closure_finished{false};
    int num_values = 0;
    auto j = sc.launch_with_timeout(
            [&]() {
                // Ignores cancellation on purpose
                std::this_thread::sleep_for(50ms);
                closure_finished = true;
                return 1;
            },
            main_ctx, 10ms, [&](int) { num_values++; });

    REQUIRE(run_until(main_ctx, [&]() { return errors.num_timeouts_ > 0; }));
    REQUIRE(j.is_cancel_requested());

    // The late result has no effect
    REQUIRE(j.wait_for(1s));
    REQUIRE(closure_finished.load());
    run_for(main_ctx, 10ms);
    REQUIRE(j.state() == looper::job_state::cancelled);
    REQUIRE(num_values == 0);
    REQUIRE(errors.num_timeouts_ == 1);
    REQUIRE(errors.num_other_ == 0);
    REQUIRE(sc.close(1s));
}

TEST_CASE("a fast job wins against its timeout", "[timeout]") {
    looper::manual_clock clk;
    looper::dispatcher_pool pool{2};
    looper::execution_context main_ctx{"main", clk};
    auto sc = looper::scope::create(pool);

    error_recorder errors;
    sc.set_exception_handler([&](std::exception_ptr ex) { errors(ex); });

    int value = 0;
    auto j = sc.launch_with_timeout([]() { return 8; }, main_ctx, 10ms, [&](int v) { value = v; });
    REQUIRE(j.wait_for(1s));
    REQUIRE(run_until(main_ctx, [&]() { return value != 0; }));
    REQUIRE(value == 8);

    // The timer fires later, and has no effect
    clk.advance(10ms);
    main_ctx.poll();
    REQUIRE(errors.num_timeouts_ == 0);
    REQUIRE(errors.num_other_ == 0);
    REQUIRE(j.state() == looper::job_state::completed);
    REQUIRE(sc.close(1s));
}

TEST_CASE("the first continuation to reach the context wins", "[timeout]") {
    // Both the delivery and the timer are ready at the same poll; the timer was due first
    looper::manual_clock clk;
    looper::dispatcher_pool pool{1};
    looper::execution_context main_ctx{"main", clk};
    auto sc = looper::scope::create(pool);

    error_recorder errors;
    sc.set_exception_handler([&](std::exception_ptr ex) { errors(ex); });

    std::atomic<bool> release{false};
    int num_values = 0;
    auto j = sc.launch_with_timeout(
            [&]() {
                while (!release.load())
                    std::this_thread::sleep_for(100us);
                return 1;
            },
            main_ctx, 10ms, [&](int) { num_values++; });

    clk.advance(10ms);
    REQUIRE(main_ctx.poll() == 1);
    REQUIRE(errors.num_timeouts_ == 1);

    release = true;
    REQUIRE(j.wait_for(1s));
    run_for(main_ctx, 5ms);
    REQUIRE(num_values == 0);
    REQUIRE(errors.num_timeouts_ == 1);
    REQUIRE(sc.close(1s));
}

TEST_CASE("a job cancelled by its scope doesn't time out", "[timeout]") {
    looper::manual_clock clk;
    looper::dispatcher_pool pool{1};
    looper::execution_context main_ctx{"main", clk};
    auto sc = looper::scope::create(pool);

    error_recorder errors;
    sc.set_exception_handler([&](std::exception_ptr ex) { errors(ex); });

    auto j = sc.launch_with_timeout(
            []() {
                for (int i = 0; i < 10'000; i++) {
                    looper::this_job::check_cancelled();
                    std::this_thread::sleep_for(100us);
                }
                return 1;
            },
            main_ctx, 10ms, [](int) {});
    sc.cancel();
    REQUIRE(j.wait_for(1s));

    clk.advance(10ms);
    main_ctx.poll();
    REQUIRE(errors.num_timeouts_ == 0);
    REQUIRE(errors.num_other_ == 0);
    REQUIRE(sc.close(1s));
}

TEST_CASE("a timeout with the default handler cancels the siblings", "[timeout]") {
    looper::manual_clock clk;
    looper::dispatcher_pool pool{2};
    looper::execution_context main_ctx{"main", clk};
    auto sc = looper::scope::create(pool);

    auto slow_closure = []() {
        for (int i = 0; i < 10'000; i++) {
            looper::this_job::check_cancelled();
            std::this_thread::sleep_for(100us);
        }
        return 1;
    };
    auto timed = sc.launch_with_timeout(slow_closure, main_ctx, 10ms, [](int) {});
    auto sibling = sc.launch(slow_closure, main_ctx);

    clk.advance(10ms);
    main_ctx.poll();
    REQUIRE(timed.wait_for(1s));
    REQUIRE(sibling.wait_for(1s));
    REQUIRE(timed.state() == looper::job_state::cancelled);
    REQUIRE(sibling.state() == looper::job_state::cancelled);
    REQUIRE(sc.close(1s));
}
