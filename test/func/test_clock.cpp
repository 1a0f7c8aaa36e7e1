#include <catch2/catch.hpp>
#include <looper/clock.hpp>

#include <atomic>

using namespace std::chrono_literals;

TEST_CASE("steady clock moves forward", "[clock]") {
    auto& clk = looper::steady_clock_source::instance();
    auto t1 = clk.now();
    auto t2 = clk.now();
    REQUIRE(t2 >= t1);
    REQUIRE(&clk == &looper::steady_clock_source::instance());
}

TEST_CASE("manual clock only moves when advanced", "[clock]") {
    looper::manual_clock clk;
    auto t0 = clk.now();
    REQUIRE(clk.now() == t0);
    clk.advance(10ms);
    REQUIRE(clk.now() - t0 == looper::clock::duration{10ms});
    clk.advance(5ms);
    REQUIRE(clk.now() - t0 == looper::clock::duration{15ms});
}

TEST_CASE("manual clock can start at a given time", "[clock]") {
    looper::clock::time_point start{1h};
    looper::manual_clock clk{start};
    REQUIRE(clk.now() == start);
}

TEST_CASE("manual clock notifies its listeners", "[clock]") {
    looper::manual_clock clk;
    std::atomic<int> calls1{0};
    std::atomic<int> calls2{0};
    int key1 = 0;
    int key2 = 0;
    clk.add_listener(&key1, [&]() { calls1++; });
    clk.add_listener(&key2, [&]() { calls2++; });

    clk.advance(1ms);
    REQUIRE(calls1.load() == 1);
    REQUIRE(calls2.load() == 1);

    clk.remove_listener(&key1);
    clk.advance(1ms);
    REQUIRE(calls1.load() == 1);
    REQUIRE(calls2.load() == 2);
}
