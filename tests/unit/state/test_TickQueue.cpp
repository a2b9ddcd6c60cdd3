#include <pathbind/state/TickExecutor.hpp>

#include "LogCapture.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

using namespace PB;

TEST_SUITE("state.tick_queue") {

TEST_CASE("jobs never run inside post") {
    TickQueue queue;
    int       runs = 0;
    REQUIRE_FALSE(queue.post([&] { ++runs; }).has_value());
    CHECK(runs == 0);
    CHECK(queue.pending() == 1);

    CHECK(queue.runOnce() == 1);
    CHECK(runs == 1);
    CHECK(queue.pending() == 0);
}

TEST_CASE("a turn runs only the jobs queued when it started") {
    TickQueue        queue;
    std::vector<int> order;
    REQUIRE_FALSE(queue.post([&] {
        order.push_back(1);
        (void)queue.post([&] { order.push_back(3); });
    }));
    REQUIRE_FALSE(queue.post([&] { order.push_back(2); }));

    CHECK(queue.runOnce() == 2);
    CHECK(order == std::vector<int>{1, 2});
    CHECK(queue.pending() == 1);

    CHECK(queue.runOnce() == 1);
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("drain runs turns until idle and stops a self-reposting job") {
    TickQueue queue;
    int       hops = 0;
    std::function<void()> hop;
    hop = [&] {
        if (++hops < 5)
            (void)queue.post(hop);
    };
    REQUIRE_FALSE(queue.post(hop));
    CHECK(queue.drain() == 5);
    CHECK(hops == 5);

    LogCapture            capture;
    std::function<void()> forever;
    forever = [&] { (void)queue.post(forever); };
    REQUIRE_FALSE(queue.post(forever));
    CHECK(queue.drain(3) == 3);
    CHECK(queue.pending() == 1);
    CHECK(capture.warnings("TickQueue") == 1);
    queue.clear();
    CHECK(queue.pending() == 0);
}

TEST_CASE("refused posts") {
    TickQueue queue;

    auto empty = queue.post(TickExecutor::Job{});
    REQUIRE(empty.has_value());
    CHECK(empty->code == Error::Code::InvalidArgument);

    int runs = 0;
    REQUIRE_FALSE(queue.post([&] { ++runs; }));
    queue.close();
    CHECK(queue.isClosed());
    CHECK(queue.pending() == 0);

    auto closed = queue.post([&] { ++runs; });
    REQUIRE(closed.has_value());
    CHECK(closed->code == Error::Code::Destroyed);
    CHECK(queue.drain() == 0);
    CHECK(runs == 0);
}

TEST_CASE("a throwing job is logged and the turn continues") {
    LogCapture capture;
    TickQueue  queue;
    bool       after = false;
    REQUIRE_FALSE(queue.post([] { throw std::runtime_error("boom"); }));
    REQUIRE_FALSE(queue.post([&] { after = true; }));

    CHECK(queue.runOnce() == 2);
    CHECK(after);
    CHECK(capture.count("TickQueue") == 1);
    CHECK(capture.contains("boom"));
}

} // TEST_SUITE
