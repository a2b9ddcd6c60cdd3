#include <pathbind/state/ChangeScheduler.hpp>

#include <doctest/doctest.h>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace PB;

namespace {

struct SchedulerFixture {
    TickQueue                                         queue;
    std::map<std::string, Value>                      live;
    std::vector<std::pair<std::string, std::string>>  delivered;
    std::function<void(std::string const&)>           onDispatch;
    std::shared_ptr<ChangeScheduler>                  scheduler;

    SchedulerFixture() {
        scheduler = std::make_shared<ChangeScheduler>(
                queue,
                [this](std::string const& path) {
                    auto it = live.find(path);
                    return it == live.end() ? Value{} : it->second;
                },
                [this](std::string const& path, Value const& value) {
                    delivered.emplace_back(path, value.toDisplayString());
                    if (onDispatch)
                        onDispatch(path);
                });
    }
};

} // namespace

TEST_SUITE("state.change_scheduler") {

TEST_CASE("writes in one tick coalesce into a single flush job") {
    SchedulerFixture f;
    f.scheduler->queueChange("count", Value{1});
    f.scheduler->queueChange("count", Value{2});
    f.scheduler->queueChange("count", Value{3});

    CHECK(f.queue.pending() == 1);
    CHECK(f.scheduler->isScheduled());
    CHECK(f.scheduler->pendingCount() == 1);
    CHECK(f.delivered.empty());

    CHECK(f.queue.runOnce() == 1);
    REQUIRE(f.delivered.size() == 1);
    CHECK(f.delivered[0] == std::pair<std::string, std::string>{"count", "3"});
    CHECK_FALSE(f.scheduler->isScheduled());
}

TEST_CASE("ancestors are notified with the value resolved at flush time") {
    SchedulerFixture f;
    f.scheduler->queueChange("a.b.c", Value{"x"});
    CHECK(f.scheduler->pendingCount() == 3);

    f.live["a.b"] = Value{"b-now"};
    f.live["a"]   = Value{"a-now"};

    f.queue.drain();
    REQUIRE(f.delivered.size() == 3);
    CHECK(f.delivered[0] == std::pair<std::string, std::string>{"a.b.c", "x"});
    CHECK(f.delivered[1] == std::pair<std::string, std::string>{"a.b", "b-now"});
    CHECK(f.delivered[2] == std::pair<std::string, std::string>{"a", "a-now"});
}

TEST_CASE("a direct write replaces an ancestor sentinel") {
    SchedulerFixture f;
    f.scheduler->queueChange("a.b", Value{1});
    f.scheduler->queueChange("a", Value{"direct"});
    f.live["a"] = Value{"resolved"};

    f.queue.drain();
    REQUIRE(f.delivered.size() == 2);
    CHECK(f.delivered[1] == std::pair<std::string, std::string>{"a", "direct"});
}

TEST_CASE("writes made by subscribers land in the next tick") {
    SchedulerFixture f;
    f.onDispatch = [&](std::string const& path) {
        if (path == "first")
            f.scheduler->queueChange("second", Value{2});
    };
    f.scheduler->queueChange("first", Value{1});

    CHECK(f.queue.runOnce() == 1);
    REQUIRE(f.delivered.size() == 1);
    CHECK(f.delivered[0].first == "first");
    CHECK(f.scheduler->pendingCount() == 1);
    CHECK(f.queue.pending() == 1);

    CHECK(f.queue.runOnce() == 1);
    REQUIRE(f.delivered.size() == 2);
    CHECK(f.delivered[1].first == "second");
}

TEST_CASE("flushSync delivers now and leaves the posted job idle") {
    SchedulerFixture f;
    f.scheduler->flushSync();
    CHECK(f.delivered.empty());

    f.scheduler->queueChange("x", Value{true});
    f.scheduler->flushSync();
    REQUIRE(f.delivered.size() == 1);
    CHECK(f.delivered[0].second == "true");

    f.queue.drain();
    CHECK(f.delivered.size() == 1);
}

TEST_CASE("flushSync inside a flush is ignored") {
    SchedulerFixture f;
    f.onDispatch = [&](std::string const& path) {
        if (path != "outer")
            return;
        f.scheduler->queueChange("inner", Value{1});
        CHECK(f.scheduler->isFlushing());
        f.scheduler->flushSync();
    };
    f.scheduler->queueChange("outer", Value{0});

    f.queue.runOnce();
    CHECK(f.delivered.size() == 1);
    f.queue.runOnce();
    CHECK(f.delivered.size() == 2);
}

TEST_CASE("clear drops the batch") {
    SchedulerFixture f;
    f.scheduler->queueChange("x", Value{1});
    f.scheduler->clear();
    CHECK(f.scheduler->pendingCount() == 0);
    f.queue.drain();
    CHECK(f.delivered.empty());
}

TEST_CASE("a refused post leaves the batch pending") {
    SchedulerFixture f;
    f.queue.close();
    f.scheduler->queueChange("x", Value{1});
    CHECK_FALSE(f.scheduler->isScheduled());
    CHECK(f.scheduler->pendingCount() == 1);
    f.scheduler->flushSync();
    CHECK(f.delivered.size() == 1);
}

} // TEST_SUITE
