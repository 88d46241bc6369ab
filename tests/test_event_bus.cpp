// tests/test_event_bus.cpp
//
// Deferred delivery and the nesting guard against listener feedback loops.

#include <doctest/doctest.h>

#include "powergrid/events/EventBus.hpp"

#include <vector>

using powergrid::EventBus;

namespace {

struct Ping { int n{0}; };

struct Recorder {
    std::vector<int> seen;
    void on(const Ping& p) { seen.push_back(p.n); }
};

// Re-publishes every ping it receives: an unbounded cycle without the guard.
struct Echo {
    EventBus* bus{nullptr};
    int       received{0};
    void on(const Ping& p)
    {
        ++received;
        bus->publish(Ping{p.n + 1});
    }
};

// Queues a follow-up for every ping it receives.
struct Requeue {
    EventBus* bus{nullptr};
    int       received{0};
    void on(const Ping& p)
    {
        ++received;
        bus->post(Ping{p.n + 1});
    }
};

} // namespace

TEST_CASE("EventBus: posted events wait for flush and arrive in order")
{
    EventBus bus;
    Recorder rec;
    bus.sink<Ping>().connect<&Recorder::on>(rec);

    bus.post(Ping{1});
    bus.post(Ping{2});
    CHECK(rec.seen.empty());
    CHECK(bus.pending() == 2);

    CHECK(bus.flush() == 1);
    CHECK(rec.seen == std::vector<int>{1, 2});
    CHECK(bus.pending() == 0);
    CHECK(bus.flush() == 0);
}

TEST_CASE("EventBus: publish delivers immediately")
{
    EventBus bus;
    Recorder rec;
    bus.sink<Ping>().connect<&Recorder::on>(rec);

    CHECK(bus.publish(Ping{7}));
    CHECK(rec.seen == std::vector<int>{7});
    CHECK(bus.depth() == 0);
}

TEST_CASE("EventBus: a re-publishing listener is cut off at max depth")
{
    EventBus bus(4);
    Echo echo{&bus};
    bus.sink<Ping>().connect<&Echo::on>(echo);

    CHECK(bus.publish(Ping{0}));
    CHECK(echo.received == 4);
    CHECK(bus.dropped() == 1);
    CHECK(bus.depth() == 0);

    // The guard resets: the next top-level publish goes through again.
    CHECK(bus.publish(Ping{0}));
    CHECK(echo.received == 8);
    CHECK(bus.dropped() == 2);
}

TEST_CASE("EventBus: flush stops after max depth rounds of listener-queued events")
{
    EventBus bus(3);
    Requeue rq{&bus};
    bus.sink<Ping>().connect<&Requeue::on>(rq);

    bus.post(Ping{0});
    CHECK(bus.flush() == 3);
    CHECK(rq.received == 3);
    CHECK(bus.dropped() == 1);
    CHECK(bus.pending() == 0);
}

TEST_CASE("EventBus: clear_pending keeps listeners, reset drops them")
{
    EventBus bus;
    Recorder rec;
    bus.sink<Ping>().connect<&Recorder::on>(rec);

    bus.post(Ping{1});
    bus.clear_pending();
    bus.flush();
    CHECK(rec.seen.empty());

    bus.publish(Ping{2});
    CHECK(rec.seen == std::vector<int>{2});

    bus.reset();
    bus.publish(Ping{3});
    CHECK(rec.seen == std::vector<int>{2});
}

TEST_CASE("EventBus: zero max depth is treated as one")
{
    EventBus bus(0);
    CHECK(bus.max_depth() == 1);
    bus.set_max_depth(0);
    CHECK(bus.max_depth() == 1);
}
