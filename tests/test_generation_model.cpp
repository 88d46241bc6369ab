// tests/test_generation_model.cpp
//
// Producer state machine, fuel burn and refuel validation.

#include <doctest/doctest.h>

#include "powergrid/grid/GenerationModel.hpp"

#include <limits>

using namespace powergrid;

namespace {

comp::FuelSlot Slot(double quantity, std::uint32_t delay, double rate = 1.0)
{
    comp::FuelSlot s;
    s.quantity = quantity;
    s.startup_delay_ticks = delay;
    s.consumption_rate = rate;
    return s;
}

} // namespace

TEST_CASE("AdvanceProducer: fuel-less producers are operational at once and never stall")
{
    comp::Producer p{10, ProducerState::Idle};
    CHECK(sys::AdvanceProducer(p, nullptr) == ProducerState::Operational);
    for (int i = 0; i < 5; ++i)
        CHECK(sys::AdvanceProducer(p, nullptr) == ProducerState::Operational);
}

TEST_CASE("AdvanceProducer: an empty fuelled producer idles indefinitely")
{
    comp::Producer p{10, ProducerState::Idle};
    auto fuel = Slot(0.0, 3);
    for (int i = 0; i < 50; ++i)
        CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
    CHECK(fuel.startup_timer == 0);
}

TEST_CASE("AdvanceProducer: startup needs `delay` consecutive fuelled ticks, then burns")
{
    comp::Producer p{10, ProducerState::Idle};
    auto fuel = Slot(5.0, 3, 2.0);

    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Operational);
    CHECK(fuel.quantity == doctest::Approx(5.0));   // no burn on the startup tick

    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Operational);
    CHECK(fuel.quantity == doctest::Approx(3.0));
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Operational);
    CHECK(fuel.quantity == doctest::Approx(1.0));

    // Last partial unit: clamped to zero, stalls.
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Stalled);
    CHECK(fuel.quantity == 0.0);

    // Next evaluation: back to idle, stays there without fuel.
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
}

TEST_CASE("AdvanceProducer: a refuelled stalled producer restarts its timer on the same tick")
{
    comp::Producer p{10, ProducerState::Stalled};
    auto fuel = Slot(4.0, 2);

    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Idle);
    CHECK(fuel.startup_timer == 1);
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Operational);
}

TEST_CASE("AdvanceProducer: zero startup delay starts on the first fuelled tick")
{
    comp::Producer p{10, ProducerState::Idle};
    auto fuel = Slot(1.0, 0);
    CHECK(sys::AdvanceProducer(p, &fuel) == ProducerState::Operational);
}

TEST_CASE("UpdateGenerators reports flips, burns and state changes in id order")
{
    entt::registry reg;
    const auto a = reg.create();
    const auto b = reg.create();
    const auto c = reg.create();

    reg.emplace<comp::Producer>(a, 5u, ProducerState::Idle);                    // fuel-less
    reg.emplace<comp::Producer>(b, 5u, ProducerState::Operational);
    reg.emplace<comp::FuelSlot>(b, Slot(0.5, 1));                               // stalls now
    reg.emplace<comp::Producer>(c, 5u, ProducerState::Idle);
    reg.emplace<comp::FuelSlot>(c, Slot(0.0, 1));                               // stays idle

    const auto out = sys::UpdateGenerators(reg);

    REQUIRE(out.transitions.size() == 2);
    CHECK(out.transitions[0].producer == a);
    CHECK(out.transitions[0].became_operational());
    CHECK(out.transitions[1].producer == b);
    CHECK(out.transitions[1].to == ProducerState::Stalled);

    CHECK(out.burned == std::vector<NodeId>{b});
    CHECK(out.state_changed == std::vector<NodeId>{a, b});
    CHECK(reg.get<comp::FuelSlot>(b).quantity == 0.0);
}

TEST_CASE("DepositFuel validates target and amount")
{
    entt::registry reg;
    const auto fuelled = reg.create();
    const auto plain = reg.create();
    reg.emplace<comp::Producer>(fuelled, 5u, ProducerState::Idle);
    reg.emplace<comp::FuelSlot>(fuelled, Slot(1.0, 1));
    reg.emplace<comp::Producer>(plain, 5u, ProducerState::Idle);

    CHECK(sys::DepositFuel(reg, fuelled, 2.5));
    CHECK(reg.get<comp::FuelSlot>(fuelled).quantity == doctest::Approx(3.5));

    CHECK_FALSE(sys::DepositFuel(reg, fuelled, 0.0));
    CHECK_FALSE(sys::DepositFuel(reg, fuelled, -1.0));
    CHECK_FALSE(sys::DepositFuel(reg, fuelled, std::numeric_limits<double>::infinity()));
    CHECK_FALSE(sys::DepositFuel(reg, fuelled, std::numeric_limits<double>::quiet_NaN()));
    CHECK_FALSE(sys::DepositFuel(reg, plain, 1.0));
    CHECK_FALSE(sys::DepositFuel(reg, NullNode, 1.0));

    const auto gone = reg.create();
    reg.destroy(gone);
    CHECK_FALSE(sys::DepositFuel(reg, gone, 1.0));

    CHECK(reg.get<comp::FuelSlot>(fuelled).quantity == doctest::Approx(3.5));
}

TEST_CASE("fuel never increases without a deposit and never goes negative")
{
    comp::Producer p{10, ProducerState::Idle};
    auto fuel = Slot(7.3, 2, 0.7);

    double last = fuel.quantity;
    for (int i = 0; i < 40; ++i)
    {
        sys::AdvanceProducer(p, &fuel);
        CHECK(fuel.quantity <= last);
        CHECK(fuel.quantity >= 0.0);
        last = fuel.quantity;
    }
    CHECK(fuel.quantity == 0.0);
}
