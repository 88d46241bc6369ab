#include "powergrid/grid/GenerationModel.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace powergrid::sys {

ProducerState AdvanceProducer(comp::Producer& producer, comp::FuelSlot* fuel)
{
    // A stalled producer re-enters the startup sequence straight away.
    if (producer.state == ProducerState::Stalled)
        producer.state = ProducerState::Idle;

    switch (producer.state)
    {
    case ProducerState::Idle:
        if (!fuel)
        {
            producer.state = ProducerState::Operational;
        }
        else if (fuel->quantity > 0.0)
        {
            ++fuel->startup_timer;
            if (fuel->startup_timer >= fuel->startup_delay_ticks)
            {
                fuel->startup_timer = 0;
                producer.state = ProducerState::Operational;
            }
        }
        else
        {
            fuel->startup_timer = 0;
        }
        break;

    case ProducerState::Operational:
        if (fuel)
        {
            const double burn = std::min(fuel->consumption_rate, fuel->quantity);
            fuel->quantity -= burn;
            if (fuel->quantity <= 0.0)
            {
                fuel->quantity = 0.0;
                producer.state = ProducerState::Stalled;
            }
        }
        break;

    case ProducerState::Stalled:
        break;
    }

    return producer.state;
}

GenerationTick UpdateGenerators(entt::registry& reg)
{
    GenerationTick out;

    auto view = reg.view<comp::Producer>();
    for (const auto e : view)
    {
        auto& producer = view.get<comp::Producer>(e);
        auto* fuel = reg.try_get<comp::FuelSlot>(e);

        const ProducerState before = producer.state;
        const double fuelBefore = fuel ? fuel->quantity : 0.0;

        const ProducerState after = AdvanceProducer(producer, fuel);

        if ((before == ProducerState::Operational) != (after == ProducerState::Operational))
        {
            out.transitions.push_back(GeneratorTransition{e, before, after});
            if (after == ProducerState::Stalled)
                spdlog::info("producer {} stalled: fuel exhausted", ToIntegral(e));
            else
                spdlog::debug("producer {} {} -> {}", ToIntegral(e), ToString(before), ToString(after));
        }

        if (fuel && fuel->quantity != fuelBefore)
            out.burned.push_back(e);
        if (before != after)
            out.state_changed.push_back(e);
    }

    auto byId = [](const auto& a, const auto& b) { return a.producer < b.producer; };
    std::sort(out.transitions.begin(), out.transitions.end(), byId);
    std::sort(out.burned.begin(), out.burned.end());
    std::sort(out.state_changed.begin(), out.state_changed.end());
    return out;
}

bool DepositFuel(entt::registry& reg, NodeId producer, double amount)
{
    if (!reg.valid(producer) || !reg.all_of<comp::FuelSlot>(producer))
    {
        spdlog::warn("FuelDeposited: node {} is not a fuelled producer; dropped", ToIntegral(producer));
        return false;
    }
    if (!std::isfinite(amount) || amount <= 0.0)
    {
        spdlog::warn("FuelDeposited: invalid amount {} for producer {}; dropped", amount, ToIntegral(producer));
        return false;
    }

    reg.get<comp::FuelSlot>(producer).quantity += amount;
    return true;
}

} // namespace powergrid::sys
