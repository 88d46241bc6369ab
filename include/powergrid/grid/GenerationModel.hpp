#pragma once
#include <vector>
#include <entt/entt.hpp>

#include "powergrid/grid/Components.hpp"
#include "powergrid/grid/Types.hpp"

namespace powergrid::sys {

// A producer entered or left Operational this tick.
struct GeneratorTransition {
    NodeId        producer{NullNode};
    ProducerState from{ProducerState::Idle};
    ProducerState to{ProducerState::Idle};

    [[nodiscard]] bool became_operational() const noexcept { return to == ProducerState::Operational; }
};

struct GenerationTick {
    std::vector<GeneratorTransition> transitions;   // ascending by producer
    std::vector<NodeId>              burned;        // producers whose fuel went down
    std::vector<NodeId>              state_changed; // any state change, incl. Stalled -> Idle
};

// One tick of the producer state machine:
//   Idle        -> Operational  fuel-less: at once; fuelled: after startup_delay_ticks
//                               consecutive ticks with fuel (timer resets at zero fuel)
//   Operational -> Stalled      when this tick's burn leaves the slot empty
//   Stalled     -> Idle         at the start of the next evaluation
// Returns the state after the step.
ProducerState AdvanceProducer(comp::Producer& producer, comp::FuelSlot* fuel);

// Runs AdvanceProducer over every producer in the registry.
GenerationTick UpdateGenerators(entt::registry& reg);

// Validated refuel. Returns false (and logs) for non-fuelled nodes and
// non-positive or non-finite amounts.
bool DepositFuel(entt::registry& reg, NodeId producer, double amount);

} // namespace powergrid::sys
