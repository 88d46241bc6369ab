#pragma once
#include <cstdint>
#include "powergrid/grid/Types.hpp"

namespace powergrid::comp {

// Every placed node carries one. Kind and position never change after placement.
struct PowerNode {
    NodeKind kind{NodeKind::Link};
    GridPos  position{};
};

struct Producer {
    std::uint32_t output{0};
    ProducerState state{ProducerState::Idle};

    [[nodiscard]] bool operational() const noexcept { return state == ProducerState::Operational; }
};

// Only on producers that burn fuel; absent for unconditional sources.
struct FuelSlot {
    double        quantity{0.0};
    double        consumption_rate{1.0};   // units per tick
    std::uint32_t startup_delay_ticks{0};
    std::uint32_t startup_timer{0};
};

struct Consumer {
    std::uint32_t demand{0};
};

} // namespace powergrid::comp
