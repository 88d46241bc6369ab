#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <entt/entt.hpp>

namespace powergrid {

// Node handles are EnTT identifiers: slot index + version. A handle captured
// before its node was removed fails registry().valid() once the slot is reused.
using NodeId    = entt::entity;
using NetworkId = std::uint32_t;

constexpr NodeId    NullNode  = entt::null;
constexpr NetworkId NoNetwork = 0;

enum class NodeKind : std::uint8_t { Producer, Consumer, Link };

enum class ProducerState : std::uint8_t {
    Idle,        // startup pending
    Operational,
    Stalled      // fuel exhausted
};

struct GridPos {
    int x{0}, y{0}, z{0};

    friend bool operator==(const GridPos&, const GridPos&) = default;
};

struct GridPosHash {
    std::size_t operator()(const GridPos& p) const noexcept {
        // 3 large primes; block coordinates are small so this spreads well enough.
        const auto ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.x));
        const auto uy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.y));
        const auto uz = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.z));
        return static_cast<std::size_t>(ux * 73856093ull ^ uy * 19349663ull ^ uz * 83492791ull);
    }
};

struct NetworkStats {
    std::size_t   member_count{0};
    std::uint64_t supply{0};
    std::uint64_t demand{0};
    bool          has_surplus{true};

    // Signed headroom for UI display; negative while in deficit.
    [[nodiscard]] std::int64_t surplus() const noexcept {
        return static_cast<std::int64_t>(supply) - static_cast<std::int64_t>(demand);
    }
};

struct ProducerStatus {
    ProducerState state{ProducerState::Idle};
    double        fuel_remaining{0.0};
};

// The whole balance model: binary, no brownout.
[[nodiscard]] constexpr bool HasSurplus(std::uint64_t supply, std::uint64_t demand) noexcept {
    return supply >= demand;
}

// Integral form of a handle for logs and save files.
[[nodiscard]] inline std::uint32_t ToIntegral(NodeId id) noexcept {
    return static_cast<std::uint32_t>(entt::to_integral(id));
}

const char* ToString(NodeKind kind) noexcept;
const char* ToString(ProducerState state) noexcept;

bool ParseNodeKind(std::string_view text, NodeKind& out) noexcept;
bool ParseProducerState(std::string_view text, ProducerState& out) noexcept;

} // namespace powergrid
