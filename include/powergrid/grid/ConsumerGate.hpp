#pragma once
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>

#include "powergrid/grid/NetworkRegistry.hpp"

namespace powergrid {

struct PowerFlip {
    NodeId consumer{NullNode};
    bool   powered{false};
};

// Per-consumer "may I run this tick" flag. Written once per tick, after the
// balance pass, from the owning network's has_surplus; never computed lazily.
//
// Machine logic that reads the gate treats unpowered as fully halted: no
// partial progress, no catch-up. Its own progress is left untouched here.
class ConsumerGate {
public:
    // Refreshes consumers of the given networks; returns actual flips, ascending.
    // A consumer seen for the first time starts unpowered.
    std::vector<PowerFlip> refresh(const NetworkRegistry& networks, const entt::registry& reg,
                                   const std::vector<NetworkId>& dirty);

    // Unknown, stale and non-consumer ids read as unpowered.
    [[nodiscard]] bool is_powered(NodeId consumer) const;

    void forget(NodeId consumer) { powered_.erase(consumer); }
    void clear() { powered_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return powered_.size(); }

private:
    std::unordered_map<NodeId, bool> powered_;
};

} // namespace powergrid
