#pragma once
#include <vector>

#include "powergrid/grid/Events.hpp"
#include "powergrid/grid/Snapshot.hpp"

namespace powergrid {

// Derives change events by comparing two consecutive snapshots; it never looks
// at live tick state. Networks whose view pointer is shared between the two
// snapshots are known unchanged and skipped.
//
//   previous id gone, survivors in >= 2 networks -> NetworkSplit{into}
//   previous id gone, survivors in 1 network     -> NetworkMerged{into}
//   previous id gone, no survivors               -> NetworkRemoved
//   new id not produced by a split or merge      -> NetworkCreated
//   node not in previous snapshot                -> <Kind>Added on its network
//   node not in current snapshot                 -> <Kind>Removed on its old network
//   producer whose operational flag flipped      -> GeneratorStateChanged
//   surviving id whose has_surplus flipped       -> BalanceChanged
//
// A producer that is already operational in the first snapshot it appears in
// (fuel-less, or fuelled with a zero delay) reports ProducerAdded only, never
// GeneratorStateChanged. Listeners tracking supply must also read
// ProducerAdded and check the producer's state or the network's stats.
//
// Output is ordered by network id, network-level changes before node-level
// ones, then by node id.
class TopologyNotifier {
public:
    const std::vector<evt::NetworkTopologyChanged>& diff(const GridSnapshot& previous, const GridSnapshot& current);

    [[nodiscard]] const std::vector<evt::NetworkTopologyChanged>& last() const noexcept { return changes_; }
    void clear() { changes_.clear(); }

private:
    std::vector<evt::NetworkTopologyChanged> changes_;
};

} // namespace powergrid
