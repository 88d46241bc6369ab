#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>

#include "powergrid/events/EventBus.hpp"
#include "powergrid/grid/BalanceCalculator.hpp"
#include "powergrid/grid/ConnectivityTracker.hpp"
#include "powergrid/grid/ConsumerGate.hpp"
#include "powergrid/grid/Events.hpp"
#include "powergrid/grid/GridConfig.hpp"
#include "powergrid/grid/NetworkRegistry.hpp"
#include "powergrid/grid/Snapshot.hpp"
#include "powergrid/grid/TopologyNotifier.hpp"
#include "powergrid/grid/Types.hpp"
#include "powergrid/save/GridSave.hpp"

namespace powergrid {

struct TickReport {
    std::uint64_t tick{0};
    std::size_t   applied_events{0};
    std::size_t   dropped_events{0};
    std::size_t   touched_networks{0};
    std::size_t   balance_flips{0};              // networks whose has_surplus changed
    NetworkId     slowest_network{NoNetwork};    // most expensive balance recompute
    double        slowest_network_ms{0.0};
    double        elapsed_ms{0.0};
    bool          over_budget{false};
};

// The grid context: one per loaded world. Constructing it is world load,
// teardown() is world unload; nothing here is global.
//
// Threading: create_node_id(), submit() and snapshot() may be called from any
// thread. Everything else belongs to the thread that calls tick().
class PowerGrid {
public:
    explicit PowerGrid(const GridConfig& cfg = {});

    PowerGrid(const PowerGrid&)            = delete;
    PowerGrid& operator=(const PowerGrid&) = delete;

    // ---- inbound ------------------------------------------------------------
    [[nodiscard]] NodeId create_node_id();

    // Buffered; applied in submission order at the start of the next tick().
    void submit(evt::InboundEvent event);
    [[nodiscard]] std::size_t pending_events() const;

    // ---- simulation ---------------------------------------------------------
    TickReport tick();

    // Drops every node, network, pending event, snapshot and listener.
    void teardown();

    // ---- live queries (tick thread) -----------------------------------------
    [[nodiscard]] std::optional<NetworkStats> get_network_stats(NetworkId id) const;
    [[nodiscard]] bool is_powered(NodeId consumer) const;
    [[nodiscard]] std::optional<ProducerStatus> get_producer_state(NodeId producer) const;

    [[nodiscard]] NetworkId network_of(NodeId node) const { return networks_.network_of(node); }
    [[nodiscard]] std::vector<NetworkId> networks() const;
    [[nodiscard]] bool contains(NodeId node) const { return reg_.valid(node); }
    [[nodiscard]] std::size_t node_count() const noexcept { return tracker_.node_count(); }

    [[nodiscard]] NodeId node_at(const GridPos& pos) const;
    [[nodiscard]] std::vector<NodeId> neighbours_of(const GridPos& pos) const;
    [[nodiscard]] std::vector<NodeId> links_of(NodeId node) const;

    // Every change derived in the last tick, before outbound filtering.
    [[nodiscard]] const std::vector<evt::NetworkTopologyChanged>& last_changes() const noexcept { return notifier_.last(); }

    // ---- any thread ---------------------------------------------------------
    [[nodiscard]] std::shared_ptr<const GridSnapshot> snapshot() const { return publisher_.latest(); }

    // ---- outbound -----------------------------------------------------------
    [[nodiscard]] EventBus& events() noexcept { return bus_; }

    // ---- persistence --------------------------------------------------------
    [[nodiscard]] save::GridSave export_state() const;

    // Rebuilds the grid from a save; listeners stay connected, nothing is emitted.
    // Returns the number of nodes restored.
    std::size_t import_state(const save::GridSave& save);

    // ---- misc ---------------------------------------------------------------
    [[nodiscard]] const GridConfig& config() const noexcept { return cfg_; }
    void set_config(const GridConfig& cfg);

    [[nodiscard]] std::uint64_t tick_index() const noexcept { return tick_; }
    [[nodiscard]] const entt::registry& registry() const noexcept { return reg_; }
    [[nodiscard]] const NetworkRegistry& network_registry() const noexcept { return networks_; }

private:
    struct Settled {
        RegistryUpdate         update;
        std::vector<NetworkId> dirty;        // balance + gate were recomputed
        std::vector<NetworkId> view_dirty;   // snapshot view must be rebuilt
        BalancePass            balance;
        std::vector<NodeId>    removed;      // nodes removed since the last update
        std::vector<PowerFlip> flips;
    };

    bool apply(const evt::NodePlaced& e);
    bool apply(const evt::NodeRemoved& e);
    bool apply(const evt::LinkEstablished& e);
    bool apply(const evt::LinkBroken& e);
    bool apply(const evt::FuelDeposited& e);

    [[nodiscard]] bool minted(NodeId id) const;
    void retire_id(NodeId id);
    void prepare_storage();
    void reset_state();

    Settled settle(bool advance_generators);
    void publish(const Settled& step, bool emit);

    GridConfig cfg_;

    // Id arena; shared with placement code on other threads.
    mutable std::mutex ids_mutex_;
    entt::registry     ids_;

    mutable std::mutex              inbox_mutex_;
    std::vector<evt::InboundEvent>  inbox_;

    entt::registry                               reg_;
    std::unordered_map<GridPos, NodeId, GridPosHash> positions_;
    ConnectivityTracker                          tracker_;
    NetworkRegistry                              networks_;
    BalanceCalculator                            balance_;
    ConsumerGate                                 gate_;
    TopologyNotifier                             notifier_;
    EventBus                                     bus_;
    SnapshotPublisher                            publisher_;

    std::shared_ptr<const GridSnapshot> previous_;
    std::vector<NodeId>                 removed_;    // since the last registry update
    std::vector<NodeId>                 refuelled_;  // since the last snapshot
    std::uint64_t                       tick_{0};
};

} // namespace powergrid
