#include "powergrid/grid/PowerGrid.hpp"
#include "powergrid/grid/Components.hpp"
#include "powergrid/grid/GenerationModel.hpp"
#include "core/Profile.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

namespace powergrid {

namespace {

using Clock = std::chrono::steady_clock;

void SortUnique(std::vector<NetworkId>& ids)
{
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    ids.erase(std::remove(ids.begin(), ids.end(), NoNetwork), ids.end());
}

constexpr GridPos kFaces[6] = {
    { 1, 0, 0}, {-1, 0, 0},
    { 0, 1, 0}, { 0,-1, 0},
    { 0, 0, 1}, { 0, 0,-1},
};

} // namespace

PowerGrid::PowerGrid(const GridConfig& cfg)
    : cfg_(cfg)
    , balance_(cfg.budget_ms)
    , bus_(cfg.max_event_depth)
    , previous_(std::make_shared<const GridSnapshot>())
{
    prepare_storage();
}

void PowerGrid::set_config(const GridConfig& cfg)
{
    cfg_ = cfg;
    balance_.set_budget_ms(cfg.budget_ms);
    bus_.set_max_depth(cfg.max_event_depth);
}

// Const lookups (try_get/all_of) on a pool that was never touched are only
// safe once the pool exists.
void PowerGrid::prepare_storage()
{
    reg_.storage<comp::PowerNode>();
    reg_.storage<comp::Producer>();
    reg_.storage<comp::FuelSlot>();
    reg_.storage<comp::Consumer>();
}

NodeId PowerGrid::create_node_id()
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    return ids_.create();
}

bool PowerGrid::minted(NodeId id) const
{
    if (id == NullNode)
        return false;
    std::lock_guard<std::mutex> lock(ids_mutex_);
    return ids_.valid(id);
}

void PowerGrid::retire_id(NodeId id)
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    if (ids_.valid(id))
        ids_.destroy(id);
}

void PowerGrid::submit(evt::InboundEvent event)
{
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_.push_back(std::move(event));
}

std::size_t PowerGrid::pending_events() const
{
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

// ---------------------------------------------------------------------------
// Inbound event application
// ---------------------------------------------------------------------------

bool PowerGrid::apply(const evt::NodePlaced& e)
{
    if (!minted(e.id))
    {
        spdlog::warn("NodePlaced: node {} was never issued or has been retired; dropped", ToIntegral(e.id));
        return false;
    }
    if (reg_.valid(e.id))
    {
        spdlog::debug("NodePlaced: node {} already placed; ignored", ToIntegral(e.id));
        return true;
    }
    if (const auto it = positions_.find(e.position); it != positions_.end())
    {
        spdlog::warn("NodePlaced: ({}, {}, {}) is occupied by node {}; node {} dropped",
                     e.position.x, e.position.y, e.position.z, ToIntegral(it->second), ToIntegral(e.id));
        return false;
    }

    const NodeId created = reg_.create(e.id);
    if (created != e.id)
    {
        spdlog::error("NodePlaced: registry returned {} for requested node {}; dropped",
                      ToIntegral(created), ToIntegral(e.id));
        reg_.destroy(created);
        return false;
    }

    reg_.emplace<comp::PowerNode>(e.id, e.kind, e.position);

    switch (e.kind)
    {
    case NodeKind::Producer:
    {
        reg_.emplace<comp::Producer>(e.id, e.supply_or_demand, ProducerState::Idle);
        if (e.requires_fuel)
        {
            comp::FuelSlot slot;
            slot.consumption_rate = e.consumption_rate.value_or(cfg_.default_consumption_rate);
            if (!std::isfinite(slot.consumption_rate) || slot.consumption_rate < 0.0)
            {
                spdlog::warn("NodePlaced: producer {} has invalid consumption rate {}; using {}",
                             ToIntegral(e.id), slot.consumption_rate, cfg_.default_consumption_rate);
                slot.consumption_rate = cfg_.default_consumption_rate;
            }
            slot.startup_delay_ticks = e.startup_delay_ticks.value_or(cfg_.default_startup_delay_ticks);
            reg_.emplace<comp::FuelSlot>(e.id, slot);
        }
        break;
    }
    case NodeKind::Consumer:
        reg_.emplace<comp::Consumer>(e.id, e.supply_or_demand);
        break;
    case NodeKind::Link:
        break;
    }

    positions_.emplace(e.position, e.id);
    tracker_.add_node(e.id);

    if (cfg_.auto_link_adjacent)
    {
        for (const NodeId other : neighbours_of(e.position))
            tracker_.connect(e.id, other);
    }

    spdlog::debug("NodePlaced: {} {} at ({}, {}, {})", ToString(e.kind), ToIntegral(e.id),
                  e.position.x, e.position.y, e.position.z);
    return true;
}

bool PowerGrid::apply(const evt::NodeRemoved& e)
{
    if (!reg_.valid(e.id))
    {
        spdlog::warn("NodeRemoved: node {} does not exist; dropped", ToIntegral(e.id));
        return false;
    }

    positions_.erase(reg_.get<comp::PowerNode>(e.id).position);
    tracker_.remove_node(e.id);
    gate_.forget(e.id);
    reg_.destroy(e.id);
    retire_id(e.id);
    removed_.push_back(e.id);

    spdlog::debug("NodeRemoved: {}", ToIntegral(e.id));
    return true;
}

bool PowerGrid::apply(const evt::LinkEstablished& e)
{
    if (!reg_.valid(e.a) || !reg_.valid(e.b))
    {
        spdlog::warn("LinkEstablished: {} - {} references a missing node; dropped", ToIntegral(e.a), ToIntegral(e.b));
        return false;
    }
    if (e.a == e.b)
    {
        spdlog::debug("LinkEstablished: self-link on {} ignored", ToIntegral(e.a));
        return true;
    }
    if (!tracker_.connect(e.a, e.b))
        spdlog::debug("LinkEstablished: {} - {} already linked", ToIntegral(e.a), ToIntegral(e.b));
    return true;
}

bool PowerGrid::apply(const evt::LinkBroken& e)
{
    if (!reg_.valid(e.a) || !reg_.valid(e.b))
    {
        spdlog::warn("LinkBroken: {} - {} references a missing node; dropped", ToIntegral(e.a), ToIntegral(e.b));
        return false;
    }
    if (!tracker_.disconnect(e.a, e.b))
    {
        spdlog::warn("LinkBroken: no link between {} and {}; ignored", ToIntegral(e.a), ToIntegral(e.b));
        return false;
    }
    return true;
}

bool PowerGrid::apply(const evt::FuelDeposited& e)
{
    if (!sys::DepositFuel(reg_, e.producer_id, e.amount))
        return false;
    refuelled_.push_back(e.producer_id);
    return true;
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

TickReport PowerGrid::tick()
{
    PG_ZONE("PowerGrid::tick");
    const auto start = Clock::now();

    TickReport report;
    report.tick = ++tick_;

    std::vector<evt::InboundEvent> batch;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        batch.swap(inbox_);
    }

    for (const auto& ev : batch)
    {
        if (std::visit([this](const auto& e) { return this->apply(e); }, ev))
            ++report.applied_events;
        else
            ++report.dropped_events;
    }

    const Settled step = settle(/*advance_generators=*/true);
    report.touched_networks = step.dirty.size();
    report.balance_flips = step.balance.flipped.size();
    report.slowest_network = step.balance.slowest;
    report.slowest_network_ms = step.balance.slowest_ms;
    report.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();

    if (report.elapsed_ms > cfg_.budget_ms)
    {
        report.over_budget = true;
        const Network* slowest = networks_.find(step.balance.slowest);
        spdlog::warn("tick {}: recompute took {:.3f} ms (budget {:.1f} ms), {} networks touched, "
                     "slowest network {} ({} nodes, {:.3f} ms)",
                     report.tick, report.elapsed_ms, cfg_.budget_ms, report.touched_networks,
                     step.balance.slowest, slowest ? slowest->members.size() : 0u, step.balance.slowest_ms);
    }
    PG_PLOT("powergrid.recompute_ms", report.elapsed_ms);

    publish(step, /*emit=*/true);
    return report;
}

PowerGrid::Settled PowerGrid::settle(bool advance_generators)
{
    PG_ZONE("PowerGrid::settle");
    Settled out;

    out.update = networks_.update(tracker_, removed_);
    out.removed = std::move(removed_);
    removed_.clear();
    out.dirty = out.update.touched;

    sys::GenerationTick gen;
    if (advance_generators)
        gen = sys::UpdateGenerators(reg_);

    for (const auto& t : gen.transitions)
        out.dirty.push_back(networks_.network_of(t.producer));
    SortUnique(out.dirty);

    out.balance = balance_.run(networks_, reg_, out.dirty);
    out.flips = gate_.refresh(networks_, reg_, out.dirty);

    out.view_dirty = out.dirty;
    for (const NodeId n : gen.burned)
        out.view_dirty.push_back(networks_.network_of(n));
    for (const NodeId n : gen.state_changed)
        out.view_dirty.push_back(networks_.network_of(n));
    for (const NodeId n : refuelled_)
        out.view_dirty.push_back(networks_.network_of(n));
    refuelled_.clear();
    SortUnique(out.view_dirty);

    return out;
}

void PowerGrid::publish(const Settled& step, bool emit)
{
    PG_ZONE("PowerGrid::publish");

    auto next = std::make_shared<GridSnapshot>();
    next->tick = tick_;
    next->networks = previous_->networks;

    for (const NetworkId id : step.update.retired)
        next->networks.erase(id);
    for (const NetworkId id : step.view_dirty)
    {
        if (const Network* net = networks_.find(id))
            next->networks[id] = BuildNetworkView(*net, reg_, gate_);
    }

    const bool structural = !step.update.touched.empty() || !step.update.retired.empty()
                            || !step.removed.empty();
    if (structural)
    {
        std::vector<std::pair<NodeId, NetworkId>> assign;
        for (const NetworkId id : step.update.touched)
        {
            if (const Network* net = networks_.find(id))
            {
                for (const NodeId m : net->members)
                    assign.emplace_back(m, id);
            }
        }
        next->node_index = std::make_shared<const NodeIndex>(previous_->node_index->updated(assign, step.removed));
    }
    else
    {
        next->node_index = previous_->node_index;
    }

    const auto& changes = notifier_.diff(*previous_, *next);

    previous_ = std::move(next);
    publisher_.publish(previous_);

    if (!emit)
        return;

    for (const auto& change : changes)
    {
        if (cfg_.forwards(change.change_kind))
            bus_.post(change);
    }
    if (cfg_.forward_consumer_power)
    {
        for (const PowerFlip& f : step.flips)
            bus_.post(evt::ConsumerPowerStateChanged{f.consumer, f.powered});
    }
    bus_.flush();
}

void PowerGrid::reset_state()
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(ids_mutex_);
        ids_.clear();
    }

    reg_ = entt::registry{};
    prepare_storage();

    positions_.clear();
    tracker_.clear();
    networks_.clear();
    gate_.clear();
    notifier_.clear();
    bus_.clear_pending();

    previous_ = std::make_shared<const GridSnapshot>();
    publisher_.reset();
    removed_.clear();
    refuelled_.clear();
    tick_ = 0;
}

void PowerGrid::teardown()
{
    reset_state();
    bus_.reset();
    spdlog::info("power grid torn down");
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<NetworkStats> PowerGrid::get_network_stats(NetworkId id) const
{
    if (const Network* net = networks_.find(id))
        return net->stats();
    return std::nullopt;
}

bool PowerGrid::is_powered(NodeId consumer) const
{
    return reg_.valid(consumer) && reg_.all_of<comp::Consumer>(consumer) && gate_.is_powered(consumer);
}

std::optional<ProducerStatus> PowerGrid::get_producer_state(NodeId producer) const
{
    if (!reg_.valid(producer))
        return std::nullopt;

    const auto* p = reg_.try_get<comp::Producer>(producer);
    if (!p)
        return std::nullopt;

    const auto* fuel = reg_.try_get<comp::FuelSlot>(producer);
    return ProducerStatus{p->state, fuel ? fuel->quantity : 0.0};
}

std::vector<NetworkId> PowerGrid::networks() const
{
    std::vector<NetworkId> out;
    out.reserve(networks_.size());
    for (const auto& [id, net] : networks_.networks())
        out.push_back(id);
    return out;
}

NodeId PowerGrid::node_at(const GridPos& pos) const
{
    const auto it = positions_.find(pos);
    return it == positions_.end() ? NullNode : it->second;
}

std::vector<NodeId> PowerGrid::neighbours_of(const GridPos& pos) const
{
    std::vector<NodeId> out;
    for (const GridPos& d : kFaces)
    {
        const NodeId n = node_at(GridPos{pos.x + d.x, pos.y + d.y, pos.z + d.z});
        if (n != NullNode)
            out.push_back(n);
    }
    return out;
}

std::vector<NodeId> PowerGrid::links_of(NodeId node) const
{
    std::vector<NodeId> out = tracker_.links_of(node);
    std::sort(out.begin(), out.end());
    return out;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

save::GridSave PowerGrid::export_state() const
{
    save::GridSave out;
    out.tick = tick_;

    std::vector<NodeId> ids;
    for (const auto e : reg_.view<comp::PowerNode>())
        ids.push_back(e);
    std::sort(ids.begin(), ids.end());

    std::unordered_map<NodeId, std::uint32_t> index;
    out.nodes.reserve(ids.size());
    for (const NodeId id : ids)
    {
        const auto& node = reg_.get<comp::PowerNode>(id);

        save::NodeRecord rec;
        rec.kind = node.kind;
        rec.position = node.position;
        if (const auto* p = reg_.try_get<comp::Producer>(id))
        {
            rec.amount = p->output;
            rec.state = p->state;
        }
        if (const auto* c = reg_.try_get<comp::Consumer>(id))
            rec.amount = c->demand;
        if (const auto* fuel = reg_.try_get<comp::FuelSlot>(id))
        {
            rec.requires_fuel = true;
            rec.fuel = fuel->quantity;
            rec.consumption_rate = fuel->consumption_rate;
            rec.startup_delay_ticks = fuel->startup_delay_ticks;
            rec.startup_timer = fuel->startup_timer;
        }

        index.emplace(id, static_cast<std::uint32_t>(out.nodes.size()));
        out.nodes.push_back(std::move(rec));
    }

    for (const NodeId id : ids)
    {
        for (const NodeId other : links_of(id))
        {
            if (id < other)
                out.links.push_back(save::LinkRecord{index.at(id), index.at(other)});
        }
    }

    return out;
}

std::size_t PowerGrid::import_state(const save::GridSave& save)
{
    PG_ZONE("PowerGrid::import_state");
    reset_state();

    std::vector<NodeId> handles;
    handles.reserve(save.nodes.size());

    std::size_t restored = 0;
    for (const save::NodeRecord& rec : save.nodes)
    {
        evt::NodePlaced placed;
        placed.id = create_node_id();
        placed.kind = rec.kind;
        placed.position = rec.position;
        placed.supply_or_demand = rec.amount;
        placed.requires_fuel = rec.requires_fuel;
        placed.consumption_rate = rec.consumption_rate;
        placed.startup_delay_ticks = rec.startup_delay_ticks;

        if (!apply(placed))
        {
            retire_id(placed.id);
            handles.push_back(NullNode);
            continue;
        }

        if (auto* p = reg_.try_get<comp::Producer>(placed.id))
            p->state = rec.state;
        if (auto* fuel = reg_.try_get<comp::FuelSlot>(placed.id))
        {
            fuel->quantity = (std::isfinite(rec.fuel) && rec.fuel > 0.0) ? rec.fuel : 0.0;
            fuel->startup_timer = rec.startup_timer;
        }

        handles.push_back(placed.id);
        ++restored;
    }

    for (const save::LinkRecord& link : save.links)
    {
        if (link.a >= handles.size() || link.b >= handles.size()
            || handles[link.a] == NullNode || handles[link.b] == NullNode)
        {
            spdlog::warn("import: link {} - {} references a missing node record; skipped", link.a, link.b);
            continue;
        }
        if (link.a == link.b)
            continue;
        tracker_.connect(handles[link.a], handles[link.b]);
    }

    tick_ = save.tick;
    publish(settle(/*advance_generators=*/false), /*emit=*/false);
    notifier_.clear();

    spdlog::info("import: {} of {} nodes, {} networks at tick {}",
                 restored, save.nodes.size(), networks_.size(), tick_);
    return restored;
}

} // namespace powergrid
