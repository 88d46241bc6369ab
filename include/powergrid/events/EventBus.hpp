#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <entt/entt.hpp>

namespace powergrid {

// Outbound event path. During a tick events are only queued (post); the grid
// flushes them once the tick's state is final, so listeners never see a
// half-updated tick and cannot feed back into it.
//
// Listeners may react by publishing or posting further events. Both paths
// are depth-bounded: a feedback loop degrades to dropped events plus a warning
// instead of an unbounded call stack.
class EventBus {
public:
    explicit EventBus(std::uint32_t max_depth = 16) : max_depth_(max_depth == 0 ? 1 : max_depth) {}

    EventBus(const EventBus&)            = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<class Event>
    auto sink() { return disp_.sink<Event>(); }

    // Queue for delivery on the next flush().
    template<class Event>
    void post(Event&& event) { disp_.enqueue(std::forward<Event>(event)); }

    // Deliver now. Returns false if the nesting limit was hit and the event dropped.
    template<class Event>
    bool publish(const Event& event)
    {
        if (depth_ >= max_depth_)
        {
            drop_nested();
            return false;
        }
        DepthScope scope(depth_);
        disp_.trigger(event);
        return true;
    }

    // Delivers queued events; events queued by listeners go out in further
    // rounds, at most max_depth of them. Returns the number of rounds run.
    std::size_t flush();

    // Drops queued events, keeps listeners.
    void clear_pending() { disp_.clear(); }

    // Drops queued events and every listener.
    void reset();

    [[nodiscard]] std::size_t   pending() const noexcept { return disp_.size(); }
    [[nodiscard]] std::uint32_t depth() const noexcept { return depth_; }
    [[nodiscard]] std::uint32_t max_depth() const noexcept { return max_depth_; }
    [[nodiscard]] std::uint64_t dropped() const noexcept { return dropped_; }

    void set_max_depth(std::uint32_t depth) noexcept { max_depth_ = depth == 0 ? 1 : depth; }

private:
    struct DepthScope {
        explicit DepthScope(std::uint32_t& d) : depth(d) { ++depth; }
        ~DepthScope() { --depth; }
        DepthScope(const DepthScope&)            = delete;
        DepthScope& operator=(const DepthScope&) = delete;
        std::uint32_t& depth;
    };

    void drop_nested();

    entt::dispatcher disp_;
    std::uint32_t    max_depth_;
    std::uint32_t    depth_{0};
    std::uint64_t    dropped_{0};
};

} // namespace powergrid
