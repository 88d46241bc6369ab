#include "powergrid/events/EventBus.hpp"

#include <spdlog/spdlog.h>

namespace powergrid {

std::size_t EventBus::flush()
{
    std::size_t rounds = 0;
    while (disp_.size() != 0u)
    {
        if (rounds >= max_depth_)
        {
            const std::size_t left = disp_.size();
            spdlog::warn("EventBus: listeners still queuing after {} rounds; dropping {} event(s)", rounds, left);
            dropped_ += left;
            disp_.clear();
            break;
        }

        DepthScope scope(depth_);
        disp_.update();
        ++rounds;
    }
    return rounds;
}

void EventBus::reset()
{
    disp_ = entt::dispatcher{};
    depth_ = 0;
}

void EventBus::drop_nested()
{
    ++dropped_;
    spdlog::warn("EventBus: notification depth {} reached; event dropped", max_depth_);
}

} // namespace powergrid
