#include "powergrid/grid/Types.hpp"

namespace powergrid {

const char* ToString(NodeKind kind) noexcept
{
    switch (kind)
    {
    case NodeKind::Producer: return "producer";
    case NodeKind::Consumer: return "consumer";
    case NodeKind::Link:     return "link";
    }
    return "unknown";
}

const char* ToString(ProducerState state) noexcept
{
    switch (state)
    {
    case ProducerState::Idle:        return "idle";
    case ProducerState::Operational: return "operational";
    case ProducerState::Stalled:     return "stalled";
    }
    return "unknown";
}

bool ParseNodeKind(std::string_view text, NodeKind& out) noexcept
{
    if (text == "producer") { out = NodeKind::Producer; return true; }
    if (text == "consumer") { out = NodeKind::Consumer; return true; }
    if (text == "link")     { out = NodeKind::Link;     return true; }
    return false;
}

bool ParseProducerState(std::string_view text, ProducerState& out) noexcept
{
    if (text == "idle")        { out = ProducerState::Idle;        return true; }
    if (text == "operational") { out = ProducerState::Operational; return true; }
    if (text == "stalled")     { out = ProducerState::Stalled;     return true; }
    return false;
}

} // namespace powergrid
