#pragma once
#include <cstdint>
#include <functional>

namespace core {

struct TickLoopConfig {
    double fixed_dt = 1.0 / 20.0;   // simulation step (seconds)
    double max_frame_dt = 0.25;     // clamp large wall-clock deltas (seconds)
    int    max_steps_per_frame = 8; // back-pressure guard
    bool   realtime = true;         // false: step back-to-back, no sleeping
};

// Fixed-step driver. Wall-clock time is accumulated and consumed in fixed_dt
// slices; a slow step never shortens the next one.
class TickLoop {
public:
    std::function<bool()>               IsRunning;          // check quit flag
    std::function<void(std::uint64_t)>  SampleInputsForStep;// called before each fixed step
    std::function<void(double)>         UpdateFixed;        // simulate one tick of length fixed_dt

    // Step ids start at 0 on every Run().
    void Run(const TickLoopConfig& cfg);

private:
    void Step();

    double accumulator_ = 0.0;
    double fixed_dt_ = 1.0 / 20.0;
    std::uint64_t step_id_ = 0;
};

} // namespace core
