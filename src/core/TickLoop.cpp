#include "TickLoop.h"
#include "Profile.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace core {

void TickLoop::Step() {
    if (SampleInputsForStep) SampleInputsForStep(step_id_);
    if (UpdateFixed)         UpdateFixed(fixed_dt_);
    ++step_id_;
    PG_FRAME_MARK();
}

void TickLoop::Run(const TickLoopConfig& cfg) {
    fixed_dt_ = cfg.fixed_dt > 0.0 ? cfg.fixed_dt : 1.0 / 20.0;
    accumulator_ = 0.0;
    step_id_ = 0;

    if (!cfg.realtime) {
        while (IsRunning && IsRunning())
            Step();
        return;
    }

    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    while (IsRunning && IsRunning()) {
        const auto now = clock::now();
        double frame_dt = std::chrono::duration<double>(now - last).count();
        last = now;

        // Clamp spikes (debugger breaks, suspend/resume).
        frame_dt = std::clamp(frame_dt, 0.0, cfg.max_frame_dt);
        accumulator_ += frame_dt;

        int steps_this_frame = 0;
        while (accumulator_ >= fixed_dt_ && steps_this_frame < cfg.max_steps_per_frame
               && IsRunning()) {
            Step();
            accumulator_ -= fixed_dt_;
            ++steps_this_frame;
        }

        // Too far behind: drop the backlog instead of spiralling.
        if (accumulator_ > fixed_dt_ * cfg.max_steps_per_frame)
            accumulator_ = std::fmod(accumulator_, fixed_dt_);

        const double wait = fixed_dt_ - accumulator_;
        if (wait > 0.0)
            std::this_thread::sleep_for(std::chrono::duration<double>(wait));
    }
}

} // namespace core
