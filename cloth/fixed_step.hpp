#ifndef DRAPE_CLOTH_FIXED_STEP_HPP
#define DRAPE_CLOTH_FIXED_STEP_HPP

#include <cstdint>
#include <functional>

namespace drape {

// Called once per fixed tick
using TickCallback = std::function<void()>;

// Fixed-step accumulator: turns variable wall-clock frame deltas into a
// whole number of constant-length physics ticks. Leftover time carries
// over to the next advance().
class FixedStepDriver {
public:
    // max_ticks = 0 means unbounded. Throws std::invalid_argument for a
    // non-positive step.
    explicit FixedStepDriver(double fixed_step, int max_ticks = 0);

    // Adds wall_dt seconds and runs `tick` while a full step is
    // available. Negative deltas are ignored. Returns the number of
    // ticks run.
    int advance(double wall_dt, const TickCallback& tick);

    double fixed_step() const { return fixed_step_; }
    double accumulator() const { return accumulator_; }
    uint64_t total_ticks() const { return total_ticks_; }
    uint64_t dropped_ticks() const { return dropped_ticks_; }

    void reset();

private:
    static constexpr double STEP_TOLERANCE = 1e-9;

    double fixed_step_;
    int max_ticks_;
    double accumulator_ = 0.0;
    uint64_t total_ticks_ = 0;
    uint64_t dropped_ticks_ = 0;
};

}  // namespace drape

#endif // DRAPE_CLOTH_FIXED_STEP_HPP
