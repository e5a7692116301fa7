#include "fixed_step.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace drape {

FixedStepDriver::FixedStepDriver(double fixed_step, int max_ticks)
    : fixed_step_(fixed_step), max_ticks_(max_ticks) {
    if (!(fixed_step > 0.0)) {
        throw std::invalid_argument("FixedStepDriver: fixed step must be positive");
    }
    if (max_ticks < 0) {
        throw std::invalid_argument("FixedStepDriver: max_ticks must not be negative");
    }
}

int FixedStepDriver::advance(double wall_dt, const TickCallback& tick) {
    auto log = drape::logging::get_logger();

    if (wall_dt < 0.0 || !std::isfinite(wall_dt)) {
        log->warn("FixedStepDriver: ignoring invalid frame delta {}", wall_dt);
        return 0;
    }

    accumulator_ += wall_dt;

    // Repeated subtraction leaves the accumulator a rounding error short
    // of the last whole step, so a step within `slack` counts as full.
    const double slack = fixed_step_ * STEP_TOLERANCE;
    int ticks = 0;
    while (accumulator_ >= fixed_step_ - slack) {
        if (max_ticks_ > 0 && ticks >= max_ticks_) {
            auto surplus = static_cast<uint64_t>(std::floor((accumulator_ + slack) / fixed_step_));
            accumulator_ = std::max(0.0, accumulator_ - static_cast<double>(surplus) * fixed_step_);
            dropped_ticks_ += surplus;
            log->warn("FixedStepDriver: frame too slow, dropped {} ticks", surplus);
            break;
        }
        accumulator_ = std::max(0.0, accumulator_ - fixed_step_);
        tick();
        ++ticks;
    }

    total_ticks_ += static_cast<uint64_t>(ticks);
    log->trace("FixedStepDriver: dt={:.6f}s ran {} ticks, accumulator={:.6f}s",
               wall_dt, ticks, accumulator_);
    return ticks;
}

void FixedStepDriver::reset() {
    accumulator_ = 0.0;
    total_ticks_ = 0;
    dropped_ticks_ = 0;
}

}  // namespace drape
