/**
 * @file solve_scheduler.cpp
 * @brief Implementation of the adaptive scheduling policy
 */

#include "arm_ik/solve_scheduler.hpp"

#include <cmath>

namespace arm_ik {

const char* toString(GapLevel level) {
    switch (level) {
        case GapLevel::Normal: return "normal";
        case GapLevel::Moderate: return "moderate";
        case GapLevel::Long: return "long";
    }
    return "unknown";
}

SolveScheduler::SolveScheduler(const SchedulerConfig& config) : config_(config) {
    using std::chrono::milliseconds;
    if (config_.min_interval < milliseconds(0) ||
        config_.moderate_gap < milliseconds(0) ||
        config_.long_gap < milliseconds(0)) {
        throw ConfigurationError("scheduler intervals must not be negative");
    }
    if (config_.moderate_gap > config_.long_gap) {
        throw ConfigurationError("moderate gap must not exceed the long gap");
    }
    if (config_.moderate_iteration_multiplier < 1.0 ||
        config_.long_iteration_multiplier < 1.0 ||
        config_.long_gap_tolerance_multiplier < 1.0) {
        throw ConfigurationError("scheduler multipliers must be at least 1");
    }
}

SolvePlan SolveScheduler::plan(
    SchedulerState& state,
    TimePoint now,
    const SolverConfig& base
) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    SolvePlan plan;
    plan.max_iterations = base.max_iterations;
    plan.position_tolerance = base.position_tolerance;

    if (state.last_attempt &&
        duration_cast<milliseconds>(now - *state.last_attempt) < config_.min_interval) {
        return plan;
    }

    plan.run = true;
    state.last_attempt = now;

    // No accepted solve yet counts as no gap
    if (state.last_accepted) {
        plan.since_accepted = duration_cast<milliseconds>(now - *state.last_accepted);
    }

    if (plan.since_accepted > config_.long_gap) {
        plan.gap = GapLevel::Long;
        plan.max_iterations = static_cast<int>(
            std::lround(base.max_iterations * config_.long_iteration_multiplier));
        plan.position_tolerance = base.position_tolerance * config_.long_gap_tolerance_multiplier;
    } else if (plan.since_accepted > config_.moderate_gap) {
        plan.gap = GapLevel::Moderate;
        plan.max_iterations = static_cast<int>(
            std::lround(base.max_iterations * config_.moderate_iteration_multiplier));
    }

    return plan;
}

void SolveScheduler::recordOutcome(SchedulerState& state, bool committed, TimePoint now) const {
    if (committed) {
        state.last_accepted = now;
    }
}

}  // namespace arm_ik
