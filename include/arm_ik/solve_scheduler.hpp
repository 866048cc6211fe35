/**
 * @file solve_scheduler.hpp
 * @brief Adaptive solve cadence and iteration budget
 *
 * - a solve runs only after a minimum interval since the last attempt
 * - a moderate gap since the last accepted solve raises the budget
 * - a long gap raises it further and relaxes the tolerance
 *
 * The scheduler itself is stateless; the caller owns SchedulerState.
 */

#ifndef ARM_IK_SOLVE_SCHEDULER_HPP
#define ARM_IK_SOLVE_SCHEDULER_HPP

#include "arm_ik/ik_solver.hpp"

#include <chrono>
#include <optional>

namespace arm_ik {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

struct SchedulerConfig {
    std::chrono::milliseconds min_interval{150};
    std::chrono::milliseconds moderate_gap{200};
    std::chrono::milliseconds long_gap{500};
    double moderate_iteration_multiplier = 1.25;
    double long_iteration_multiplier = 1.5;
    double long_gap_tolerance_multiplier = 2.0;
};

/**
 * @brief Timestamps threaded through the calling loop
 */
struct SchedulerState {
    std::optional<TimePoint> last_attempt;
    std::optional<TimePoint> last_accepted;
};

enum class GapLevel { Normal, Moderate, Long };

const char* toString(GapLevel level);

/**
 * @brief Decision for one incoming target update
 */
struct SolvePlan {
    bool run = false;
    int max_iterations = 0;
    double position_tolerance = 0.0;
    GapLevel gap = GapLevel::Normal;
    std::chrono::milliseconds since_accepted{0};
};

class SolveScheduler {
public:
    /**
     * @throws ConfigurationError on negative intervals, moderate_gap > long_gap,
     *         or multipliers below 1
     */
    explicit SolveScheduler(const SchedulerConfig& config = SchedulerConfig());

    /**
     * @brief Decide whether to solve now and with which budget
     *
     * Records `now` as the last attempt when the plan runs.
     */
    SolvePlan plan(SchedulerState& state, TimePoint now, const SolverConfig& base) const;

    /**
     * @brief Record `now` as the last accepted time if the solve was committed
     */
    void recordOutcome(SchedulerState& state, bool committed, TimePoint now) const;

    const SchedulerConfig& getConfig() const { return config_; }

private:
    SchedulerConfig config_;
};

}  // namespace arm_ik

#endif  // ARM_IK_SOLVE_SCHEDULER_HPP
