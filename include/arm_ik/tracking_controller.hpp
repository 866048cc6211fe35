/**
 * @file tracking_controller.hpp
 * @brief Per-frame driver that turns observed arm keypoints into joint commands
 *
 * Owns the chain pose, the solver, the scheduler state and the rig calibration.
 * Each update:
 *   1. Anchors the keypoints onto the chain (shoulder onto Shoulder_Lift)
 *   2. Asks the scheduler whether and how hard to solve
 *   3. Runs damped least squares or the closed-form solver
 *   4. Commits or keeps the previous pose and emits a JointCommand on commit
 */

#ifndef ARM_IK_TRACKING_CONTROLLER_HPP
#define ARM_IK_TRACKING_CONTROLLER_HPP

#include "arm_ik/geometric_solver.hpp"
#include "arm_ik/ik_solver.hpp"
#include "arm_ik/joint_command.hpp"
#include "arm_ik/kinematic_chain.hpp"
#include "arm_ik/rig_presets.hpp"
#include "arm_ik/solve_scheduler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arm_ik {

enum class SolverStrategy {
    DampedLeastSquares,
    Geometric
};

const char* toString(SolverStrategy strategy);

/**
 * @brief Parses "dls" or "geometric"
 * @throws ConfigurationError on any other name
 */
SolverStrategy strategyFromName(const std::string& name);

/**
 * @brief What happened on one tracking update
 */
struct TrackingUpdate {
    SolverStrategy strategy = SolverStrategy::DampedLeastSquares;
    SolvePlan plan;
    bool incomplete = false;                // Too few keypoints, scheduler not consulted
    bool attempted = false;                 // Input usable and the scheduler let it run
    bool committed = false;
    std::optional<SolveResult> result;      // DLS only
    std::optional<ArmAngles> geometric;     // Closed-form only
    std::optional<JointCommand> command;    // Present when committed

    // A closed-form frame that lacked a keypoint; hosts report it as a warning
    bool missingClosedFormInput() const {
        return incomplete && strategy == SolverStrategy::Geometric;
    }
};

class TrackingController {
public:
    TrackingController(
        KinematicChain chain,
        const SolverConfig& solver_config,
        const SchedulerConfig& scheduler_config = SchedulerConfig(),
        const GeometricSolverConfig& geometric_config = GeometricSolverConfig(),
        const rig::RigCalibration& calibration = rig::RigCalibration(),
        SolverStrategy strategy = SolverStrategy::DampedLeastSquares
    );

    /**
     * @brief Track one frame of observed keypoints
     *
     * Missing keypoints never throw. DLS needs the shoulder plus at least one
     * of elbow / wrist / hand; the closed-form solver needs all four.
     */
    TrackingUpdate onKeypoints(
        const ArmKeypoints& keypoints,
        TimePoint now,
        WallClock::time_point stamp
    );

    /**
     * @brief Solve for explicit targets already expressed in the world frame
     *
     * Always uses damped least squares.
     */
    TrackingUpdate onTargets(
        const std::vector<Target>& targets,
        TimePoint now,
        WallClock::time_point stamp
    );

    /**
     * @brief Elbow, wrist and hand keypoints as targets, shifted so the
     *        observed shoulder lands on the anchor point
     */
    std::vector<Target> targetsFromKeypoints(const ArmKeypoints& keypoints) const;

    /**
     * @brief Command for the currently held pose, gripper passthrough appended
     */
    JointCommand currentCommand(WallClock::time_point stamp) const;

    const KinematicChain& chain() const { return chain_; }
    KinematicChain& chain() { return chain_; }

    const IKSolver& solver() const { return solver_; }
    IKSolver& solver() { return solver_; }

    const IKStatistics& getStatistics() const { return solver_.getStatistics(); }
    const SchedulerState& schedulerState() const { return scheduler_state_; }

    SolverStrategy strategy() const { return strategy_; }
    void setStrategy(SolverStrategy strategy) { strategy_ = strategy; }

    const rig::RigCalibration& calibration() const { return calibration_; }

private:
    TrackingUpdate runDls(
        const std::vector<Target>& targets,
        TimePoint now,
        WallClock::time_point stamp
    );

    TrackingUpdate runGeometric(
        const ArmKeypoints& keypoints,
        TimePoint now,
        WallClock::time_point stamp
    );

    KinematicChain chain_;
    IKSolver solver_;
    SolveScheduler scheduler_;
    SchedulerState scheduler_state_;
    GeometricSolver geometric_;
    rig::RigCalibration calibration_;
    SolverStrategy strategy_;
};

}  // namespace arm_ik

#endif  // ARM_IK_TRACKING_CONTROLLER_HPP
