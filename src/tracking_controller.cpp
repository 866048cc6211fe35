/**
 * @file tracking_controller.cpp
 * @brief Implementation of the keypoint tracking loop
 */

#include "arm_ik/tracking_controller.hpp"

#include <utility>

namespace arm_ik {

const char* toString(SolverStrategy strategy) {
    switch (strategy) {
        case SolverStrategy::DampedLeastSquares: return "dls";
        case SolverStrategy::Geometric: return "geometric";
    }
    return "unknown";
}

SolverStrategy strategyFromName(const std::string& name) {
    if (name == "dls") return SolverStrategy::DampedLeastSquares;
    if (name == "geometric") return SolverStrategy::Geometric;
    throw ConfigurationError("unknown solver strategy '" + name + "'");
}

TrackingController::TrackingController(
    KinematicChain chain,
    const SolverConfig& solver_config,
    const SchedulerConfig& scheduler_config,
    const GeometricSolverConfig& geometric_config,
    const rig::RigCalibration& calibration,
    SolverStrategy strategy
) : chain_(std::move(chain)),
    solver_(solver_config),
    scheduler_(scheduler_config),
    geometric_(geometric_config),
    calibration_(calibration),
    strategy_(strategy)
{
    if (!chain_.hasControlPoint(calibration_.anchor_point)) {
        throw StructuralError("anchor point '" + calibration_.anchor_point +
                              "' is not a control point of the chain");
    }
}

std::vector<Target> TrackingController::targetsFromKeypoints(const ArmKeypoints& keypoints) const {
    std::vector<Target> targets;
    if (!keypoints.shoulder) {
        return targets;
    }

    const Eigen::Vector3d anchor =
        chain_.worldPose(chain_.angles(), calibration_.anchor_point).position;
    const Eigen::Vector3d offset = anchor - *keypoints.shoulder;

    if (keypoints.elbow) {
        targets.emplace_back(calibration_.elbow_point, *keypoints.elbow + offset);
    }
    if (keypoints.wrist) {
        targets.emplace_back(calibration_.wrist_point, *keypoints.wrist + offset);
    }
    if (keypoints.hand) {
        targets.emplace_back(calibration_.end_effector_point, *keypoints.hand + offset);
    }
    return targets;
}

TrackingUpdate TrackingController::onKeypoints(
    const ArmKeypoints& keypoints,
    TimePoint now,
    WallClock::time_point stamp
) {
    if (strategy_ == SolverStrategy::Geometric) {
        if (!keypoints.complete()) {
            TrackingUpdate update;
            update.strategy = strategy_;
            update.incomplete = true;
            return update;
        }
        return runGeometric(keypoints, now, stamp);
    }

    const std::vector<Target> targets = targetsFromKeypoints(keypoints);
    if (targets.empty()) {
        TrackingUpdate update;
        update.incomplete = true;
        return update;
    }
    return runDls(targets, now, stamp);
}

TrackingUpdate TrackingController::onTargets(
    const std::vector<Target>& targets,
    TimePoint now,
    WallClock::time_point stamp
) {
    if (targets.empty()) {
        return TrackingUpdate();
    }
    return runDls(targets, now, stamp);
}

TrackingUpdate TrackingController::runDls(
    const std::vector<Target>& targets,
    TimePoint now,
    WallClock::time_point stamp
) {
    TrackingUpdate update;
    update.plan = scheduler_.plan(scheduler_state_, now, solver_.getConfig());
    if (!update.plan.run) {
        return update;
    }

    update.attempted = true;
    update.result = solver_.solve(
        chain_, targets, update.plan.max_iterations, update.plan.position_tolerance);
    update.committed = update.result->committed();

    scheduler_.recordOutcome(scheduler_state_, update.committed, now);
    if (update.committed) {
        update.command = currentCommand(stamp);
    }
    return update;
}

TrackingUpdate TrackingController::runGeometric(
    const ArmKeypoints& keypoints,
    TimePoint now,
    WallClock::time_point stamp
) {
    TrackingUpdate update;
    update.strategy = SolverStrategy::Geometric;
    update.plan = scheduler_.plan(scheduler_state_, now, solver_.getConfig());
    if (!update.plan.run) {
        return update;
    }

    update.attempted = true;
    update.geometric = geometric_.solve(keypoints);
    if (update.geometric) {
        Eigen::VectorXd q = chain_.angles();
        q(chain_.jointIndex(rig::kBaseRotation)) = update.geometric->base_rotation;
        q(chain_.jointIndex(rig::kShoulderLift)) = update.geometric->shoulder_lift;
        q(chain_.jointIndex(rig::kElbowFlex)) = update.geometric->elbow_flex;
        q(chain_.jointIndex(rig::kWristFlex)) = update.geometric->wrist_flex;
        chain_.setAngles(q);
        update.committed = true;
    }

    scheduler_.recordOutcome(scheduler_state_, update.committed, now);
    if (update.committed) {
        update.command = currentCommand(stamp);
    }
    return update;
}

JointCommand TrackingController::currentCommand(WallClock::time_point stamp) const {
    JointCommand command = JointCommand::fromAngles(chain_, chain_.angles(), stamp);
    command.addPassthrough(rig::kGripper, calibration_.gripper_axis, calibration_.gripper_degrees);
    return command;
}

}  // namespace arm_ik
