/**
 * @file geometric_solver.cpp
 * @brief Implementation of the closed-form keypoint solver
 */

#include "arm_ik/geometric_solver.hpp"

namespace arm_ik {

namespace {
constexpr double kMinSegmentLength = 1e-9;
}

GeometricSolver::GeometricSolver(const GeometricSolverConfig& config) : config_(config) {
    if (!config_.base_rotation.valid() || !config_.shoulder_lift.valid() ||
        !config_.elbow_flex.valid() || !config_.wrist_flex.valid()) {
        throw ConfigurationError("geometric solver limit range is empty");
    }
}

double GeometricSolver::angleBetween(const Eigen::Vector3d& a, const Eigen::Vector3d& b) {
    const double denom = a.norm() * b.norm();
    if (denom < kMinSegmentLength * kMinSegmentLength) {
        return M_PI / 2.0;
    }
    return std::acos(std::clamp(a.dot(b) / denom, -1.0, 1.0));
}

std::optional<ArmAngles> GeometricSolver::solve(const ArmKeypoints& keypoints) const {
    if (!keypoints.complete()) {
        return std::nullopt;
    }

    const Eigen::Vector3d shoulder_to_elbow = *keypoints.elbow - *keypoints.shoulder;
    const Eigen::Vector3d elbow_to_wrist = *keypoints.wrist - *keypoints.elbow;
    const Eigen::Vector3d wrist_to_hand = *keypoints.hand - *keypoints.wrist;

    if (shoulder_to_elbow.norm() < kMinSegmentLength ||
        elbow_to_wrist.norm() < kMinSegmentLength ||
        wrist_to_hand.norm() < kMinSegmentLength) {
        return std::nullopt;
    }

    ArmAngles angles;

    // Base yaw: heading of the upper arm in the horizontal (XZ) plane.
    // X is negated because the observation is mirrored relative to the rig.
    angles.base_rotation = config_.base_rotation.clamp(
        std::atan2(-shoulder_to_elbow.x(), shoulder_to_elbow.z()));

    // Shoulder pitch: elevation of the upper arm above the horizontal plane
    const double horizontal = std::hypot(shoulder_to_elbow.x(), shoulder_to_elbow.z());
    angles.shoulder_lift = config_.shoulder_lift.clamp(
        std::atan2(shoulder_to_elbow.y(), horizontal));

    // Elbow: supplement of the bend, negative when folding inward
    const double elbow = -(M_PI - angleBetween(shoulder_to_elbow, elbow_to_wrist));
    angles.elbow_flex = config_.elbow_flex.clamp(elbow);

    const double wrist = -(M_PI - angleBetween(elbow_to_wrist, wrist_to_hand));
    angles.wrist_flex = config_.wrist_flex.clamp(wrist + config_.wrist_neutral_offset);

    return angles;
}

}  // namespace arm_ik
