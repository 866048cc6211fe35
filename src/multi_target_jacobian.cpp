/**
 * @file multi_target_jacobian.cpp
 * @brief Implementation of the weighted multi-target Jacobian
 */

#include "arm_ik/multi_target_jacobian.hpp"

#include <algorithm>
#include <utility>

namespace arm_ik {

MultiTargetJacobian::MultiTargetJacobian(
    const KinematicChain& chain,
    std::vector<Target> targets
) : chain_(chain), targets_(std::move(targets)) {

    if (targets_.empty() || static_cast<int>(targets_.size()) > kMaxTargets) {
        throw StructuralError("expected 1 to " + std::to_string(kMaxTargets) +
                              " targets, got " + std::to_string(targets_.size()));
    }

    for (int t = 0; t < static_cast<int>(targets_.size()); ++t) {
        const auto& target = targets_[t];
        points_.push_back(&chain_.controlPoint(target.point));

        if (!(target.weight > 0.0)) {
            throw ConfigurationError("target '" + target.point +
                                     "' needs a strictly positive weight");
        }
        if (target.orientation) {
            if (oriented_ >= 0) {
                throw StructuralError("only one target may carry an orientation");
            }
            if (!(target.orientation_weight > 0.0)) {
                throw ConfigurationError("target '" + target.point +
                                         "' needs a strictly positive orientation weight");
            }
            oriented_ = t;
        }
    }

    rows_ = 3 * static_cast<int>(targets_.size()) + (hasOrientation() ? 3 : 0);
}

std::vector<Eigen::Vector3d> MultiTargetJacobian::trackedPositions(
    const std::vector<JointFrame>& frames
) const {
    std::vector<Eigen::Vector3d> positions;
    positions.reserve(points_.size());
    for (const auto* point : points_) {
        positions.push_back(chain_.pointPose(frames, *point).position);
    }
    return positions;
}

TaskError MultiTargetJacobian::computeError(const std::vector<JointFrame>& frames) const {
    TaskError error;
    error.weighted = Eigen::VectorXd::Zero(rows_);
    error.distances.resize(targets_.size());

    for (int t = 0; t < static_cast<int>(targets_.size()); ++t) {
        const auto& target = targets_[t];
        const CartesianPose pose = chain_.pointPose(frames, *points_[t]);

        const Eigen::Vector3d e = target.weight * (target.position - pose.position);
        error.weighted.segment<3>(3 * t) = e;
        error.distances[t] = (target.position - pose.position).norm();

        // Normalise back to physical units for the convergence test
        error.position_residual = std::max(error.position_residual, e.norm() / target.weight);

        if (t == oriented_) {
            const Eigen::Vector3d rot = orientationError(*target.orientation, pose.orientation);
            error.weighted.tail<3>() = target.orientation_weight * rot;
            error.orientation_error = rot.norm();
        }
    }

    return error;
}

Eigen::MatrixXd MultiTargetJacobian::build(const std::vector<JointFrame>& frames) const {
    const int n = chain_.numJoints();
    Eigen::MatrixXd J = Eigen::MatrixXd::Zero(rows_, n);

    const auto positions = trackedPositions(frames);

    for (int t = 0; t < static_cast<int>(targets_.size()); ++t) {
        const auto& target = targets_[t];
        const int attached = points_[t]->joint;

        // Joints distal to the attachment do not move the point
        for (int i = 0; i <= attached; ++i) {
            const auto& frame = frames[i];
            J.block<3, 1>(3 * t, i) =
                target.weight * frame.axis.cross(positions[t] - frame.origin);

            if (t == oriented_) {
                J.block<3, 1>(rows_ - 3, i) = target.orientation_weight * frame.axis;
            }
        }
    }

    return J;
}

}  // namespace arm_ik
