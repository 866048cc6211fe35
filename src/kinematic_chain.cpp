/**
 * @file kinematic_chain.cpp
 * @brief Forward kinematics for the flat revolute chain
 */

#include "arm_ik/kinematic_chain.hpp"

#include <utility>

namespace arm_ik {

KinematicChain::KinematicChain(
    std::vector<JointSpec> joints,
    std::vector<ControlPoint> points,
    const CartesianPose& base
) : joints_(std::move(joints)),
    points_(std::move(points)),
    base_(base) {

    if (joints_.empty() || numJoints() > kMaxChainJoints) {
        throw StructuralError("chain must have between 1 and " +
                              std::to_string(kMaxChainJoints) + " joints, got " +
                              std::to_string(joints_.size()));
    }

    for (int i = 0; i < numJoints(); ++i) {
        const auto& j = joints_[i];
        if (j.name.empty()) {
            throw StructuralError("joint " + std::to_string(i) + " has no name");
        }
        if (!j.range.valid()) {
            throw ConfigurationError("joint '" + j.name + "' has an empty angle range");
        }
        if (!joint_index_.emplace(j.name, i).second) {
            throw StructuralError("duplicate joint name '" + j.name + "'");
        }
    }

    for (int i = 0; i < static_cast<int>(points_.size()); ++i) {
        const auto& p = points_[i];
        if (p.name.empty()) {
            throw StructuralError("control point " + std::to_string(i) + " has no name");
        }
        if (p.joint < ControlPoint::kBase || p.joint >= numJoints()) {
            throw StructuralError("control point '" + p.name +
                                  "' is attached to a joint outside the chain");
        }
        if (!point_index_.emplace(p.name, i).second) {
            throw StructuralError("duplicate control point name '" + p.name + "'");
        }
    }

    // Rest pose: zero where allowed, otherwise the nearest range bound
    angles_ = clampToLimits(Eigen::VectorXd::Zero(numJoints()));
}

int KinematicChain::jointIndex(const std::string& name) const {
    auto it = joint_index_.find(name);
    if (it == joint_index_.end()) {
        throw StructuralError("joint '" + name + "' not found in chain");
    }
    return it->second;
}

bool KinematicChain::hasJoint(const std::string& name) const {
    return joint_index_.count(name) > 0;
}

const ControlPoint& KinematicChain::controlPoint(const std::string& name) const {
    auto it = point_index_.find(name);
    if (it == point_index_.end()) {
        throw StructuralError("control point '" + name + "' not found in chain");
    }
    return points_[it->second];
}

bool KinematicChain::hasControlPoint(const std::string& name) const {
    return point_index_.count(name) > 0;
}

void KinematicChain::setAngles(const Eigen::VectorXd& q) {
    checkAngleVector(q);
    angles_ = clampToLimits(q);
}

std::vector<JointFrame> KinematicChain::computeFrames(const Eigen::VectorXd& q) const {
    checkAngleVector(q);

    std::vector<JointFrame> frames;
    frames.reserve(joints_.size());

    Eigen::Matrix3d R = base_.orientation.normalized().toRotationMatrix();
    Eigen::Vector3d p = base_.position;

    for (int i = 0; i < numJoints(); ++i) {
        const auto& j = joints_[i];
        const Eigen::Vector3d local_axis = axisVector(j.axis);

        // The pivot and the axis do not move when the joint itself turns
        p += R * j.origin;
        R = R * j.mount.normalized().toRotationMatrix();
        JointFrame frame;
        frame.origin = p;
        frame.axis = (R * local_axis).normalized();

        const double angle = j.reversed ? -q(i) : q(i);
        R = R * Eigen::AngleAxisd(angle, local_axis).toRotationMatrix();
        frame.rotation = R;

        frames.push_back(frame);
    }

    return frames;
}

CartesianPose KinematicChain::pointPose(
    const std::vector<JointFrame>& frames,
    const ControlPoint& point
) const {
    CartesianPose pose;
    if (point.joint == ControlPoint::kBase) {
        const Eigen::Quaterniond base_q = base_.orientation.normalized();
        pose.position = base_.position + base_q * point.offset;
        pose.orientation = base_q;
        return pose;
    }

    const auto& frame = frames.at(point.joint);
    pose.position = frame.origin + frame.rotation * point.offset;
    pose.orientation = Eigen::Quaterniond(frame.rotation);
    return pose;
}

CartesianPose KinematicChain::worldPose(const Eigen::VectorXd& q, const std::string& name) const {
    auto frames = computeFrames(q);

    auto pit = point_index_.find(name);
    if (pit != point_index_.end()) {
        return pointPose(frames, points_[pit->second]);
    }

    auto jit = joint_index_.find(name);
    if (jit != joint_index_.end()) {
        const auto& frame = frames[jit->second];
        return CartesianPose(frame.origin, Eigen::Quaterniond(frame.rotation));
    }

    throw StructuralError("no joint or control point named '" + name + "'");
}

Eigen::VectorXd KinematicChain::clampToLimits(const Eigen::VectorXd& q) const {
    Eigen::VectorXd q_clamped = q;
    for (int i = 0; i < numJoints(); ++i) {
        q_clamped(i) = joints_[i].range.clamp(q(i));
    }
    return q_clamped;
}

bool KinematicChain::isWithinLimits(const Eigen::VectorXd& q) const {
    for (int i = 0; i < numJoints(); ++i) {
        if (!joints_[i].range.contains(q(i))) {
            return false;
        }
    }
    return true;
}

void KinematicChain::checkAngleVector(const Eigen::VectorXd& q) const {
    if (q.size() != numJoints()) {
        throw StructuralError("angle vector size (" + std::to_string(q.size()) +
                              ") does not match chain joints (" +
                              std::to_string(numJoints()) + ")");
    }
}

}  // namespace arm_ik
