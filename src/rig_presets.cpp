/**
 * @file rig_presets.cpp
 * @brief SO-ARM101 style chain and tuning
 */

#include "arm_ik/rig_presets.hpp"

#include <utility>
#include <vector>

namespace arm_ik {
namespace rig {

namespace {
constexpr double kShoulderHeight = 0.1;
constexpr double kUpperArm = 0.116;
constexpr double kForearm = 0.135;
constexpr double kHand = 0.1;
}

KinematicChain makeChain(bool with_wrist_roll) {
    // Half turn about +Y: the rig faces world +Z and its flex joints fold forward
    const Eigen::Quaterniond half_turn(Eigen::AngleAxisd(M_PI, Eigen::Vector3d::UnitY()));

    std::vector<JointSpec> joints;

    // Positive angles head the arm toward world -X
    JointSpec base;
    base.name = kBaseRotation;
    base.axis = Axis::Y;
    base.range = AngleRange::fromDegrees(-109.0, 109.0);
    base.reversed = true;
    joints.push_back(base);

    // Upper arm is horizontal at 0° and points up at 90°
    JointSpec shoulder;
    shoulder.name = kShoulderLift;
    shoulder.axis = Axis::X;
    shoulder.range = AngleRange::fromDegrees(0.0, 190.0);
    shoulder.origin = Eigen::Vector3d(0.0, kShoulderHeight, 0.0);
    joints.push_back(shoulder);

    // 0° is folded back onto the upper arm, -90° is a right angle bent
    // downward, -180° is straight
    JointSpec elbow;
    elbow.name = kElbowFlex;
    elbow.axis = Axis::X;
    elbow.range = AngleRange::fromDegrees(-180.0, 0.0);
    elbow.origin = Eigen::Vector3d(0.0, 0.0, -kUpperArm);
    elbow.mount = half_turn;
    joints.push_back(elbow);

    // Folds the same way as the elbow
    JointSpec wrist;
    wrist.name = kWristFlex;
    wrist.axis = Axis::X;
    wrist.range = AngleRange::fromDegrees(-170.0, 0.0);
    wrist.origin = Eigen::Vector3d(0.0, 0.0, -kForearm);
    wrist.mount = half_turn;
    joints.push_back(wrist);

    if (with_wrist_roll) {
        JointSpec roll;
        roll.name = kWristRoll;
        roll.axis = Axis::Y;
        roll.range = AngleRange::fromDegrees(-180.0, 180.0);
        joints.push_back(roll);
    }

    // Hand continues the forearm when the wrist sits at its -85° neutral
    const double neutral = degToRad(85.0);
    const Eigen::Vector3d hand(0.0, -kHand * std::sin(neutral), kHand * std::cos(neutral));

    std::vector<ControlPoint> points = {
        {kShoulderLift, 1, Eigen::Vector3d::Zero()},
        {kElbowFlex, 2, Eigen::Vector3d::Zero()},
        {kWristFlex, 3, Eigen::Vector3d::Zero()},
        {kEndEffector, static_cast<int>(joints.size()) - 1, hand},
    };

    return KinematicChain(std::move(joints), std::move(points),
                          CartesianPose(Eigen::Vector3d::Zero(), half_turn));
}

SolverConfig makeSolverConfig(const RigCalibration& calibration) {
    SolverConfig config;
    config.max_iterations = 40;
    config.position_tolerance = 0.005;
    // Links are around 0.1 m and the end effector weighs 0.5, so a larger λ
    // stalls the last few millimetres
    config.damping = 0.05;
    config.step_scale = 0.7;
    config.default_max_step = 0.15;
    config.acceptance_threshold = 0.6;

    // A base step swings every downstream point, distal steps move less
    config.max_step_per_joint = {
        {kBaseRotation, 2.0},
        {kShoulderLift, 0.15},
        {kElbowFlex, 0.15},
        {kWristFlex, 0.12},
    };

    config.target_weights = {
        {calibration.elbow_point, 1.4},
        {calibration.wrist_point, 1.3},
        {calibration.end_effector_point, 0.5},
    };

    config.inverted_joints = calibration.inverted_joints;
    return config;
}

GeometricSolverConfig makeGeometricConfig(const RigCalibration& calibration) {
    GeometricSolverConfig config;
    config.base_rotation = AngleRange::fromDegrees(-109.0, 109.0);
    config.shoulder_lift = AngleRange::fromDegrees(0.0, 190.0);
    config.elbow_flex = AngleRange::fromDegrees(-180.0, 0.0);
    config.wrist_flex = AngleRange::fromDegrees(-170.0, 0.0);
    config.wrist_neutral_offset = calibration.wrist_neutral_offset;
    return config;
}

}  // namespace rig
}  // namespace arm_ik
