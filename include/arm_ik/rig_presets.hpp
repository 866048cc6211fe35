/**
 * @file rig_presets.hpp
 * @brief SO-ARM101 style desktop arm: chain, limits, tuning and calibration
 *
 * Joint / axis / limit table (degrees):
 *   Base_Rotation (y) [-109, 109]
 *   Shoulder_Lift (x) [0, 190]
 *   Elbow_Flex    (x) [-180, 0]
 *   Wrist_Flex    (x) [-170, 0]
 *   Wrist_Roll    (y) [-180, 180]   optional
 *   Gripper       (z) passthrough, not solved
 *
 * Lengths are metres. The rig faces +Z with +Y up, the frame the closed-form
 * solver reads keypoints in.
 */

#ifndef ARM_IK_RIG_PRESETS_HPP
#define ARM_IK_RIG_PRESETS_HPP

#include "arm_ik/geometric_solver.hpp"
#include "arm_ik/ik_solver.hpp"
#include "arm_ik/kinematic_chain.hpp"

#include <set>
#include <string>

namespace arm_ik {
namespace rig {

inline const std::string kBaseRotation = "Base_Rotation";
inline const std::string kShoulderLift = "Shoulder_Lift";
inline const std::string kElbowFlex = "Elbow_Flex";
inline const std::string kWristFlex = "Wrist_Flex";
inline const std::string kWristRoll = "Wrist_Roll";
inline const std::string kGripper = "Gripper";
inline const std::string kEndEffector = "EndEffector";

/**
 * @brief Rig-specific constants kept outside the solver core
 */
struct RigCalibration {
    // The base servo turns opposite to the model's +Y rotation
    std::set<std::string> inverted_joints{kBaseRotation};

    // Maps the geometric solver's straight wrist (-180°) to the rig neutral (-85°)
    double wrist_neutral_offset = degToRad(95.0);

    double gripper_degrees = 0.0;
    Axis gripper_axis = Axis::Z;

    // Observed shoulder keypoint is aligned onto this point
    std::string anchor_point = kShoulderLift;

    std::string elbow_point = kElbowFlex;
    std::string wrist_point = kWristFlex;
    std::string end_effector_point = kEndEffector;
};

/**
 * @brief Chain with control points Shoulder_Lift, Elbow_Flex, Wrist_Flex, EndEffector
 */
KinematicChain makeChain(bool with_wrist_roll = false);

/**
 * @brief Three-target tuning used on the rig
 *
 * 40 iterations, 5 mm tolerance, λ = 0.05, step scale 0.7, base step cap 2 rad,
 * distal caps 0.15 / 0.15 / 0.12 rad, weights elbow 1.4, wrist 1.3, EE 0.5.
 */
SolverConfig makeSolverConfig(const RigCalibration& calibration = RigCalibration());

GeometricSolverConfig makeGeometricConfig(const RigCalibration& calibration = RigCalibration());

}  // namespace rig
}  // namespace arm_ik

#endif  // ARM_IK_RIG_PRESETS_HPP
