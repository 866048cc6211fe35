/**
 * @file joint_command.hpp
 * @brief Outbound set_joint_angles command
 *
 * {
 *   "method": "set_joint_angles",
 *   "timestamp": "<ISO-8601>",
 *   "params": {
 *     "units": "degrees",
 *     "mode": "follower",
 *     "joints": { "<JointName>": { "<axis>": <number> }, ... }
 *   }
 * }
 */

#ifndef ARM_IK_JOINT_COMMAND_HPP
#define ARM_IK_JOINT_COMMAND_HPP

#include "arm_ik/kinematic_chain.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace arm_ik {

using WallClock = std::chrono::system_clock;

struct JointAngleEntry {
    std::string joint;
    Axis axis = Axis::Z;
    double degrees = 0.0;
};

struct JointCommand {
    std::string method = "set_joint_angles";
    WallClock::time_point timestamp;
    std::string units = "degrees";
    std::string mode = "follower";
    std::vector<JointAngleEntry> joints;

    /**
     * @brief One entry per chain joint, in chain order
     */
    static JointCommand fromAngles(
        const KinematicChain& chain,
        const Eigen::VectorXd& q,
        WallClock::time_point stamp
    );

    /**
     * @brief Append a joint the solver does not drive (e.g. the gripper)
     */
    void addPassthrough(const std::string& joint, Axis axis, double degrees);

    /**
     * @brief Angle of a joint by name
     * @throws StructuralError if absent
     */
    double degreesOf(const std::string& joint) const;

    /**
     * @brief Serialise; angles are rounded to three decimals
     */
    std::string toJson() const;
};

/**
 * @brief UTC ISO-8601 with milliseconds, e.g. 2025-01-31T12:00:00.250Z
 */
std::string formatIsoTimestamp(WallClock::time_point stamp);

}  // namespace arm_ik

#endif  // ARM_IK_JOINT_COMMAND_HPP
