/**
 * @file kinematic_chain.hpp
 * @brief Flat revolute-joint chain with pure forward kinematics
 *
 * World poses are recomputed from an angle vector on demand:
 * - no cached transforms survive an angle mutation
 * - control points are rigidly attached to a joint frame (or the base)
 * - at most six single-axis revolute joints
 */

#ifndef ARM_IK_KINEMATIC_CHAIN_HPP
#define ARM_IK_KINEMATIC_CHAIN_HPP

#include "arm_ik/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace arm_ik {

constexpr int kMaxChainJoints = 6;

/**
 * @brief Static description of one revolute joint
 */
struct JointSpec {
    std::string name;
    Axis axis = Axis::Z;
    AngleRange range;
    Eigen::Vector3d origin = Eigen::Vector3d::Zero();  // In the parent joint frame
    // Fixed rotation of this joint's frame relative to the parent, applied at the origin
    Eigen::Quaterniond mount = Eigen::Quaterniond::Identity();
    bool reversed = false;  // Positive angle turns about the negative axis
};

/**
 * @brief Named point rigidly attached to the frame of a joint
 */
struct ControlPoint {
    static constexpr int kBase = -1;

    std::string name;
    int joint = kBase;
    Eigen::Vector3d offset = Eigen::Vector3d::Zero();  // In the joint frame
};

/**
 * @brief World-space frame of a joint for one angle vector
 */
struct JointFrame {
    Eigen::Vector3d origin;    // Pivot position
    Eigen::Vector3d axis;      // Nominal rotation axis, unit length
    Eigen::Matrix3d rotation;  // Frame orientation after the joint turned
};

/**
 * @brief Ordered chain of revolute joints plus named control points
 *
 * Owns the committed angle vector. Every angle stored here lies inside
 * its joint range.
 */
class KinematicChain {
public:
    KinematicChain(
        std::vector<JointSpec> joints,
        std::vector<ControlPoint> points,
        const CartesianPose& base = CartesianPose()
    );

    int numJoints() const { return static_cast<int>(joints_.size()); }

    const std::vector<JointSpec>& joints() const { return joints_; }
    const JointSpec& joint(int index) const { return joints_.at(index); }
    const std::vector<ControlPoint>& controlPoints() const { return points_; }

    /**
     * @brief Index of a joint by name
     * @throws StructuralError if the chain has no such joint
     */
    int jointIndex(const std::string& name) const;

    bool hasJoint(const std::string& name) const;

    /**
     * @brief Control point by name
     * @throws StructuralError if the chain has no such point
     */
    const ControlPoint& controlPoint(const std::string& name) const;

    bool hasControlPoint(const std::string& name) const;

    const CartesianPose& basePose() const { return base_; }
    void setBasePose(const CartesianPose& base) { base_ = base; }

    const Eigen::VectorXd& angles() const { return angles_; }

    /**
     * @brief Replace the committed angle vector (clamped to joint ranges)
     * @throws StructuralError on size mismatch
     */
    void setAngles(const Eigen::VectorXd& q);

    /**
     * @brief Joint frames for an arbitrary angle vector
     */
    std::vector<JointFrame> computeFrames(const Eigen::VectorXd& q) const;

    /**
     * @brief Pose of a control point given precomputed frames
     */
    CartesianPose pointPose(
        const std::vector<JointFrame>& frames,
        const ControlPoint& point
    ) const;

    /**
     * @brief World pose of a control point or joint pivot
     *
     * Control points take precedence over joints of the same name.
     * @throws StructuralError if neither exists
     */
    CartesianPose worldPose(const Eigen::VectorXd& q, const std::string& name) const;

    Eigen::VectorXd clampToLimits(const Eigen::VectorXd& q) const;
    bool isWithinLimits(const Eigen::VectorXd& q) const;

    void checkAngleVector(const Eigen::VectorXd& q) const;

private:
    std::vector<JointSpec> joints_;
    std::vector<ControlPoint> points_;
    std::unordered_map<std::string, int> joint_index_;
    std::unordered_map<std::string, int> point_index_;
    CartesianPose base_;
    Eigen::VectorXd angles_;
};

/**
 * @brief Free-function form: (chain, angles, name) → world pose
 */
inline CartesianPose worldPose(
    const KinematicChain& chain,
    const Eigen::VectorXd& q,
    const std::string& name
) {
    return chain.worldPose(q, name);
}

}  // namespace arm_ik

#endif  // ARM_IK_KINEMATIC_CHAIN_HPP
