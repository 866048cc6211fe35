/**
 * @file multi_target_jacobian.hpp
 * @brief Weighted Jacobian for up to three tracked control points
 *
 * Row layout for k targets and n joints:
 * - rows [3t, 3t+3): position of target t, weighted by w_t
 * - last 3 rows (optional): orientation of the single oriented target
 *
 * Position column of joint i for target t: w_t · (ω_i × (p_t − o_i))
 * Orientation column of joint i:            w_rot · ω_i
 */

#ifndef ARM_IK_MULTI_TARGET_JACOBIAN_HPP
#define ARM_IK_MULTI_TARGET_JACOBIAN_HPP

#include "arm_ik/kinematic_chain.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arm_ik {

constexpr int kMaxTargets = 3;

/**
 * @brief World-space goal for one control point
 */
struct Target {
    std::string point;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    double weight = 1.0;
    std::optional<Eigen::Quaterniond> orientation;
    double orientation_weight = 0.1;

    Target() = default;
    Target(std::string p, const Eigen::Vector3d& pos, double w = 1.0)
        : point(std::move(p)), position(pos), weight(w) {}
};

/**
 * @brief Weighted task error for one angle vector
 */
struct TaskError {
    Eigen::VectorXd weighted;               // Stacked w_t·(target − current)
    std::vector<double> distances;          // Raw Euclidean distance per target
    double position_residual = 0.0;         // max_t |w_t·e_t| / w_t
    double orientation_error = 0.0;         // |axis-angle| of the oriented target
};

/**
 * @brief Builds the stacked Jacobian and error vector for a target set
 */
class MultiTargetJacobian {
public:
    /**
     * @throws StructuralError on an empty target list, more than three targets,
     *         more than one oriented target, or an unknown control point
     * @throws ConfigurationError on a non-positive weight
     */
    MultiTargetJacobian(const KinematicChain& chain, std::vector<Target> targets);

    int rows() const { return rows_; }
    int cols() const { return chain_.numJoints(); }
    bool hasOrientation() const { return oriented_ >= 0; }
    const std::vector<Target>& targets() const { return targets_; }

    /**
     * @brief Current world positions of every tracked point
     */
    std::vector<Eigen::Vector3d> trackedPositions(const std::vector<JointFrame>& frames) const;

    TaskError computeError(const std::vector<JointFrame>& frames) const;

    Eigen::MatrixXd build(const std::vector<JointFrame>& frames) const;

private:
    const KinematicChain& chain_;
    std::vector<Target> targets_;
    std::vector<const ControlPoint*> points_;
    int oriented_ = -1;
    int rows_ = 0;
};

}  // namespace arm_ik

#endif  // ARM_IK_MULTI_TARGET_JACOBIAN_HPP
