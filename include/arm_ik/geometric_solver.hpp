/**
 * @file geometric_solver.hpp
 * @brief Closed-form joint angles from four observed arm keypoints
 *
 * Fixed 4-joint chain (base yaw, shoulder pitch, elbow pitch, wrist pitch).
 * No iteration: each angle comes straight from segment geometry.
 */

#ifndef ARM_IK_GEOMETRIC_SOLVER_HPP
#define ARM_IK_GEOMETRIC_SOLVER_HPP

#include "arm_ik/types.hpp"

#include <optional>

namespace arm_ik {

/**
 * @brief Observed keypoints; any of them may be missing
 */
struct ArmKeypoints {
    std::optional<Eigen::Vector3d> shoulder;
    std::optional<Eigen::Vector3d> elbow;
    std::optional<Eigen::Vector3d> wrist;
    std::optional<Eigen::Vector3d> hand;

    bool complete() const { return shoulder && elbow && wrist && hand; }
};

/**
 * @brief Limits (rad) and rig calibration of the closed-form solver
 */
struct GeometricSolverConfig {
    AngleRange base_rotation = AngleRange::fromDegrees(-109.0, 109.0);
    AngleRange shoulder_lift = AngleRange::fromDegrees(0.0, 190.0);
    AngleRange elbow_flex = AngleRange::fromDegrees(-180.0, 0.0);
    AngleRange wrist_flex = AngleRange::fromDegrees(-170.0, 0.0);

    // Shifts the "straight wrist" reading (-180°) onto the rig's neutral pose
    double wrist_neutral_offset = degToRad(95.0);
};

/**
 * @brief Joint angles in radians, in chain order
 */
struct ArmAngles {
    double base_rotation = 0.0;
    double shoulder_lift = 0.0;
    double elbow_flex = 0.0;
    double wrist_flex = 0.0;

    Eigen::Vector4d toVector() const {
        return Eigen::Vector4d(base_rotation, shoulder_lift, elbow_flex, wrist_flex);
    }
};

class GeometricSolver {
public:
    explicit GeometricSolver(const GeometricSolverConfig& config = GeometricSolverConfig());

    /**
     * @brief Compute all four angles
     * @return std::nullopt if a keypoint is missing or a segment has zero length
     */
    std::optional<ArmAngles> solve(const ArmKeypoints& keypoints) const;

    /**
     * @brief Unsigned angle between two vectors in [0, π]
     */
    static double angleBetween(const Eigen::Vector3d& a, const Eigen::Vector3d& b);

    const GeometricSolverConfig& getConfig() const { return config_; }

private:
    GeometricSolverConfig config_;
};

}  // namespace arm_ik

#endif  // ARM_IK_GEOMETRIC_SOLVER_HPP
