/**
 * @file types.hpp
 * @brief Shared geometric types, angle helpers and error classes
 *
 * Everything here is header-only and depends on Eigen alone.
 */

#ifndef ARM_IK_TYPES_HPP
#define ARM_IK_TYPES_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace arm_ik {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;

inline double degToRad(double deg) { return deg * kDegToRad; }
inline double radToDeg(double rad) { return rad * kRadToDeg; }

/**
 * @brief Base class of every hard failure raised by the IK core
 */
class IKError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Unknown or duplicated joint / control-point / target name,
 *        or an angle vector whose size does not match the chain
 */
class StructuralError : public IKError {
public:
    using IKError::IKError;
};

/**
 * @brief Configuration value outside its legal domain
 */
class ConfigurationError : public IKError {
public:
    using IKError::IKError;
};

/**
 * @brief Local rotation axis of a single-DOF revolute joint
 */
enum class Axis { X, Y, Z };

inline Eigen::Vector3d axisVector(Axis axis) {
    switch (axis) {
        case Axis::X: return Eigen::Vector3d::UnitX();
        case Axis::Y: return Eigen::Vector3d::UnitY();
        case Axis::Z: return Eigen::Vector3d::UnitZ();
    }
    return Eigen::Vector3d::UnitZ();
}

inline char axisName(Axis axis) {
    switch (axis) {
        case Axis::X: return 'x';
        case Axis::Y: return 'y';
        case Axis::Z: return 'z';
    }
    return 'z';
}

inline Axis axisFromName(char name) {
    switch (name) {
        case 'x': case 'X': return Axis::X;
        case 'y': case 'Y': return Axis::Y;
        case 'z': case 'Z': return Axis::Z;
        default:
            throw ConfigurationError(std::string("unknown joint axis '") + name + "'");
    }
}

/**
 * @brief Closed angle interval [lower, upper] in radians
 */
struct AngleRange {
    double lower = -M_PI;
    double upper = M_PI;

    AngleRange() = default;
    AngleRange(double lo, double hi) : lower(lo), upper(hi) {}

    static AngleRange fromDegrees(double lo_deg, double hi_deg) {
        return AngleRange(degToRad(lo_deg), degToRad(hi_deg));
    }

    bool valid() const { return lower <= upper; }
    bool contains(double angle) const { return angle >= lower && angle <= upper; }
    double clamp(double angle) const { return std::clamp(angle, lower, upper); }

    AngleRange intersect(const AngleRange& other) const {
        return AngleRange(std::max(lower, other.lower), std::min(upper, other.upper));
    }
};

/**
 * @brief Cartesian pose representation
 */
struct CartesianPose {
    Eigen::Vector3d position;
    Eigen::Quaterniond orientation;

    CartesianPose() : position(Eigen::Vector3d::Zero()),
                      orientation(Eigen::Quaterniond::Identity()) {}

    CartesianPose(const Eigen::Vector3d& pos, const Eigen::Quaterniond& ori)
        : position(pos), orientation(ori) {}
};

/**
 * @brief Orientation error as an axis-angle 3-vector in world space
 *
 * q_err = q_target · q_current⁻¹, flipped onto the shortest arc.
 */
inline Eigen::Vector3d orientationError(const Eigen::Quaterniond& target,
                                        const Eigen::Quaterniond& current) {
    Eigen::Quaterniond q_error = target * current.inverse();
    if (q_error.w() < 0) {
        q_error.coeffs() *= -1;
    }

    double angle = 2.0 * std::acos(std::clamp(q_error.w(), -1.0, 1.0));
    if (angle < 1e-8 || q_error.vec().norm() < 1e-12) {
        return Eigen::Vector3d::Zero();
    }
    return angle * q_error.vec().normalized();
}

}  // namespace arm_ik

#endif  // ARM_IK_TYPES_HPP
