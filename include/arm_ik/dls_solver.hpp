/**
 * @file dls_solver.hpp
 * @brief Damped Least Squares step solver
 *
 * Δq = Jᵀ (J Jᵀ + λ² I)⁻¹ e
 *
 * The m×m normal matrix is inverted by Gauss-Jordan elimination with
 * partial pivoting. A pivot below the singular epsilon aborts the step.
 */

#ifndef ARM_IK_DLS_SOLVER_HPP
#define ARM_IK_DLS_SOLVER_HPP

#include "arm_ik/types.hpp"

#include <optional>

namespace arm_ik {

constexpr double kDefaultPivotEpsilon = 1e-12;

/**
 * @brief Gauss-Jordan inverse with partial pivoting
 * @return std::nullopt when the best pivot magnitude falls below epsilon
 */
std::optional<Eigen::MatrixXd> invertGaussJordan(
    const Eigen::MatrixXd& A,
    double pivot_epsilon = kDefaultPivotEpsilon
);

/**
 * @brief Regularised pseudoinverse step
 *
 * λ must be strictly positive, which keeps J Jᵀ + λ² I positive definite
 * in exact arithmetic. The pivot test still catches round-off collapse.
 */
class DampedLeastSquares {
public:
    /**
     * @throws ConfigurationError if damping <= 0 or pivot_epsilon <= 0
     */
    explicit DampedLeastSquares(
        double damping,
        double pivot_epsilon = kDefaultPivotEpsilon
    );

    /**
     * @brief Solve for the joint update
     * @param J Weighted Jacobian (m × n)
     * @param error Weighted task error (m)
     * @return Δq (n), or std::nullopt when the normal matrix is singular
     */
    std::optional<Eigen::VectorXd> solve(
        const Eigen::MatrixXd& J,
        const Eigen::VectorXd& error
    ) const;

    /**
     * @brief J Jᵀ + λ² I
     */
    Eigen::MatrixXd normalMatrix(const Eigen::MatrixXd& J) const;

    double damping() const { return damping_; }
    double pivotEpsilon() const { return pivot_epsilon_; }

private:
    double damping_;
    double pivot_epsilon_;
};

}  // namespace arm_ik

#endif  // ARM_IK_DLS_SOLVER_HPP
