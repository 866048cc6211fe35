/**
 * @file dls_solver.cpp
 * @brief Implementation of the Damped Least Squares step
 */

#include "arm_ik/dls_solver.hpp"

#include <string>

namespace arm_ik {

std::optional<Eigen::MatrixXd> invertGaussJordan(
    const Eigen::MatrixXd& A,
    double pivot_epsilon
) {
    if (A.rows() != A.cols()) {
        throw StructuralError("Gauss-Jordan inversion needs a square matrix, got " +
                              std::to_string(A.rows()) + "x" + std::to_string(A.cols()));
    }

    const Eigen::Index n = A.rows();
    Eigen::MatrixXd a = A;
    Eigen::MatrixXd inv = Eigen::MatrixXd::Identity(n, n);

    for (Eigen::Index col = 0; col < n; ++col) {
        // Partial pivoting: largest magnitude at or below the diagonal
        Eigen::Index pivot_row = col;
        double pivot_val = std::abs(a(col, col));
        for (Eigen::Index r = col + 1; r < n; ++r) {
            const double v = std::abs(a(r, col));
            if (v > pivot_val) {
                pivot_val = v;
                pivot_row = r;
            }
        }
        if (pivot_val < pivot_epsilon) {
            return std::nullopt;
        }

        if (pivot_row != col) {
            a.row(col).swap(a.row(pivot_row));
            inv.row(col).swap(inv.row(pivot_row));
        }

        const double pivot = a(col, col);
        a.row(col) /= pivot;
        inv.row(col) /= pivot;

        for (Eigen::Index r = 0; r < n; ++r) {
            if (r == col) continue;
            const double factor = a(r, col);
            if (factor == 0.0) continue;
            a.row(r) -= factor * a.row(col);
            inv.row(r) -= factor * inv.row(col);
        }
    }

    return inv;
}

DampedLeastSquares::DampedLeastSquares(double damping, double pivot_epsilon)
    : damping_(damping), pivot_epsilon_(pivot_epsilon) {
    if (!(damping_ > 0.0)) {
        throw ConfigurationError("DLS damping must be strictly positive, got " +
                                 std::to_string(damping_));
    }
    if (!(pivot_epsilon_ > 0.0)) {
        throw ConfigurationError("singular pivot epsilon must be strictly positive");
    }
}

Eigen::MatrixXd DampedLeastSquares::normalMatrix(const Eigen::MatrixXd& J) const {
    Eigen::MatrixXd JJt = J * J.transpose();
    JJt.diagonal().array() += damping_ * damping_;
    return JJt;
}

std::optional<Eigen::VectorXd> DampedLeastSquares::solve(
    const Eigen::MatrixXd& J,
    const Eigen::VectorXd& error
) const {
    if (J.rows() != error.size()) {
        throw StructuralError("Jacobian rows (" + std::to_string(J.rows()) +
                              ") do not match error size (" +
                              std::to_string(error.size()) + ")");
    }

    auto inv = invertGaussJordan(normalMatrix(J), pivot_epsilon_);
    if (!inv) {
        return std::nullopt;
    }

    // Δq = Jᵀ · (J Jᵀ + λ² I)⁻¹ · e
    Eigen::VectorXd v = (*inv) * error;
    return Eigen::VectorXd(J.transpose() * v);
}

}  // namespace arm_ik
