/**
 * @file solution_validator.hpp
 * @brief Post-solve acceptance check with all-or-nothing rollback
 */

#ifndef ARM_IK_SOLUTION_VALIDATOR_HPP
#define ARM_IK_SOLUTION_VALIDATOR_HPP

#include "arm_ik/kinematic_chain.hpp"
#include "arm_ik/multi_target_jacobian.hpp"

#include <vector>

namespace arm_ik {

/**
 * @brief Raw (unweighted) target distances for a candidate solution
 */
struct ValidationReport {
    std::vector<double> errors;
    double max_error = 0.0;
    bool accepted = false;
};

/**
 * @brief Accepts a candidate angle vector or restores the pre-solve snapshot
 *
 * The only place where a solve result reaches the chain.
 */
class SolutionValidator {
public:
    /**
     * @throws ConfigurationError if the threshold is not strictly positive
     */
    explicit SolutionValidator(double acceptance_threshold);

    /**
     * @brief Measure the candidate without touching the chain
     */
    ValidationReport evaluate(
        const KinematicChain& chain,
        const Eigen::VectorXd& candidate,
        const std::vector<Target>& targets
    ) const;

    /**
     * @brief Commit the candidate if accepted, otherwise restore the snapshot
     */
    ValidationReport commitOrRollback(
        KinematicChain& chain,
        const Eigen::VectorXd& candidate,
        const Eigen::VectorXd& snapshot,
        const std::vector<Target>& targets
    ) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

}  // namespace arm_ik

#endif  // ARM_IK_SOLUTION_VALIDATOR_HPP
