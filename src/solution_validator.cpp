/**
 * @file solution_validator.cpp
 * @brief Implementation of the post-solve validator
 */

#include "arm_ik/solution_validator.hpp"

#include <algorithm>
#include <string>

namespace arm_ik {

SolutionValidator::SolutionValidator(double acceptance_threshold)
    : threshold_(acceptance_threshold) {
    if (!(threshold_ > 0.0)) {
        throw ConfigurationError("acceptance threshold must be strictly positive, got " +
                                 std::to_string(threshold_));
    }
}

ValidationReport SolutionValidator::evaluate(
    const KinematicChain& chain,
    const Eigen::VectorXd& candidate,
    const std::vector<Target>& targets
) const {
    ValidationReport report;
    const auto frames = chain.computeFrames(candidate);

    report.errors.reserve(targets.size());
    for (const auto& target : targets) {
        const auto& point = chain.controlPoint(target.point);
        const double err = (target.position - chain.pointPose(frames, point).position).norm();
        report.errors.push_back(err);
        report.max_error = std::max(report.max_error, err);
    }

    report.accepted = report.max_error <= threshold_;
    return report;
}

ValidationReport SolutionValidator::commitOrRollback(
    KinematicChain& chain,
    const Eigen::VectorXd& candidate,
    const Eigen::VectorXd& snapshot,
    const std::vector<Target>& targets
) const {
    ValidationReport report = evaluate(chain, candidate, targets);
    if (report.accepted) {
        chain.setAngles(candidate);
    } else {
        chain.setAngles(snapshot);
    }
    return report;
}

}  // namespace arm_ik
