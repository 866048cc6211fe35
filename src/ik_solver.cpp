/**
 * @file ik_solver.cpp
 * @brief Implementation of the weighted multi-target DLS solver
 */

#include "arm_ik/ik_solver.hpp"

namespace arm_ik {

const char* toString(SolveStatus status) {
    switch (status) {
        case SolveStatus::Converged: return "converged";
        case SolveStatus::BudgetExhausted: return "budget_exhausted";
        case SolveStatus::SingularAbort: return "singular_abort";
    }
    return "unknown";
}

const char* toString(SolveOutcome outcome) {
    switch (outcome) {
        case SolveOutcome::Committed: return "committed";
        case SolveOutcome::RejectedRolledBack: return "rejected_rolled_back";
    }
    return "unknown";
}

void validateConfig(const SolverConfig& config) {
    if (config.max_iterations < 1) {
        throw ConfigurationError("max_iterations must be at least 1");
    }
    if (!(config.position_tolerance > 0.0)) {
        throw ConfigurationError("position_tolerance must be strictly positive");
    }
    if (!(config.orientation_tolerance > 0.0)) {
        throw ConfigurationError("orientation_tolerance must be strictly positive");
    }
    if (!(config.damping > 0.0)) {
        throw ConfigurationError("damping must be strictly positive");
    }
    if (!(config.step_scale > 0.0)) {
        throw ConfigurationError("step_scale must be strictly positive");
    }
    if (!(config.default_max_step > 0.0)) {
        throw ConfigurationError("default_max_step must be strictly positive");
    }
    if (!(config.acceptance_threshold > 0.0)) {
        throw ConfigurationError("acceptance_threshold must be strictly positive");
    }
    if (!(config.singular_pivot_epsilon > 0.0)) {
        throw ConfigurationError("singular_pivot_epsilon must be strictly positive");
    }
    for (const auto& [joint, step] : config.max_step_per_joint) {
        if (!(step > 0.0)) {
            throw ConfigurationError("max step for '" + joint + "' must be strictly positive");
        }
    }
    for (const auto& [point, weight] : config.target_weights) {
        if (!(weight > 0.0)) {
            throw ConfigurationError("weight for '" + point + "' must be strictly positive");
        }
    }
    for (const auto& [joint, range] : config.joint_limit_overrides) {
        if (!range.valid()) {
            throw ConfigurationError("limit override for '" + joint + "' is empty");
        }
    }
}

IKSolver::IKSolver(const SolverConfig& config) : config_(config) {
    validateConfig(config_);
}

void IKSolver::setConfig(const SolverConfig& config) {
    validateConfig(config);
    config_ = config;
}

std::vector<Target> IKSolver::weightedTargets(const std::vector<Target>& targets) const {
    std::vector<Target> weighted = targets;
    for (auto& target : weighted) {
        auto it = config_.target_weights.find(target.point);
        if (it != config_.target_weights.end()) {
            target.weight = it->second;
        }
    }
    return weighted;
}

std::vector<IKSolver::JointPolicy> IKSolver::resolveJointPolicies(
    const KinematicChain& chain
) const {
    std::vector<JointPolicy> policies(chain.numJoints());
    for (int i = 0; i < chain.numJoints(); ++i) {
        policies[i].limits = chain.joint(i).range;
        policies[i].max_step = config_.default_max_step;
        policies[i].sign = 1.0;
    }

    for (const auto& [joint, step] : config_.max_step_per_joint) {
        policies[chain.jointIndex(joint)].max_step = step;
    }

    for (const auto& [joint, range] : config_.joint_limit_overrides) {
        auto& policy = policies[chain.jointIndex(joint)];
        policy.limits = policy.limits.intersect(range);
        if (!policy.limits.valid()) {
            throw ConfigurationError("limit override for '" + joint +
                                     "' does not overlap the joint range");
        }
    }

    for (const auto& joint : config_.inverted_joints) {
        policies[chain.jointIndex(joint)].sign = -1.0;
    }

    return policies;
}

SolveResult IKSolver::solve(KinematicChain& chain, const std::vector<Target>& targets) {
    return solve(chain, targets, config_.max_iterations, config_.position_tolerance);
}

SolveResult IKSolver::solve(
    KinematicChain& chain,
    const std::vector<Target>& targets,
    int max_iterations,
    double position_tolerance
) {
    if (max_iterations < 1) {
        throw ConfigurationError("max_iterations must be at least 1");
    }
    if (!(position_tolerance > 0.0)) {
        throw ConfigurationError("position_tolerance must be strictly positive");
    }

    // INIT: everything that can fail structurally fails here
    const std::vector<Target> weighted = weightedTargets(targets);
    const MultiTargetJacobian jacobian(chain, weighted);
    const std::vector<JointPolicy> policies = resolveJointPolicies(chain);
    const DampedLeastSquares dls(config_.damping, config_.singular_pivot_epsilon);
    const SolutionValidator validator(config_.acceptance_threshold);

    const Eigen::VectorXd snapshot = chain.angles();

    Eigen::VectorXd q = snapshot;
    for (int i = 0; i < chain.numJoints(); ++i) {
        q(i) = policies[i].limits.clamp(q(i));
    }

    SolveResult result;
    result.status = SolveStatus::BudgetExhausted;

    // ITERATING
    for (int iter = 0; iter < max_iterations; ++iter) {
        const auto frames = chain.computeFrames(q);
        const TaskError error = jacobian.computeError(frames);

        result.position_residual = error.position_residual;
        result.orientation_error = error.orientation_error;

        const bool position_converged = error.position_residual < position_tolerance;
        const bool orientation_converged = !jacobian.hasOrientation() ||
            error.orientation_error < config_.orientation_tolerance;

        if (position_converged && orientation_converged) {
            result.status = SolveStatus::Converged;
            break;
        }

        const Eigen::MatrixXd J = jacobian.build(frames);
        auto dq = dls.solve(J, error.weighted);
        if (!dq) {
            result.status = SolveStatus::SingularAbort;
            break;
        }

        for (int i = 0; i < chain.numJoints(); ++i) {
            const auto& policy = policies[i];
            double step = (*dq)(i) * config_.step_scale * policy.sign;
            step = std::clamp(step, -policy.max_step, policy.max_step);
            q(i) = policy.limits.clamp(q(i) + step);
        }
        result.iterations++;
    }

    // Exhausting the budget falls through: the best effort is still validated
    if (result.status == SolveStatus::BudgetExhausted) {
        const TaskError error = jacobian.computeError(chain.computeFrames(q));
        result.position_residual = error.position_residual;
        result.orientation_error = error.orientation_error;
    }

    // VALIDATING
    result.candidate = q;
    const ValidationReport report = validator.commitOrRollback(chain, q, snapshot, weighted);
    result.target_errors = report.errors;
    result.max_error = report.max_error;
    result.outcome = report.accepted ? SolveOutcome::Committed : SolveOutcome::RejectedRolledBack;
    result.joint_positions = chain.angles();

    stats_.update(result);
    return result;
}

}  // namespace arm_ik
