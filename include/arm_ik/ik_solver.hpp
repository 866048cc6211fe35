/**
 * @file ik_solver.hpp
 * @brief Weighted multi-target Damped Least Squares IK solver
 *
 * One generic engine for 1-3 position targets plus an optional
 * orientation target:
 * - bounded iterate-until-converge loop
 * - per-joint step caps and rig sign calibration
 * - joint limit clamping after every step
 * - post-hoc validation with rollback to the pre-solve snapshot
 */

#ifndef ARM_IK_IK_SOLVER_HPP
#define ARM_IK_IK_SOLVER_HPP

#include "arm_ik/dls_solver.hpp"
#include "arm_ik/kinematic_chain.hpp"
#include "arm_ik/multi_target_jacobian.hpp"
#include "arm_ik/solution_validator.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace arm_ik {

/**
 * @brief IK solver configuration
 */
struct SolverConfig {
    int max_iterations = 40;
    double position_tolerance = 0.005;      // Length units of the chain
    double orientation_tolerance = 0.02;    // rad
    double damping = 0.2;                   // DLS λ
    double step_scale = 0.7;                // Global step factor
    double default_max_step = 0.15;         // rad per iteration
    double acceptance_threshold = 0.6;      // Validator max raw error
    double singular_pivot_epsilon = kDefaultPivotEpsilon;

    std::map<std::string, double> max_step_per_joint;      // rad
    std::map<std::string, double> target_weights;          // By control point
    std::map<std::string, AngleRange> joint_limit_overrides;
    std::set<std::string> inverted_joints;                 // Rig sign calibration
};

/**
 * @brief How the iteration loop ended
 */
enum class SolveStatus {
    Converged,
    BudgetExhausted,
    SingularAbort
};

/**
 * @brief What the validator did with the candidate
 */
enum class SolveOutcome {
    Committed,
    RejectedRolledBack
};

const char* toString(SolveStatus status);
const char* toString(SolveOutcome outcome);

/**
 * @brief IK solution result
 */
struct SolveResult {
    Eigen::VectorXd joint_positions;        // Angles held by the chain afterwards
    Eigen::VectorXd candidate;              // Angles the loop ended with
    SolveStatus status = SolveStatus::BudgetExhausted;
    SolveOutcome outcome = SolveOutcome::RejectedRolledBack;
    int iterations = 0;                     // Steps applied
    double position_residual = 0.0;         // Loop residual at exit
    double orientation_error = 0.0;
    std::vector<double> target_errors;      // Raw distances of the candidate
    double max_error = 0.0;

    bool committed() const { return outcome == SolveOutcome::Committed; }
};

/**
 * @brief Statistics for IK solver performance tracking
 */
struct IKStatistics {
    int total_calls = 0;
    int committed_calls = 0;
    int rejected_calls = 0;
    int converged_calls = 0;
    int singular_aborts = 0;
    int total_iterations = 0;
    double mean_iterations = 0.0;
    int max_iterations_used = 0;
    double success_rate = 0.0;

    void update(const SolveResult& result) {
        total_calls++;
        if (result.committed()) {
            committed_calls++;
            total_iterations += result.iterations;
        } else {
            rejected_calls++;
        }
        if (result.status == SolveStatus::Converged) converged_calls++;
        if (result.status == SolveStatus::SingularAbort) singular_aborts++;

        max_iterations_used = std::max(max_iterations_used, result.iterations);
        mean_iterations = committed_calls > 0 ?
            static_cast<double>(total_iterations) / committed_calls : 0.0;
        success_rate = total_calls > 0 ?
            static_cast<double>(committed_calls) / total_calls : 0.0;
    }

    void reset() { *this = IKStatistics(); }

    // True on every interval-th solve, whatever its outcome
    bool summaryDue(int interval) const {
        return interval > 0 && total_calls > 0 && total_calls % interval == 0;
    }
};

/**
 * @brief Throws ConfigurationError on the first illegal value
 */
void validateConfig(const SolverConfig& config);

/**
 * @brief Iteration controller plus validator
 *
 * INIT → ITERATING → {CONVERGED | BUDGET_EXHAUSTED | SINGULAR_ABORT}
 *      → VALIDATING → {COMMITTED | REJECTED_ROLLED_BACK}
 */
class IKSolver {
public:
    explicit IKSolver(const SolverConfig& config = SolverConfig());

    /**
     * @brief Solve toward the targets, starting from the chain's angles
     *
     * Structural and configuration problems throw before iterating.
     * Numerical outcomes are reported in the result, never thrown.
     */
    SolveResult solve(KinematicChain& chain, const std::vector<Target>& targets);

    /**
     * @brief Solve with an iteration cap and tolerance other than the config's
     */
    SolveResult solve(
        KinematicChain& chain,
        const std::vector<Target>& targets,
        int max_iterations,
        double position_tolerance
    );

    /**
     * @brief Targets with config weight overrides applied
     */
    std::vector<Target> weightedTargets(const std::vector<Target>& targets) const;

    const SolverConfig& getConfig() const { return config_; }

    /**
     * @throws ConfigurationError on an illegal value
     */
    void setConfig(const SolverConfig& config);

    const IKStatistics& getStatistics() const { return stats_; }
    void resetStatistics() { stats_.reset(); }

private:
    struct JointPolicy {
        AngleRange limits;
        double max_step;
        double sign;
    };

    std::vector<JointPolicy> resolveJointPolicies(const KinematicChain& chain) const;

    SolverConfig config_;
    IKStatistics stats_;
};

}  // namespace arm_ik

#endif  // ARM_IK_IK_SOLVER_HPP
