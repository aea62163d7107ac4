#ifndef MINIMOD_FITTER_HPP
#define MINIMOD_FITTER_HPP

#include "minimod/diagnostics.hpp"
#include "minimod/objective_function.hpp"

#include <Eigen/Core>
#include <ceres/ceres.h>
#include <limits>
#include <string>
#include <vector>

namespace minimod {

/**
 * @brief Lifecycle of one fit.
 *
 * Initialized -> Evaluating <-> ProposingStep -> { Converged, MaxEvaluationsReached,
 * StepUnderflow, Failed }. Failed is only reached when the least-squares routine cannot work
 * with the initial guess at all.
 */
enum class FitState {
    Initialized,
    Evaluating,
    ProposingStep,
    Converged,
    MaxEvaluationsReached,
    StepUnderflow,
    Failed,
};

const char *
to_string(FitState state);

/// Tolerances, budgets and optional bounds for Fitter.
struct FitOptions {
    double function_tolerance = 1.49012e-8;  // Relative cost reduction that counts as converged
    double gradient_tolerance = 1e-10;
    double parameter_tolerance = 1.49012e-8; // Relative step size that counts as underflow
    int max_num_iterations = 200;
    size_t max_objective_evaluations = 0;    // 0 = 200 * (n + 1), n = number of parameters

    /// Per-parameter bounds; empty means unbounded, +/-infinity leaves one parameter unbounded.
    std::vector<double> lower_bounds;
    std::vector<double> upper_bounds;

    bool compute_covariance = false; // Estimate (J^T J)^-1 at the solution
    bool verbose = false;            // Ceres progress table and a summary line
    bool log_evaluations = false;    // Print each ParameterVector tried
};

struct FitResult {
    ParameterVector parameters;  ///< Best parameters found (best effort in every terminal state).
    FitState state = FitState::Initialized;
    Diagnostics diagnostics;
    Residuals residuals;         ///< Residuals at `parameters`.

    bool has_covariance = false;
    Eigen::MatrixXd covariance;  ///< (J^T J)^-1, unscaled; valid only if has_covariance.
};

/**
 * @brief Nonlinear least-squares fit of an ObjectiveFunction using Ceres Solver.
 *
 * Uses a Levenberg-Marquardt trust region with a central finite-difference Jacobian and a
 * single-threaded evaluator, so identical inputs give identical results. No restarts are
 * attempted; a caller that wants a different starting point calls fit() again.
 */
class Fitter {
  public:
    explicit Fitter(FitOptions options = {});

    /**
     * @brief Minimize the sum of squared residuals starting from initial_guess.
     *
     * @throws ConfigurationError if the guess is empty or non-finite, or the bounds are
     *         malformed or exclude the guess.
     */
    FitResult fit(const ObjectiveFunction &objective, const ParameterVector &initial_guess);

    /// State of the most recent (or ongoing) fit.
    FitState state() const { return state_; }

    const FitOptions &options() const { return options_; }

  private:
    FitOptions options_;
    FitState state_ = FitState::Initialized;

    void validate(const ParameterVector &initial_guess) const;
};

// --- Ceres adapters ---

/**
 * @brief Cost functor bridging ObjectiveFunction to ceres::DynamicNumericDiffCostFunction.
 *
 * The only place where the ParameterVector is seen as a raw double array for Ceres. Reports a
 * failed evaluation to Ceres when any residual is non-finite, so the trial step is rejected.
 */
struct ObjectiveCostFunctor {
    const ObjectiveFunction &objective_;
    const size_t num_parameters_;
    size_t *evaluations_;
    FitState *state_;
    const bool log_evaluations_;

    ObjectiveCostFunctor(const ObjectiveFunction &objective, size_t num_parameters, size_t *evaluations,
                         FitState *state, bool log_evaluations);

    bool operator()(double const *const *parameters, double *residuals) const;
};

/// Tracks the fit state between iterations and enforces the evaluation budget.
class FitIterationCallback : public ceres::IterationCallback {
  public:
    FitIterationCallback(const size_t *evaluations, size_t max_evaluations, FitState *state, bool verbose)
      : evaluations_(evaluations)
      , max_evaluations_(max_evaluations)
      , state_(state)
      , verbose_(verbose) {}

    ceres::CallbackReturnType operator()(const ceres::IterationSummary &summary) override;

    bool budget_exhausted() const { return budget_exhausted_; }

  private:
    const size_t *evaluations_;
    size_t max_evaluations_;
    FitState *state_;
    bool verbose_;
    bool budget_exhausted_ = false;
};

} // namespace minimod

#endif // MINIMOD_FITTER_HPP
