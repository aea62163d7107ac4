// src/fitter.cpp

#include "minimod/fitter.hpp"
#include "minimod/errors.hpp"

#include <cmath>    // For std::isfinite, std::sqrt
#include <iostream>
#include <limits>   // For unbounded parameters
#include <sstream>
#include <utility>

namespace minimod {

const char *
to_string(FitState state) {
    switch (state) {
        case FitState::Initialized: return "Initialized";
        case FitState::Evaluating: return "Evaluating";
        case FitState::ProposingStep: return "ProposingStep";
        case FitState::Converged: return "Converged";
        case FitState::MaxEvaluationsReached: return "MaxEvaluationsReached";
        case FitState::StepUnderflow: return "StepUnderflow";
        case FitState::Failed: return "Failed";
    }
    return "Unknown";
}

namespace {

FitState
terminal_state(const ceres::Solver::Summary &summary, bool budget_exhausted) {
    if (budget_exhausted) { return FitState::MaxEvaluationsReached; }
    switch (summary.termination_type) {
        case ceres::CONVERGENCE:
            // Ceres reports a vanishing step as convergence; keep it distinguishable.
            if (summary.message.find("Parameter tolerance") != std::string::npos ||
                summary.message.find("Minimum trust region radius") != std::string::npos) {
                return FitState::StepUnderflow;
            }
            return FitState::Converged;
        case ceres::USER_SUCCESS: return FitState::Converged;
        case ceres::NO_CONVERGENCE: return FitState::MaxEvaluationsReached;
        default: return FitState::Failed;
    }
}

void
print_parameters(std::ostream &os, const double *params, size_t n) {
    os << "[";
    for (size_t i = 0; i < n; ++i) { os << (i > 0 ? ", " : "") << params[i]; }
    os << "]";
}

} // namespace

// --- ObjectiveCostFunctor ---

ObjectiveCostFunctor::ObjectiveCostFunctor(const ObjectiveFunction &objective,
                                           size_t num_parameters,
                                           size_t *evaluations,
                                           FitState *state,
                                           bool log_evaluations)
  : objective_(objective)
  , num_parameters_(num_parameters)
  , evaluations_(evaluations)
  , state_(state)
  , log_evaluations_(log_evaluations) {}

bool
ObjectiveCostFunctor::operator()(double const *const *parameters, double *residuals) const {
    *state_ = FitState::Evaluating;
    const double *p = parameters[0];
    ParameterVector const candidate(p, p + num_parameters_);

    if (log_evaluations_) {
        std::cout << "[Fitter] evaluation " << (*evaluations_ + 1) << ": params = ";
        print_parameters(std::cout, p, num_parameters_);
        std::cout << std::endl;
    }

    Residuals const r = objective_(candidate);
    ++*evaluations_;

    bool finite = true;
    for (size_t i = 0; i < r.size(); ++i) {
        residuals[i] = r.values[i];
        if (!std::isfinite(r.values[i])) { finite = false; }
    }
    return finite;
}

// --- FitIterationCallback ---

ceres::CallbackReturnType
FitIterationCallback::operator()(const ceres::IterationSummary &summary) {
    *state_ = FitState::ProposingStep;
    if (verbose_) {
        std::cout << "[Fitter] iteration " << summary.iteration << ": cost = " << summary.cost
                  << ", objective evaluations = " << *evaluations_ << std::endl;
    }
    if (max_evaluations_ > 0 && *evaluations_ >= max_evaluations_) {
        budget_exhausted_ = true;
        return ceres::SOLVER_TERMINATE_SUCCESSFULLY;
    }
    return ceres::SOLVER_CONTINUE;
}

// --- Fitter ---

Fitter::Fitter(FitOptions options)
  : options_(std::move(options)) {
    if (options_.max_num_iterations <= 0) { throw ConfigurationError("max_num_iterations must be positive."); }
}

void
Fitter::validate(const ParameterVector &initial_guess) const {
    size_t const n = initial_guess.size();
    if (n == 0) { throw ConfigurationError("Initial parameter guess cannot be empty."); }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(initial_guess[i])) {
            throw ConfigurationError("Initial guess for parameter " + std::to_string(i) + " is not finite.");
        }
    }
    if (!options_.lower_bounds.empty() && options_.lower_bounds.size() != n) {
        throw ConfigurationError("Lower bounds vector size must match the number of parameters.");
    }
    if (!options_.upper_bounds.empty() && options_.upper_bounds.size() != n) {
        throw ConfigurationError("Upper bounds vector size must match the number of parameters.");
    }
    for (size_t i = 0; i < n; ++i) {
        double const lo = options_.lower_bounds.empty() ? -std::numeric_limits<double>::infinity()
                                                        : options_.lower_bounds[i];
        double const hi = options_.upper_bounds.empty() ? std::numeric_limits<double>::infinity()
                                                        : options_.upper_bounds[i];
        if (!(lo < hi)) {
            throw ConfigurationError("Lower bound must be below upper bound for parameter " + std::to_string(i) + ".");
        }
        if (initial_guess[i] < lo || initial_guess[i] > hi) {
            std::stringstream ss;
            ss << "Initial guess " << initial_guess[i] << " for parameter " << i << " lies outside [" << lo << ", "
               << hi << "].";
            throw ConfigurationError(ss.str());
        }
    }
}

FitResult
Fitter::fit(const ObjectiveFunction &objective, const ParameterVector &initial_guess) {
    validate(initial_guess);
    state_ = FitState::Initialized;

    size_t const n = initial_guess.size();
    size_t const max_evaluations =
      options_.max_objective_evaluations > 0 ? options_.max_objective_evaluations : 200 * (n + 1);

    FitResult result;
    result.parameters = initial_guess; // Ceres updates this buffer in place
    double *params = result.parameters.data();
    size_t evaluations = 0;

    ceres::Problem problem;

    auto *cost_function = new ceres::DynamicNumericDiffCostFunction<ObjectiveCostFunctor, ceres::CENTRAL>(
      new ObjectiveCostFunctor(objective, n, &evaluations, &state_, options_.log_evaluations));
    cost_function->AddParameterBlock(static_cast<int>(n));
    cost_function->SetNumResiduals(static_cast<int>(objective.num_residuals()));
    problem.AddResidualBlock(cost_function, nullptr, params);

    for (size_t i = 0; i < n; ++i) {
        if (!options_.lower_bounds.empty() && std::isfinite(options_.lower_bounds[i])) {
            problem.SetParameterLowerBound(params, static_cast<int>(i), options_.lower_bounds[i]);
        }
        if (!options_.upper_bounds.empty() && std::isfinite(options_.upper_bounds[i])) {
            problem.SetParameterUpperBound(params, static_cast<int>(i), options_.upper_bounds[i]);
        }
    }

    ceres::Solver::Options solver_options;
    solver_options.minimizer_type = ceres::TRUST_REGION;
    solver_options.trust_region_strategy_type = ceres::LEVENBERG_MARQUARDT;
    solver_options.linear_solver_type = ceres::DENSE_QR; // Suitable for small to moderate problems
    solver_options.max_num_iterations = options_.max_num_iterations;
    solver_options.function_tolerance = options_.function_tolerance;
    solver_options.gradient_tolerance = options_.gradient_tolerance;
    solver_options.parameter_tolerance = options_.parameter_tolerance;
    solver_options.num_threads = 1;
    solver_options.minimizer_progress_to_stdout = options_.verbose;
    solver_options.logging_type = options_.verbose ? ceres::PER_MINIMIZER_ITERATION : ceres::SILENT;

    FitIterationCallback callback(&evaluations, max_evaluations, &state_, options_.verbose);
    solver_options.callbacks.push_back(&callback);

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);

    size_t const fit_evaluations = evaluations;
    FitState const final_state = terminal_state(summary, callback.budget_exhausted());

    if (options_.compute_covariance && final_state != FitState::Failed) {
        ceres::Covariance::Options cov_options;
        cov_options.algorithm_type = ceres::DENSE_SVD;
        cov_options.num_threads = 1;
        ceres::Covariance covariance(cov_options);

        std::vector<std::pair<const double *, const double *>> blocks = { { params, params } };
        if (covariance.Compute(blocks, &problem)) {
            // Ceres writes row-major; the matrix is symmetric so the layout does not matter.
            result.covariance.resize(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
            covariance.GetCovarianceBlock(params, params, result.covariance.data());
            result.has_covariance = true;
        } else {
            std::cerr << "[Fitter] Warning: covariance could not be computed (rank-deficient Jacobian)." << '\n';
        }
    }

    state_ = final_state;
    result.state = final_state;
    result.residuals = objective(result.parameters);

    Diagnostics &diag = result.diagnostics;
    diag.success = final_state == FitState::Converged || final_state == FitState::StepUnderflow;
    diag.message = summary.message;
    if (callback.budget_exhausted()) {
        diag.message = "Maximum number of objective evaluations reached (" + std::to_string(max_evaluations) + ").";
    }
    diag.num_iterations = static_cast<size_t>(summary.num_successful_steps + summary.num_unsuccessful_steps);
    diag.num_evaluations = fit_evaluations;
    diag.residual_norm = std::sqrt(result.residuals.squared_norm());

    if (options_.verbose) {
        std::cout << summary.BriefReport() << "\n";
        std::cout << "[Fitter] " << to_string(final_state) << " after " << fit_evaluations
                  << " objective evaluations; params = ";
        print_parameters(std::cout, params, n);
        std::cout << ", residual norm = " << diag.residual_norm << std::endl;
    }
    if (!diag.success) { std::cerr << "[Fitter] Warning: " << to_string(final_state) << ": " << diag.message << '\n'; }
    return result;
}

} // namespace minimod
