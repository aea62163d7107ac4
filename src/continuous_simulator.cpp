#include "minimod/continuous_simulator.hpp"
#include "minimod/errors.hpp"

#include <algorithm>
#include <cmath>     // For std::isfinite
#include <iostream>
#include <sstream>
#include <stdexcept> // For std::runtime_error, std::logic_error
#include <utility>

namespace minimod {

namespace {

using StateType = OdeintSlopeAdapter::StateType;

// Raised by the observer to stop the integrator; caught in run_bridged() and reported.
struct NonFiniteStateError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
struct StepBudgetError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
struct StepUnderflowError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Observer for odeint: converts positional rows back to StateVectors.
// odeint copies observers, so all mutable state lives behind pointers.
struct TrajectoryObserver {
    Trajectory *results;
    const OdeintSlopeAdapter *adapter;
    bool skip_first;  // The first call is the prepended t0 row, not a requested time
    size_t max_rows;  // 0 = unlimited
    size_t *calls;

    void operator()(const StateType &x, double t) const {
        size_t const call = (*calls)++;
        if (call == 0 && skip_first) { return; }

        // A step below the resolution of t leaves time where it was.
        if (!results->empty() && !(t > results->times().back())) {
            std::stringstream ss;
            ss << "Step size underflow at t = " << t << ".";
            throw StepUnderflowError(ss.str());
        }
        results->append(t, adapter->to_state(x));

        for (double v : x) {
            if (!std::isfinite(v)) {
                std::stringstream ss;
                ss << "State became non-finite at t = " << t << ".";
                throw NonFiniteStateError(ss.str());
            }
        }
        if (max_rows > 0 && results->size() > max_rows) {
            throw StepBudgetError("Max number of integrator steps exceeded (" + std::to_string(max_rows - 1) + ").");
        }
    }
};

template<typename IntegrateFn>
SimulationResult
run_bridged(const SlopeRule &rule,
            const SystemConfig &config,
            bool skip_first_row,
            size_t max_rows,
            IntegrateFn integrate) {
    SimulationResult result;
    size_t evaluations = 0;
    size_t observer_calls = 0;

    const StateVector &prototype = config.initial_state();
    OdeintSlopeAdapter system(rule, config, prototype, evaluations);
    TrajectoryObserver const observer{ &result.trajectory, &system, skip_first_row, max_rows, &observer_calls };
    StateType state = prototype.values();

    Diagnostics &diag = result.diagnostics;
    try {
        diag.num_iterations = integrate(system, state, observer);
        diag.success = true;
        diag.message = "The solver successfully reached the end of the integration interval.";
    } catch (const odeint::odeint_error &e) {
        diag.success = false;
        diag.message = std::string("Integration failed: ") + e.what();
    } catch (const NonFiniteStateError &e) {
        diag.success = false;
        diag.message = std::string("Integration failed: ") + e.what();
    } catch (const StepBudgetError &e) {
        diag.success = false;
        diag.message = std::string("Integration failed: ") + e.what();
    } catch (const StepUnderflowError &e) {
        diag.success = false;
        diag.message = std::string("Integration failed: ") + e.what();
    }
    diag.num_evaluations = evaluations;
    if (!diag.success) {
        diag.num_iterations = result.trajectory.empty() ? 0 : result.trajectory.size() - 1;
        std::cerr << "[ContinuousSimulator] Warning: " << diag.message << " Returning "
                  << result.trajectory.size() << " row(s)." << '\n';
    }
    return result;
}

} // namespace

// --- OdeintSlopeAdapter ---

void
OdeintSlopeAdapter::operator()(const StateType &x, StateType &dxdt, double t) const {
    StateVector const state = prototype_.with_values(x);
    StateVector const slope = rule_(state, t, config_);
    if (!slope.same_fields(state)) {
        throw std::logic_error("Slope rule must return one derivative per state field, named and ordered as the state.");
    }
    dxdt = slope.values();
    ++*evaluations_;
}

// --- ContinuousSimulator ---

ContinuousSimulator::ContinuousSimulator(SlopeRule rule, IntegratorOptions options)
  : rule_(std::move(rule))
  , options_(options) {
    if (!rule_) { throw ConfigurationError("ContinuousSimulator requires a slope rule."); }
    if (!(options_.abs_err > 0.0) || !(options_.rel_err > 0.0)) {
        throw ConfigurationError("Integrator tolerances must be positive.");
    }
    if (!(options_.dt_hint > 0.0)) { throw ConfigurationError("Integrator step size hint must be positive."); }
}

SimulationResult
ContinuousSimulator::run(const SystemConfig &config) const {
    using ErrorStepperType = odeint::runge_kutta_dopri5<StateType>;
    double const t0 = config.t0();
    double const t_end = config.t_end();
    double const dt_hint = t_end > t0 ? std::min(options_.dt_hint, t_end - t0) : options_.dt_hint;
    IntegratorOptions const &opts = options_;

    return run_bridged(rule_, config, false, opts.max_steps + 1, [&](auto &system, StateType &state, const auto &observer) {
        auto stepper = odeint::make_controlled(opts.abs_err, opts.rel_err, ErrorStepperType());
        return odeint::integrate_adaptive(stepper, system, state, t0, t_end, dt_hint, observer);
    });
}

SimulationResult
ContinuousSimulator::run(const SystemConfig &config, const std::vector<double> &eval_times) const {
    using ErrorStepperType = odeint::runge_kutta_dopri5<StateType>;
    double const t0 = config.t0();
    double const t_end = config.t_end();

    if (eval_times.empty()) { throw ConfigurationError("Evaluation times cannot be empty."); }
    for (size_t i = 0; i < eval_times.size(); ++i) {
        double const t = eval_times[i];
        if (!(t >= t0 && t <= t_end)) {
            std::stringstream ss;
            ss << "Evaluation time " << t << " lies outside the simulation span [" << t0 << ", " << t_end << "].";
            throw ConfigurationError(ss.str());
        }
        if (i > 0 && !(t > eval_times[i - 1])) {
            throw ConfigurationError("Evaluation times must be strictly increasing (index " + std::to_string(i) + ").");
        }
    }

    // integrate_times starts integrating at the first time it is given.
    std::vector<double> observe_times;
    observe_times.reserve(eval_times.size() + 1);
    bool const prepend_t0 = eval_times.front() > t0;
    if (prepend_t0) { observe_times.push_back(t0); }
    observe_times.insert(observe_times.end(), eval_times.begin(), eval_times.end());

    double const span = observe_times.back() - observe_times.front();
    double const dt_hint = span > 0.0 ? std::min(options_.dt_hint, span) : options_.dt_hint;
    IntegratorOptions const &opts = options_;

    return run_bridged(rule_, config, prepend_t0, 0, [&](auto &system, StateType &state, const auto &observer) {
        auto stepper = odeint::make_controlled(opts.abs_err, opts.rel_err, ErrorStepperType());
        return odeint::integrate_times(stepper,
                                       system,
                                       state,
                                       observe_times.begin(),
                                       observe_times.end(),
                                       dt_hint,
                                       observer,
                                       odeint::max_step_checker(static_cast<int>(opts.max_steps)));
    });
}

} // namespace minimod
