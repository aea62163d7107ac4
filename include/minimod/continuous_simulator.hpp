#ifndef MINIMOD_CONTINUOUS_SIMULATOR_HPP
#define MINIMOD_CONTINUOUS_SIMULATOR_HPP

#include "minimod/diagnostics.hpp"
#include "minimod/state_vector.hpp"
#include "minimod/system_config.hpp"
#include "minimod/trajectory.hpp"

#include <boost/numeric/odeint.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace minimod {

namespace odeint = boost::numeric::odeint;

/**
 * @brief Computes the instantaneous derivatives of the state.
 *
 * Called as `rule(state, t, config)`; the returned StateVector holds d(field)/dt for every
 * field of `state`, under the same names and in the same order.
 */
using SlopeRule = std::function<StateVector(const StateVector &, double, const SystemConfig &)>;

/// Tolerances and limits handed to the adaptive integrator.
struct IntegratorOptions {
    double abs_err = 1e-8;
    double rel_err = 1e-8;
    double dt_hint = 0.01;       // Initial step size guess
    size_t max_steps = 100000;   // Steps allowed between two output rows
};

struct SimulationResult {
    Trajectory trajectory;
    Diagnostics diagnostics;
};

/**
 * @brief Bridges a named SlopeRule to odeint's positional system signature.
 *
 * This is the only place that converts between StateVector and std::vector<double> for the
 * integrator. Counts slope evaluations through the supplied counter.
 */
class OdeintSlopeAdapter {
  public:
    using StateType = std::vector<double>;

    OdeintSlopeAdapter(const SlopeRule &rule, const SystemConfig &config, const StateVector &prototype,
                       size_t &evaluations)
      : rule_(rule)
      , config_(config)
      , prototype_(prototype)
      , evaluations_(&evaluations) {}

    void operator()(const StateType &x, StateType &dxdt, double t) const;

    StateVector to_state(const StateType &x) const { return prototype_.with_values(x); }

  private:
    const SlopeRule &rule_;
    const SystemConfig &config_;
    const StateVector &prototype_;
    size_t *evaluations_;
};

/**
 * @brief Continuous-time simulator driven by an adaptive Dormand-Prince 5(4) integrator.
 *
 * The simulator does not step anything itself. It translates the configuration for
 * Boost.Odeint, runs it, and translates the positional rows back into a Trajectory.
 *
 * Solver trouble (step size underflow or adjustment failure, step budget exhausted, non-finite state) is a
 * soft failure: the rows integrated so far are returned and Diagnostics::success is false.
 * Exceptions raised by the slope rule itself are not caught.
 */
class ContinuousSimulator {
  public:
    explicit ContinuousSimulator(SlopeRule rule, IntegratorOptions options = {});

    /**
     * @brief Integrate over [t0, t_end], recording one row per accepted integrator step.
     */
    SimulationResult run(const SystemConfig &config) const;

    /**
     * @brief Integrate over [t0, t_end], recording one row per requested time.
     *
     * @param eval_times Strictly increasing times inside [t0, t_end].
     * @throws ConfigurationError if eval_times is empty, unordered or outside the span.
     */
    SimulationResult run(const SystemConfig &config, const std::vector<double> &eval_times) const;

    const IntegratorOptions &options() const { return options_; }

  private:
    SlopeRule rule_;
    IntegratorOptions options_;
};

} // namespace minimod

#endif // MINIMOD_CONTINUOUS_SIMULATOR_HPP
