#ifndef MINIMOD_DISCRETE_SIMULATOR_HPP
#define MINIMOD_DISCRETE_SIMULATOR_HPP

#include "minimod/state_vector.hpp"
#include "minimod/system_config.hpp"
#include "minimod/trajectory.hpp"

#include <functional>

namespace minimod {

/**
 * @brief Computes the next discrete-time state directly from the current one.
 *
 * Called as `rule(state, t, config)` and expected to return the state at `t + config.dt()`,
 * typically via an explicit Euler step. Must be deterministic and free of side effects.
 */
using UpdateRule = std::function<StateVector(const StateVector &, double, const SystemConfig &)>;

/**
 * @brief Fixed-step stepping harness for an UpdateRule.
 *
 * Performs no numerical integration itself: it only walks the time grid
 * t0, t0 + dt, t0 + 2dt, ... and records what the rule returns. The last recorded time never
 * exceeds t_end. Exceptions raised by the rule propagate unchanged.
 */
class DiscreteSimulator {
  public:
    explicit DiscreteSimulator(UpdateRule rule);

    /**
     * @brief Run the rule over [config.t0(), config.t_end()].
     * @return Trajectory with floor((t_end - t0) / dt) + 1 rows, starting with the initial state.
     */
    Trajectory run(const SystemConfig &config) const;

    /// Number of steps run() will take for the given configuration.
    static size_t num_steps(const SystemConfig &config);

  private:
    UpdateRule rule_;
};

} // namespace minimod

#endif // MINIMOD_DISCRETE_SIMULATOR_HPP
