#include "minimod/discrete_simulator.hpp"
#include "minimod/errors.hpp"

#include <cmath>
#include <utility>

namespace minimod {

DiscreteSimulator::DiscreteSimulator(UpdateRule rule)
  : rule_(std::move(rule)) {
    if (!rule_) { throw ConfigurationError("DiscreteSimulator requires an update rule."); }
}

size_t
DiscreteSimulator::num_steps(const SystemConfig &config) {
    double const span = config.t_end() - config.t0();
    // Tolerate spans that are a multiple of dt up to rounding (e.g. 1.0 / 0.1).
    auto n_steps = static_cast<size_t>(std::floor(span / config.dt() + 1e-9));
    while (n_steps > 0 && config.t0() + static_cast<double>(n_steps) * config.dt() > config.t_end() + 1e-9 * config.dt()) {
        --n_steps;
    }
    return n_steps;
}

Trajectory
DiscreteSimulator::run(const SystemConfig &config) const {
    size_t const n_steps = num_steps(config);
    double const t0 = config.t0();
    double const dt = config.dt();

    Trajectory results;
    StateVector state = config.initial_state();
    results.append(t0, state);

    for (size_t i = 0; i < n_steps; ++i) {
        // Grid points are recomputed from t0 so they do not accumulate rounding drift.
        double const t = t0 + static_cast<double>(i) * dt;
        state = rule_(state, t, config);
        results.append(t0 + static_cast<double>(i + 1) * dt, state);
    }
    return results;
}

} // namespace minimod
