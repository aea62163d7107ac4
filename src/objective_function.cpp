#include "minimod/objective_function.hpp"
#include "minimod/errors.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace minimod {

// --- Residuals ---

double
Residuals::squared_norm() const {
    double sum = 0.0;
    for (double r : values) { sum += r * r; }
    return sum;
}

// --- ObjectiveFunction ---

ObjectiveFunction::ObjectiveFunction(ConfigFactory factory,
                                     SlopeRule slope,
                                     ObservedData data,
                                     IntegratorOptions options)
  : factory_(std::move(factory))
  , simulator_(std::move(slope), options)
  , data_(std::move(data)) {
    if (!factory_) { throw ConfigurationError("ObjectiveFunction requires a config factory."); }
    data_.validate();
}

SimulationResult
ObjectiveFunction::simulate(const ParameterVector &params) const {
    SystemConfig const config = factory_(params);
    for (const auto &pair : data_.measurements) {
        if (!config.initial_state().has(pair.first)) {
            throw ConfigurationError("Observed field '" + pair.first + "' is not a state field.");
        }
    }
    return simulator_.run(config, data_.times);
}

Residuals
ObjectiveFunction::operator()(const ParameterVector &params) const {
    if (log_evaluations_) {
        std::cout << "[ObjectiveFunction] params = [";
        for (size_t i = 0; i < params.size(); ++i) { std::cout << (i > 0 ? ", " : "") << params[i]; }
        std::cout << "]" << std::endl;
    }

    SimulationResult sim = simulate(params);
    const Trajectory &traj = sim.trajectory;

    Residuals residuals;
    residuals.times.reserve(num_residuals());
    residuals.fields.reserve(num_residuals());
    residuals.values.reserve(num_residuals());

    // Row i of the trajectory belongs to data_.times[i]; a failed run yields a shorter prefix.
    for (const auto &pair : data_.measurements) {
        const std::string &field = pair.first;
        const std::vector<double> &observed = pair.second;
        for (size_t i = 0; i < data_.times.size(); ++i) {
            double r = std::numeric_limits<double>::quiet_NaN();
            if (i < traj.size()) { r = traj.state(i).get(field) - observed[i]; }
            residuals.times.push_back(data_.times[i]);
            residuals.fields.push_back(field);
            residuals.values.push_back(r);
        }
    }

    if (!sim.diagnostics.success) {
        std::cerr << "[ObjectiveFunction] Warning: simulation did not converge; residuals are degraded." << '\n';
    }
    residuals.simulation = std::move(sim.diagnostics);
    return residuals;
}

} // namespace minimod
