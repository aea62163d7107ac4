#ifndef MINIMOD_OBJECTIVE_FUNCTION_HPP
#define MINIMOD_OBJECTIVE_FUNCTION_HPP

#include "minimod/continuous_simulator.hpp"
#include "minimod/diagnostics.hpp"
#include "minimod/observed_data.hpp"
#include "minimod/system_config.hpp"

#include <functional>
#include <string>
#include <vector>

namespace minimod {

/// Ordered values of the estimated quantities; the order is fixed by the ConfigFactory.
using ParameterVector = std::vector<double>;

/// Rebuilds a fresh SystemConfig from a candidate ParameterVector.
using ConfigFactory = std::function<SystemConfig(const ParameterVector &)>;

/**
 * @brief Residuals `simulated - observed`, one entry per observed point.
 *
 * Observed fields are concatenated in name order, so with a single observed field `times`
 * is exactly the observed time index. Entries whose simulated row is missing (the
 * integrator stopped early) are NaN.
 */
struct Residuals {
    std::vector<double> times;
    std::vector<std::string> fields;
    std::vector<double> values;
    Diagnostics simulation; ///< Diagnostics of the simulation the residuals came from.

    size_t size() const { return values.size(); }

    /// Sum of squared residuals; NaN if any entry is NaN.
    double squared_norm() const;
};

/**
 * @brief Maps a ParameterVector to residuals against observed data.
 *
 * Each call builds a new SystemConfig through the factory, runs the ContinuousSimulator with
 * the observed times as explicit evaluation times, and subtracts the observations. Nothing is
 * carried over between calls.
 */
class ObjectiveFunction {
  public:
    /**
     * @throws ConfigurationError if the data are malformed or the factory/rule is empty.
     */
    ObjectiveFunction(ConfigFactory factory, SlopeRule slope, ObservedData data, IntegratorOptions options = {});

    /**
     * @brief Evaluate the residuals for one candidate.
     *
     * Solver non-convergence does not throw; it shows up in Residuals::simulation and as
     * NaN entries. Configuration errors from the factory and slope-rule exceptions propagate.
     */
    Residuals operator()(const ParameterVector &params) const;

    /// Run the underlying simulation for a candidate on the observed time grid.
    SimulationResult simulate(const ParameterVector &params) const;

    size_t num_residuals() const { return data_.size() * data_.measurements.size(); }
    const ObservedData &data() const { return data_; }

    /// Print every evaluated ParameterVector to stdout.
    void set_log_evaluations(bool enabled) { log_evaluations_ = enabled; }
    bool log_evaluations() const { return log_evaluations_; }

  private:
    ConfigFactory factory_;
    ContinuousSimulator simulator_;
    ObservedData data_;
    bool log_evaluations_ = false;
};

} // namespace minimod

#endif // MINIMOD_OBJECTIVE_FUNCTION_HPP
