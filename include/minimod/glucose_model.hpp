#ifndef MINIMOD_GLUCOSE_MODEL_HPP
#define MINIMOD_GLUCOSE_MODEL_HPP

#include "minimod/continuous_simulator.hpp"
#include "minimod/objective_function.hpp"
#include "minimod/signal_table.hpp"
#include "minimod/state_vector.hpp"
#include "minimod/system_config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace minimod {
namespace glucose {

/*
 * Bergman minimal model of glucose/insulin dynamics:
 *
 *   dG/dt = -k1 * (G - Gb) - X * G
 *   dX/dt =  k3 * (I(t) - Ib) - k2 * X
 *
 * G is plasma glucose, X the remote insulin effect, I(t) the measured insulin curve and
 * Gb, Ib the baseline glucose and insulin (first row of the data table).
 */

// State fields
inline const std::string kGlucose = "G";
inline const std::string kInsulinEffect = "X";

// Parameter and signal names read by the rules
inline const std::string kK1 = "k1";
inline const std::string kK2 = "k2";
inline const std::string kK3 = "k3";
inline const std::string kGlucoseBaseline = "Gb";
inline const std::string kInsulinBaseline = "Ib";
inline const std::string kInsulinSignal = "I";

// Column names in the measurement table
inline const std::string kGlucoseColumn = "glucose";
inline const std::string kInsulinColumn = "insulin";

/// Slope rule for ContinuousSimulator.
StateVector
slope(const StateVector &state, double t, const SystemConfig &config);

/// Explicit Euler update rule for DiscreteSimulator (uses config.dt()).
StateVector
update(const StateVector &state, double t, const SystemConfig &config);

/**
 * @brief Estimated quantities, in ParameterVector order [G0, k1, k2, k3].
 */
struct ModelParameters {
    double G0 = 290.0;
    double k1 = 0.03;
    double k2 = 0.02;
    double k3 = 1e-05;

    ParameterVector to_vector() const { return { G0, k1, k2, k3 }; }

    /// @throws ConfigurationError unless the vector has exactly four entries.
    static ModelParameters from_vector(const ParameterVector &params);
};

/**
 * @brief Measured data prepared once per data set and shared by every fit attempt.
 */
struct GlucoseData {
    std::vector<double> times;
    std::vector<double> glucose;
    std::shared_ptr<const Interpolator> insulin;
    double glucose_baseline = 0.0;
    double insulin_baseline = 0.0;

    /// @throws ConfigurationError if the table lacks the glucose or insulin column.
    static GlucoseData from_table(const SignalTable &table, InterpolationKind kind = InterpolationKind::Linear);
};

/**
 * @brief Fresh SystemConfig for one simulation over the data span, with X(t0) = 0.
 */
SystemConfig
make_config(const ModelParameters &params, const GlucoseData &data, double dt = 2.0);

/// The measured glucose series as ObservedData for field "G".
ObservedData
observed_glucose(const GlucoseData &data);

/**
 * @brief ObjectiveFunction comparing simulated G against measured glucose.
 *
 * The ParameterVector is [G0, k1, k2, k3]; the data are captured by value.
 */
ObjectiveFunction
make_objective(const GlucoseData &data, IntegratorOptions options = {});

} // namespace glucose
} // namespace minimod

#endif // MINIMOD_GLUCOSE_MODEL_HPP
