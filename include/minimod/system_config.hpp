#ifndef MINIMOD_SYSTEM_CONFIG_HPP
#define MINIMOD_SYSTEM_CONFIG_HPP

#include "minimod/interpolation/interpolator.hpp"
#include "minimod/state_vector.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace minimod {

/**
 * @brief Immutable description of one simulation setup.
 *
 * Holds named scalar parameters, the initial state, the time span, the step size and any
 * named time-varying input signals. Only SystemConfig::Builder can create one, and build()
 * rejects invalid setups, so every SystemConfig in circulation satisfies
 * t0 <= t_end, dt > 0 and a non-empty initial state.
 *
 * Rules read it through explicit accessors (`config.parameter("k1")`), and a lookup of a name
 * that was never set throws ConfigurationError rather than defaulting.
 */
class SystemConfig {
  public:
    using Signal = std::shared_ptr<const Interpolator>;

    class Builder;

    /**
     * @brief Named scalar parameter.
     * @throws ConfigurationError if the parameter is not present.
     */
    double parameter(const std::string &name) const;
    bool has_parameter(const std::string &name) const { return parameters_.count(name) != 0; }
    const std::map<std::string, double> &parameters() const { return parameters_; }

    /**
     * @brief Named input signal.
     * @throws ConfigurationError if the signal is not present.
     */
    const Interpolator &signal(const std::string &name) const;
    bool has_signal(const std::string &name) const { return signals_.count(name) != 0; }

    /// Shorthand for signal(name).evaluate(t).
    double signal_value(const std::string &name, double t) const { return signal(name).evaluate(t); }

    const StateVector &initial_state() const { return initial_state_; }
    double t0() const { return t0_; }
    double t_end() const { return t_end_; }
    double dt() const { return dt_; }

  private:
    SystemConfig() = default;

    std::map<std::string, double> parameters_;
    std::map<std::string, Signal> signals_;
    StateVector initial_state_;
    double t0_ = 0.0;
    double t_end_ = 0.0;
    double dt_ = 1.0;
};

/**
 * @brief Fluent, validating constructor for SystemConfig.
 *
 * @code
 * SystemConfig config = SystemConfig::Builder()
 *                         .initial_state({ { "G", 290.0 }, { "X", 0.0 } })
 *                         .parameter("k1", 0.03)
 *                         .time_span(0.0, 182.0)
 *                         .step(2.0)
 *                         .signal("I", insulin)
 *                         .require({ "k1" })
 *                         .build();
 * @endcode
 */
class SystemConfig::Builder {
  public:
    Builder &parameter(const std::string &name, double value);
    Builder &parameters(const std::map<std::string, double> &values);
    Builder &initial_state(StateVector state);
    Builder &time_span(double t0, double t_end);
    Builder &step(double dt);
    Builder &signal(const std::string &name, Signal signal);

    /// Parameters and signals that build() must find, typically those a rule reads.
    Builder &require(const std::vector<std::string> &parameter_names,
                     const std::vector<std::string> &signal_names = {});

    /**
     * @brief Validate and produce the configuration.
     * @throws ConfigurationError on a non-increasing span, non-positive or non-finite step,
     *         empty initial state, missing required parameter/signal, or a signal whose sampled
     *         range does not cover [t0, t_end].
     */
    SystemConfig build() const;

  private:
    SystemConfig config_;
    std::set<std::string> required_parameters_;
    std::set<std::string> required_signals_;
};

} // namespace minimod

#endif // MINIMOD_SYSTEM_CONFIG_HPP
