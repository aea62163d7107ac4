#include "minimod/system_config.hpp"
#include "minimod/errors.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace minimod {

// --- SystemConfig accessors ---

double
SystemConfig::parameter(const std::string &name) const {
    auto it = parameters_.find(name);
    if (it == parameters_.end()) { throw ConfigurationError("Missing parameter value for: " + name); }
    return it->second;
}

const Interpolator &
SystemConfig::signal(const std::string &name) const {
    auto it = signals_.find(name);
    if (it == signals_.end()) { throw ConfigurationError("Missing input signal: " + name); }
    return *it->second;
}

// --- Builder ---

SystemConfig::Builder &
SystemConfig::Builder::parameter(const std::string &name, double value) {
    config_.parameters_[name] = value;
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::parameters(const std::map<std::string, double> &values) {
    for (const auto &pair : values) { config_.parameters_[pair.first] = pair.second; }
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::initial_state(StateVector state) {
    config_.initial_state_ = std::move(state);
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::time_span(double t0, double t_end) {
    config_.t0_ = t0;
    config_.t_end_ = t_end;
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::step(double dt) {
    config_.dt_ = dt;
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::signal(const std::string &name, Signal signal) {
    if (!signal) { throw ConfigurationError("Input signal '" + name + "' is null."); }
    config_.signals_[name] = std::move(signal);
    return *this;
}

SystemConfig::Builder &
SystemConfig::Builder::require(const std::vector<std::string> &parameter_names,
                               const std::vector<std::string> &signal_names) {
    required_parameters_.insert(parameter_names.begin(), parameter_names.end());
    required_signals_.insert(signal_names.begin(), signal_names.end());
    return *this;
}

SystemConfig
SystemConfig::Builder::build() const {
    const SystemConfig &c = config_;

    if (!std::isfinite(c.t0_) || !std::isfinite(c.t_end_)) {
        throw ConfigurationError("Time span bounds must be finite.");
    }
    if (c.t0_ > c.t_end_) {
        std::stringstream ss;
        ss << "Start time " << c.t0_ << " is after end time " << c.t_end_ << ".";
        throw ConfigurationError(ss.str());
    }
    if (!std::isfinite(c.dt_) || c.dt_ <= 0.0) {
        std::stringstream ss;
        ss << "Step size must be positive and finite (got " << c.dt_ << ").";
        throw ConfigurationError(ss.str());
    }
    if (c.initial_state_.empty()) { throw ConfigurationError("Initial state cannot be empty."); }

    for (const auto &name : required_parameters_) {
        if (!c.has_parameter(name)) { throw ConfigurationError("Missing parameter value for: " + name); }
    }
    for (const auto &name : required_signals_) {
        if (!c.has_signal(name)) { throw ConfigurationError("Missing input signal: " + name); }
    }

    for (const auto &pair : c.signals_) {
        const Interpolator &sig = *pair.second;
        if (!sig.fitted()) { throw ConfigurationError("Input signal '" + pair.first + "' has not been fitted."); }
        if (sig.t_min() > c.t0_ || sig.t_max() < c.t_end_) {
            std::stringstream ss;
            ss << "Input signal '" << pair.first << "' covers [" << sig.t_min() << ", " << sig.t_max()
               << "] but the simulation spans [" << c.t0_ << ", " << c.t_end_ << "].";
            throw ConfigurationError(ss.str());
        }
    }
    return c;
}

} // namespace minimod
