#include "minimod/glucose_model.hpp"
#include "minimod/errors.hpp"

namespace minimod {
namespace glucose {

StateVector
slope(const StateVector &state, double t, const SystemConfig &config) {
    double const G = state.get(kGlucose);
    double const X = state.get(kInsulinEffect);

    double const k1 = config.parameter(kK1);
    double const k2 = config.parameter(kK2);
    double const k3 = config.parameter(kK3);
    double const Gb = config.parameter(kGlucoseBaseline);
    double const Ib = config.parameter(kInsulinBaseline);
    double const I = config.signal_value(kInsulinSignal, t);

    double const dGdt = -k1 * (G - Gb) - X * G;
    double const dXdt = k3 * (I - Ib) - k2 * X;
    return state.with_values({ dGdt, dXdt });
}

StateVector
update(const StateVector &state, double t, const SystemConfig &config) {
    StateVector const rates = slope(state, t, config);
    double const dt = config.dt();

    std::vector<double> next = state.values();
    for (size_t i = 0; i < next.size(); ++i) { next[i] += rates[i] * dt; }
    return state.with_values(std::move(next));
}

ModelParameters
ModelParameters::from_vector(const ParameterVector &params) {
    if (params.size() != 4) {
        throw ConfigurationError("Glucose model expects 4 parameters [G0, k1, k2, k3], got " +
                                 std::to_string(params.size()) + ".");
    }
    ModelParameters p;
    p.G0 = params[0];
    p.k1 = params[1];
    p.k2 = params[2];
    p.k3 = params[3];
    return p;
}

GlucoseData
GlucoseData::from_table(const SignalTable &table, InterpolationKind kind) {
    if (!table.has_column(kGlucoseColumn) || !table.has_column(kInsulinColumn)) {
        throw ConfigurationError("Glucose data needs '" + kGlucoseColumn + "' and '" + kInsulinColumn + "' columns.");
    }
    GlucoseData data;
    data.times = table.index();
    data.glucose = table.column(kGlucoseColumn);
    data.insulin = table.interpolate(kInsulinColumn, kind);
    data.glucose_baseline = table.first(kGlucoseColumn);
    data.insulin_baseline = table.first(kInsulinColumn);
    return data;
}

SystemConfig
make_config(const ModelParameters &params, const GlucoseData &data, double dt) {
    if (data.times.empty() || !data.insulin) { throw ConfigurationError("Glucose data is empty."); }
    return SystemConfig::Builder()
      .initial_state(StateVector({ kGlucose, kInsulinEffect }, { params.G0, 0.0 }))
      .parameter(kK1, params.k1)
      .parameter(kK2, params.k2)
      .parameter(kK3, params.k3)
      .parameter(kGlucoseBaseline, data.glucose_baseline)
      .parameter(kInsulinBaseline, data.insulin_baseline)
      .signal(kInsulinSignal, data.insulin)
      .time_span(data.times.front(), data.times.back())
      .step(dt)
      .require({ kK1, kK2, kK3, kGlucoseBaseline, kInsulinBaseline }, { kInsulinSignal })
      .build();
}

ObservedData
observed_glucose(const GlucoseData &data) {
    ObservedData observed;
    observed.times = data.times;
    observed.measurements[kGlucose] = data.glucose;
    return observed;
}

ObjectiveFunction
make_objective(const GlucoseData &data, IntegratorOptions options) {
    auto factory = [data](const ParameterVector &params) {
        return make_config(ModelParameters::from_vector(params), data);
    };
    return ObjectiveFunction(factory, slope, observed_glucose(data), options);
}

} // namespace glucose
} // namespace minimod
