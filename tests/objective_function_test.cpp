#include "minimod/errors.hpp"
#include "minimod/glucose_model.hpp"
#include "minimod/objective_function.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

using minimod::ConfigurationError;
using minimod::IntegratorOptions;
using minimod::ObjectiveFunction;
using minimod::ObservedData;
using minimod::ParameterVector;
using minimod::Residuals;
using minimod::test_support::decay_objective;
using minimod::test_support::decay_observations;

TEST(ObjectiveFunctionTest, ResidualIndexMatchesObservedTimes) {
    minimod::glucose::GlucoseData const data = minimod::test_support::reference_data();
    ObjectiveFunction const objective = minimod::glucose::make_objective(data);

    Residuals const r = objective(minimod::glucose::ModelParameters().to_vector());
    ASSERT_TRUE(r.simulation.success) << r.simulation.message;
    EXPECT_EQ(r.size(), data.times.size());
    EXPECT_EQ(objective.num_residuals(), data.times.size());
    EXPECT_EQ(r.times, data.times);
    for (const auto &field : r.fields) { EXPECT_EQ(field, "G"); }

    // At t0 the simulation starts from G0, so the first residual is G0 - glucose(0)
    EXPECT_NEAR(r.values.front(), 290.0 - 92.0, 1e-9);
    for (double v : r.values) { EXPECT_TRUE(std::isfinite(v)); }
}

TEST(ObjectiveFunctionTest, ResidualIsSimulatedMinusObserved) {
    ObservedData data = decay_observations(1.0, 0.5, { 0.0, 1.0, 2.0, 4.0 });
    data.measurements["x"][2] += 0.25; // observed above the model

    ObjectiveFunction const objective = decay_objective(data);
    Residuals const r = objective({ 1.0, 0.5 });
    ASSERT_EQ(r.size(), 4u);
    EXPECT_NEAR(r.values[0], 0.0, 1e-9);
    EXPECT_NEAR(r.values[1], 0.0, 1e-8);
    EXPECT_NEAR(r.values[2], -0.25, 1e-8);
    EXPECT_NEAR(r.squared_norm(), 0.0625, 1e-7);
}

TEST(ObjectiveFunctionTest, SimulateUsesObservedTimeGrid) {
    ObservedData const data = decay_observations(2.0, 0.1, { 0.5, 1.5, 3.0 });
    ObjectiveFunction const objective = decay_objective(data);

    minimod::SimulationResult const sim = objective.simulate({ 2.0, 0.1 });
    EXPECT_EQ(sim.trajectory.times(), data.times);
}

TEST(ObjectiveFunctionTest, FieldsConcatenateInNameOrder) {
    // Two observed fields of a two-state system, residuals laid out field by field
    auto factory = [](const ParameterVector &p) {
        return minimod::SystemConfig::Builder()
          .initial_state(minimod::StateVector({ "b", "a" }, { p[0], p[1] }))
          .time_span(0.0, 1.0)
          .build();
    };
    auto still = [](const minimod::StateVector &s, double, const minimod::SystemConfig &) {
        return s.with_values({ 0.0, 0.0 });
    };
    ObservedData data;
    data.times = { 0.0, 1.0 };
    data.measurements["a"] = { 0.0, 0.0 };
    data.measurements["b"] = { 0.0, 0.0 };

    ObjectiveFunction const objective(factory, still, data);
    Residuals const r = objective({ 5.0, 7.0 });
    ASSERT_EQ(r.size(), 4u);
    EXPECT_EQ(r.fields, (std::vector<std::string>{ "a", "a", "b", "b" }));
    EXPECT_EQ(r.times, (std::vector<double>{ 0.0, 1.0, 0.0, 1.0 }));
    EXPECT_EQ(r.values, (std::vector<double>{ 7.0, 7.0, 5.0, 5.0 }));
}

TEST(ObjectiveFunctionTest, FailedSimulationYieldsNaNResiduals) {
    ObservedData const data = decay_observations(1.0, 0.5, { 0.0, 5.0 });
    IntegratorOptions options;
    options.max_steps = 2;
    auto factory = [](const ParameterVector &p) { return minimod::test_support::decay_config(p[0], p[1]); };
    ObjectiveFunction const objective(factory, minimod::test_support::decay_slope, data, options);

    Residuals const r = objective({ 1.0, 0.5 });
    EXPECT_FALSE(r.simulation.success);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_TRUE(std::isfinite(r.values[0]));
    EXPECT_TRUE(std::isnan(r.values[1]));
    EXPECT_TRUE(std::isnan(r.squared_norm()));
}

TEST(ObjectiveFunctionTest, RejectsInvalidSetup) {
    ObservedData const good = decay_observations(1.0, 0.5, { 0.0, 1.0 });

    ObservedData unsorted = good;
    unsorted.times = { 1.0, 0.0 };
    EXPECT_THROW(decay_objective(unsorted), ConfigurationError);

    ObservedData ragged = good;
    ragged.measurements["x"].push_back(1.0);
    EXPECT_THROW(decay_objective(ragged), ConfigurationError);

    ObservedData empty;
    EXPECT_THROW(decay_objective(empty), ConfigurationError);

    ObservedData unknown_field = good;
    unknown_field.measurements["y"] = { 0.0, 0.0 };
    ObjectiveFunction const objective = decay_objective(unknown_field);
    EXPECT_THROW(objective({ 1.0, 0.5 }), ConfigurationError);

    EXPECT_THROW((ObjectiveFunction{ minimod::ConfigFactory{}, minimod::test_support::decay_slope, good }),
                 ConfigurationError);
}

TEST(ObjectiveFunctionTest, ObservedTimesOutsideSpanRejected) {
    ObservedData const data = decay_observations(1.0, 0.5, { 0.0, 6.0 });
    ObjectiveFunction const objective = decay_objective(data, 5.0);
    EXPECT_THROW(objective({ 1.0, 0.5 }), ConfigurationError);
}

TEST(ObjectiveFunctionTest, ConfigErrorsFromFactoryPropagate) {
    ObjectiveFunction const objective = minimod::glucose::make_objective(minimod::test_support::reference_data());
    EXPECT_THROW(objective({ 290.0, 0.03 }), ConfigurationError);
}
