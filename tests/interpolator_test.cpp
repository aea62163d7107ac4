#include "minimod/errors.hpp"
#include "minimod/interpolation/linear_interpolator.hpp"
#include "minimod/interpolation/pchip_interpolator.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

using minimod::ConfigurationError;
using minimod::Interpolator;
using minimod::LinearInterpolator;
using minimod::PchipInterpolator;

TEST(LinearInterpolatorTest, ReproducesSamplesAndBlends) {
    LinearInterpolator interp({ 0.0, 2.0, 4.0 }, { 11.0, 26.0, 130.0 });
    EXPECT_TRUE(interp.fitted());
    EXPECT_DOUBLE_EQ(interp.t_min(), 0.0);
    EXPECT_DOUBLE_EQ(interp.t_max(), 4.0);

    EXPECT_DOUBLE_EQ(interp.evaluate(0.0), 11.0);
    EXPECT_DOUBLE_EQ(interp.evaluate(2.0), 26.0);
    EXPECT_DOUBLE_EQ(interp.evaluate(4.0), 130.0);
    EXPECT_DOUBLE_EQ(interp(1.0), 18.5);
    EXPECT_DOUBLE_EQ(interp.evaluate(3.0), 78.0);

    EXPECT_DOUBLE_EQ(interp.derivative(1.0), 7.5);
    EXPECT_DOUBLE_EQ(interp.derivative(3.5), 52.0);
}

TEST(LinearInterpolatorTest, OutsideRangeThrows) {
    LinearInterpolator interp({ 0.0, 1.0 }, { 0.0, 1.0 });
    EXPECT_THROW(interp.evaluate(-0.5), std::out_of_range);
    EXPECT_THROW(interp.evaluate(1.5), std::out_of_range);
    // Rounding noise at the end points is tolerated
    EXPECT_NO_THROW(interp.evaluate(1.0 + 1e-15));
}

TEST(LinearInterpolatorTest, UnfittedThrows) {
    LinearInterpolator interp;
    EXPECT_FALSE(interp.fitted());
    EXPECT_THROW(interp.evaluate(0.0), std::runtime_error);
}

TEST(LinearInterpolatorTest, RejectsBadSamples) {
    LinearInterpolator interp;
    EXPECT_THROW(interp.fit({ 0.0 }, { 1.0 }), ConfigurationError);
    EXPECT_THROW(interp.fit({ 0.0, 1.0 }, { 1.0 }), ConfigurationError);
    EXPECT_THROW(interp.fit({ 1.0, 0.0 }, { 1.0, 2.0 }), ConfigurationError);
    EXPECT_THROW(interp.fit({ 0.0, 0.0 }, { 1.0, 2.0 }), ConfigurationError);
    EXPECT_THROW(interp.fit({ 0.0, 1.0 }, { 1.0, std::numeric_limits<double>::quiet_NaN() }), ConfigurationError);
    EXPECT_FALSE(interp.fitted());
}

TEST(PchipInterpolatorTest, InterpolatesMonotoneData) {
    std::vector<double> const t = { 0.0, 1.0, 2.0, 3.0, 4.0 };
    std::vector<double> const v = { 0.0, 1.0, 4.0, 9.0, 16.0 };
    PchipInterpolator interp(t, v);

    for (size_t i = 0; i < t.size(); ++i) { EXPECT_NEAR(interp.evaluate(t[i]), v[i], 1e-12); }

    // Shape preserving: monotone data gives monotone values and non-negative slopes
    double prev = interp.evaluate(0.0);
    for (double x = 0.1; x <= 4.0; x += 0.1) {
        double const y = interp.evaluate(x);
        EXPECT_GE(y, prev - 1e-12) << "at t = " << x;
        EXPECT_GE(interp.derivative(x), -1e-12) << "at t = " << x;
        prev = y;
    }
    EXPECT_THROW(interp.evaluate(4.5), std::out_of_range);
}

TEST(PchipInterpolatorTest, NeedsFourSamples) {
    PchipInterpolator interp;
    EXPECT_THROW(interp.fit({ 0.0, 1.0, 2.0 }, { 0.0, 1.0, 2.0 }), ConfigurationError);
}

TEST(InterpolatorTest, UsableThroughBasePointer) {
    std::vector<std::unique_ptr<Interpolator>> interps;
    interps.push_back(std::make_unique<LinearInterpolator>(std::vector<double>{ 0.0, 1.0, 2.0, 3.0 },
                                                           std::vector<double>{ 2.0, 2.0, 2.0, 2.0 }));
    interps.push_back(std::make_unique<PchipInterpolator>(std::vector<double>{ 0.0, 1.0, 2.0, 3.0 },
                                                          std::vector<double>{ 2.0, 2.0, 2.0, 2.0 }));
    for (const auto &interp : interps) {
        EXPECT_NEAR(interp->evaluate(1.7), 2.0, 1e-12);
        EXPECT_NEAR(interp->derivative(1.7), 0.0, 1e-12);
    }
}
