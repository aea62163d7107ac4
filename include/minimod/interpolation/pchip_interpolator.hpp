#ifndef MINIMOD_INTERPOLATION_PCHIP_INTERPOLATOR_HPP
#define MINIMOD_INTERPOLATION_PCHIP_INTERPOLATOR_HPP

#include "minimod/interpolation/interpolator.hpp"

#include <math.h> // boost 1.74 pchip.hpp calls unqualified ::isnan
#include <boost/math/interpolators/pchip.hpp>
#include <memory>
#include <vector>

namespace minimod {

/**
 * @brief Monotone piecewise cubic Hermite interpolation (Fritsch-Carlson), via Boost.Math.
 *
 * Unlike a cubic spline it never overshoots between samples, so a non-negative signal stays
 * non-negative. Needs at least four samples.
 */
class PchipInterpolator : public Interpolator {
  public:
    PchipInterpolator() = default;
    PchipInterpolator(const std::vector<double> &times, const std::vector<double> &values) { fit(times, values); }

    void fit(const std::vector<double> &times, const std::vector<double> &values) override;
    double evaluate(double t) const override;
    double derivative(double t) const override;

  private:
    using Spline = boost::math::interpolators::pchip<std::vector<double>>;
    std::shared_ptr<const Spline> spline_;
};

} // namespace minimod

#endif // MINIMOD_INTERPOLATION_PCHIP_INTERPOLATOR_HPP
