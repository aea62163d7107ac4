#include "minimod/interpolation/pchip_interpolator.hpp"

#include <algorithm>
#include <utility>

namespace minimod {

void
PchipInterpolator::fit(const std::vector<double> &times, const std::vector<double> &values) {
    check_samples(times, values, 4);
    // pchip takes ownership of its abscissas and ordinates
    std::vector<double> x = times;
    std::vector<double> y = values;
    spline_ = std::make_shared<const Spline>(std::move(x), std::move(y));
    fitted_ = true;
}

double
PchipInterpolator::evaluate(double t) const {
    check_domain(t, "PchipInterpolator::evaluate");
    return (*spline_)(std::min(std::max(t, t_min_), t_max_));
}

double
PchipInterpolator::derivative(double t) const {
    check_domain(t, "PchipInterpolator::derivative");
    return spline_->prime(std::min(std::max(t, t_min_), t_max_));
}

} // namespace minimod
