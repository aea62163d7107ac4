#include "minimod/interpolation/linear_interpolator.hpp"

#include <algorithm>

namespace minimod {

void
LinearInterpolator::fit(const std::vector<double> &times, const std::vector<double> &values) {
    check_samples(times, values, 2);
    times_ = times;
    values_ = values;
    fitted_ = true;
}

size_t
LinearInterpolator::segment(double t) const {
    // Index i such that times_[i] <= t < times_[i+1], clamped to the last segment.
    auto it = std::upper_bound(times_.begin(), times_.end(), t);
    size_t idx = it == times_.begin() ? 0 : static_cast<size_t>(std::distance(times_.begin(), it)) - 1;
    return std::min(idx, times_.size() - 2);
}

double
LinearInterpolator::evaluate(double t) const {
    check_domain(t, "LinearInterpolator::evaluate");
    size_t const i = segment(t);
    double const w = (t - times_[i]) / (times_[i + 1] - times_[i]);
    return values_[i] + w * (values_[i + 1] - values_[i]);
}

double
LinearInterpolator::derivative(double t) const {
    check_domain(t, "LinearInterpolator::derivative");
    size_t const i = segment(t);
    return (values_[i + 1] - values_[i]) / (times_[i + 1] - times_[i]);
}

} // namespace minimod
