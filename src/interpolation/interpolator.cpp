#include "minimod/interpolation/interpolator.hpp"
#include "minimod/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace minimod {

void
Interpolator::check_samples(const std::vector<double> &times, const std::vector<double> &values, size_t min_points) {
    if (times.size() != values.size()) {
        throw ConfigurationError("Interpolator time and value vectors must have the same size.");
    }
    if (times.size() < min_points) {
        throw ConfigurationError("Interpolator needs at least " + std::to_string(min_points) + " samples, got " +
                                 std::to_string(times.size()) + ".");
    }
    for (size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i]) || !std::isfinite(values[i])) {
            throw ConfigurationError("Interpolator samples must be finite (index " + std::to_string(i) + ").");
        }
        if (i > 0 && !(times[i] > times[i - 1])) {
            throw ConfigurationError("Interpolator sample times must be strictly increasing (index " +
                                     std::to_string(i) + ").");
        }
    }
    t_min_ = times.front();
    t_max_ = times.back();
}

void
Interpolator::check_domain(double t, const char *who) const {
    if (!fitted_) { throw std::runtime_error(std::string(who) + " called before fit."); }
    // Allow for rounding in integrator stage times that land on the end points.
    double const slack = 1e-12 * std::max(1.0, std::max(std::abs(t_min_), std::abs(t_max_)));
    if (t < t_min_ - slack || t > t_max_ + slack) {
        std::stringstream ss;
        ss << who << ": t = " << t << " is outside the sampled range [" << t_min_ << ", " << t_max_ << "].";
        throw std::out_of_range(ss.str());
    }
}

} // namespace minimod
