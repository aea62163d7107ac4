#ifndef MINIMOD_INTERPOLATION_LINEAR_INTERPOLATOR_HPP
#define MINIMOD_INTERPOLATION_LINEAR_INTERPOLATOR_HPP

#include "minimod/interpolation/interpolator.hpp"

#include <vector>

namespace minimod {

/**
 * @brief Piecewise-linear interpolation between samples.
 *
 * The derivative is the slope of the containing segment; at an interior sample point the
 * slope of the segment to its right is used.
 */
class LinearInterpolator : public Interpolator {
  public:
    LinearInterpolator() = default;
    LinearInterpolator(const std::vector<double> &times, const std::vector<double> &values) { fit(times, values); }

    void fit(const std::vector<double> &times, const std::vector<double> &values) override;
    double evaluate(double t) const override;
    double derivative(double t) const override;

  private:
    std::vector<double> times_;
    std::vector<double> values_;

    size_t segment(double t) const;
};

} // namespace minimod

#endif // MINIMOD_INTERPOLATION_LINEAR_INTERPOLATOR_HPP
