#ifndef MINIMOD_INTERPOLATION_INTERPOLATOR_HPP
#define MINIMOD_INTERPOLATION_INTERPOLATOR_HPP

#include <stdexcept>
#include <vector>

namespace minimod {

/**
 * @brief Abstract base class for a continuous signal reconstructed from discrete samples.
 *
 * Used for time-varying model inputs such as the measured insulin curve. Valid only inside
 * the sampled range; evaluation outside it throws instead of extrapolating.
 */
class Interpolator {
  public:
    virtual ~Interpolator() = default;

    /**
     * @brief Fit the interpolator to the given samples.
     *
     * @param times   Strictly increasing sample times.
     * @param values  Sample values, one per time.
     * @throws ConfigurationError if the vectors differ in size, hold too few points, or
     *         the times are not strictly increasing.
     */
    virtual void fit(const std::vector<double> &times, const std::vector<double> &values) = 0;

    /**
     * @brief Evaluate the interpolated signal at time t.
     *
     * @throws std::runtime_error if the model has not been fitted.
     * @throws std::out_of_range if t lies outside [t_min(), t_max()].
     */
    virtual double evaluate(double t) const = 0;

    /**
     * @brief First time derivative of the interpolated signal at time t.
     *
     * @throws std::runtime_error if the model has not been fitted.
     * @throws std::out_of_range if t lies outside [t_min(), t_max()].
     */
    virtual double derivative(double t) const = 0;

    double operator()(double t) const { return evaluate(t); }

    double t_min() const { return t_min_; }
    double t_max() const { return t_max_; }
    bool fitted() const { return fitted_; }

  protected:
    /// Validates sample vectors shared by all implementations and records the range.
    void check_samples(const std::vector<double> &times, const std::vector<double> &values, size_t min_points);

    /// Throws if unfitted or t is outside the sampled range (with a small rounding allowance).
    void check_domain(double t, const char *who) const;

    bool fitted_ = false; // Set by fit() on success.
    double t_min_ = 0.0;
    double t_max_ = 0.0;
};

} // namespace minimod

#endif // MINIMOD_INTERPOLATION_INTERPOLATOR_HPP
