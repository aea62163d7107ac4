#ifndef MINIMOD_DIAGNOSTICS_HPP
#define MINIMOD_DIAGNOSTICS_HPP

#include <cstddef>
#include <limits>
#include <string>

namespace minimod {

/**
 * @brief Metadata describing whether and how a solver or optimizer terminated.
 *
 * For simulations, num_iterations counts accepted integrator steps and num_evaluations counts
 * slope-rule calls. For fits, they count optimizer iterations and objective evaluations, and
 * residual_norm holds the final ||r||_2.
 */
struct Diagnostics {
    bool success = false;
    std::string message;
    size_t num_iterations = 0;
    size_t num_evaluations = 0;
    double residual_norm = std::numeric_limits<double>::quiet_NaN();
};

} // namespace minimod

#endif // MINIMOD_DIAGNOSTICS_HPP
