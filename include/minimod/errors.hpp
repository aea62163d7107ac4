#ifndef MINIMOD_ERRORS_HPP
#define MINIMOD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace minimod {

/**
 * @brief Raised when a configuration, input table or simulation request violates its invariants.
 *
 * Thrown at the boundary, before any simulation starts. Never used for numerical
 * non-convergence, which is reported through Diagnostics instead.
 */
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace minimod

#endif // MINIMOD_ERRORS_HPP
