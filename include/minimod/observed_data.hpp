#ifndef MINIMOD_OBSERVED_DATA_HPP
#define MINIMOD_OBSERVED_DATA_HPP

#include <map>
#include <string>
#include <vector>

namespace minimod {

/**
 * @brief Structure to hold observed time series data.
 */
struct ObservedData {
    std::vector<double> times; ///< Strictly increasing observation times.

    /**
     * @brief Map from state field name to its time series measurements.
     * measurements["G"][i] is the measurement of "G" at times[i].
     */
    std::map<std::string, std::vector<double>> measurements;

    /// Number of observed points per field.
    size_t size() const { return times.size(); }

    /**
     * @brief Check the structural invariants.
     * @throws ConfigurationError if times are empty or not strictly increasing, no field is
     *         observed, or a measurement vector does not match the times vector.
     */
    void validate() const;
};

} // namespace minimod

#endif // MINIMOD_OBSERVED_DATA_HPP
