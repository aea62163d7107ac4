#ifndef MINIMOD_TRAJECTORY_HPP
#define MINIMOD_TRAJECTORY_HPP

#include "minimod/state_vector.hpp"

#include <map>
#include <string>
#include <vector>

namespace minimod {

/**
 * @brief Time-indexed sequence of StateVector rows produced by one simulation run.
 *
 * Timestamps are strictly increasing and every row shares the field names of the first row.
 * Simulators build it with append(); callers only read it.
 */
class Trajectory {
  public:
    /// Column map keyed by field name, plus a "time" column.
    using ResultsType = std::map<std::string, std::vector<double>>;

    Trajectory() = default;

    /**
     * @brief Append a row.
     * @throws std::logic_error if t does not increase or the fields differ from earlier rows.
     */
    void append(double t, StateVector state);

    size_t size() const { return times_.size(); }
    bool empty() const { return times_.empty(); }

    const std::vector<double> &times() const { return times_; }
    const std::vector<StateVector> &states() const { return states_; }
    const std::vector<std::string> &field_names() const { return names_; }

    double time(size_t i) const { return times_.at(i); }
    const StateVector &state(size_t i) const { return states_.at(i); }
    const StateVector &back() const { return states_.back(); }

    /**
     * @brief All values of one field, in time order.
     * @throws std::out_of_range if the field does not exist.
     */
    std::vector<double> column(const std::string &name) const;

    /**
     * @brief Row index whose timestamp equals t within tol, or size() if none.
     */
    size_t find_time(double t, double tol = 1e-9) const;

    /**
     * @brief Value of a field at an exactly matching timestamp.
     * @throws std::out_of_range if no row has that time or the field does not exist.
     */
    double value_at(double t, const std::string &name, double tol = 1e-9) const;

    /// Columns in the "time" + field-name layout used by plotting and comparison code.
    ResultsType to_results() const;

  private:
    std::vector<std::string> names_;
    std::vector<double> times_;
    std::vector<StateVector> states_;
};

/**
 * @brief Largest |a - b| / |b| for one field over the timestamps both trajectories share.
 *
 * Used to cross-check the discrete and continuous simulators. Returns 0 if there are no
 * shared timestamps.
 */
double
max_relative_difference(const Trajectory &a, const Trajectory &b, const std::string &field, double tol = 1e-9);

/// Same as max_relative_difference() but absolute: largest |a - b|.
double
max_absolute_difference(const Trajectory &a, const Trajectory &b, const std::string &field, double tol = 1e-9);

} // namespace minimod

#endif // MINIMOD_TRAJECTORY_HPP
