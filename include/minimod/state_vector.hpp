#ifndef MINIMOD_STATE_VECTOR_HPP
#define MINIMOD_STATE_VECTOR_HPP

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace minimod {

/**
 * @brief Named, fixed-arity tuple of physical quantities at one instant.
 *
 * Field order is the simulation variable order. A StateVector is never modified after
 * construction; stepping produces a new value (see with_values()).
 */
class StateVector {
  public:
    StateVector() = default;

    /**
     * @brief Construct from parallel name and value lists.
     * @throws ConfigurationError if the sizes differ or a name is empty or repeated.
     */
    StateVector(std::vector<std::string> names, std::vector<double> values);

    /** @brief Construct from `{ {"G", 290.0}, {"X", 0.0} }`. */
    StateVector(std::initializer_list<std::pair<std::string, double>> fields);

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::vector<std::string> &names() const { return names_; }
    const std::vector<double> &values() const { return values_; }

    double operator[](size_t i) const { return values_[i]; }

    /**
     * @brief Value of the named field.
     * @throws std::out_of_range if the field does not exist.
     */
    double get(const std::string &name) const;

    bool has(const std::string &name) const;

    /** @brief Index of the named field, or size() if absent. */
    size_t index_of(const std::string &name) const;

    /**
     * @brief New StateVector with the same fields and the given values.
     * @throws ConfigurationError on arity mismatch.
     */
    StateVector with_values(std::vector<double> values) const;

    /** @brief True if both vectors have identical field names in identical order. */
    bool same_fields(const StateVector &other) const { return names_ == other.names_; }

    bool operator==(const StateVector &other) const {
        return names_ == other.names_ && values_ == other.values_;
    }
    bool operator!=(const StateVector &other) const { return !(*this == other); }

  private:
    std::vector<std::string> names_;
    std::vector<double> values_;
};

std::ostream &
operator<<(std::ostream &os, const StateVector &state);

} // namespace minimod

#endif // MINIMOD_STATE_VECTOR_HPP
