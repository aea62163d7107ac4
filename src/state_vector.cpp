#include "minimod/state_vector.hpp"
#include "minimod/errors.hpp"

#include <algorithm>
#include <ostream>
#include <set>
#include <stdexcept>

namespace minimod {

StateVector::StateVector(std::vector<std::string> names, std::vector<double> values)
  : names_(std::move(names))
  , values_(std::move(values)) {
    if (names_.size() != values_.size()) {
        throw ConfigurationError("StateVector needs one value per field name (" + std::to_string(names_.size()) +
                                 " names, " + std::to_string(values_.size()) + " values).");
    }
    std::set<std::string> seen;
    for (const auto &name : names_) {
        if (name.empty()) { throw ConfigurationError("StateVector field names cannot be empty."); }
        if (!seen.insert(name).second) {
            throw ConfigurationError("StateVector field '" + name + "' appears more than once.");
        }
    }
}

StateVector::StateVector(std::initializer_list<std::pair<std::string, double>> fields) {
    std::vector<std::string> names;
    std::vector<double> values;
    names.reserve(fields.size());
    values.reserve(fields.size());
    for (const auto &field : fields) {
        names.push_back(field.first);
        values.push_back(field.second);
    }
    *this = StateVector(std::move(names), std::move(values));
}

size_t
StateVector::index_of(const std::string &name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    return static_cast<size_t>(std::distance(names_.begin(), it));
}

bool
StateVector::has(const std::string &name) const {
    return index_of(name) < names_.size();
}

double
StateVector::get(const std::string &name) const {
    size_t const idx = index_of(name);
    if (idx >= names_.size()) { throw std::out_of_range("StateVector has no field named '" + name + "'."); }
    return values_[idx];
}

StateVector
StateVector::with_values(std::vector<double> values) const {
    if (values.size() != names_.size()) {
        throw ConfigurationError("StateVector::with_values expected " + std::to_string(names_.size()) +
                                 " values, got " + std::to_string(values.size()) + ".");
    }
    StateVector next;
    next.names_ = names_;
    next.values_ = std::move(values);
    return next;
}

std::ostream &
operator<<(std::ostream &os, const StateVector &state) {
    os << "{";
    for (size_t i = 0; i < state.size(); ++i) {
        if (i > 0) { os << ", "; }
        os << state.names()[i] << "=" << state[i];
    }
    os << "}";
    return os;
}

} // namespace minimod
