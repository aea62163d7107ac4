#include "minimod/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace minimod {

void
Trajectory::append(double t, StateVector state) {
    if (times_.empty()) {
        names_ = state.names();
    } else {
        if (!(t > times_.back())) {
            std::stringstream ss;
            ss << "Trajectory times must be strictly increasing (got " << t << " after " << times_.back() << ").";
            throw std::logic_error(ss.str());
        }
        if (state.names() != names_) { throw std::logic_error("Trajectory rows must share the same fields."); }
    }
    times_.push_back(t);
    states_.push_back(std::move(state));
}

std::vector<double>
Trajectory::column(const std::string &name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) { throw std::out_of_range("Trajectory has no column named '" + name + "'."); }
    size_t const idx = static_cast<size_t>(std::distance(names_.begin(), it));

    std::vector<double> values;
    values.reserve(states_.size());
    for (const auto &row : states_) { values.push_back(row[idx]); }
    return values;
}

size_t
Trajectory::find_time(double t, double tol) const {
    // times_ is sorted, so binary search for the first candidate
    auto it = std::lower_bound(times_.begin(), times_.end(), t - tol);
    if (it != times_.end() && std::abs(*it - t) <= tol) {
        return static_cast<size_t>(std::distance(times_.begin(), it));
    }
    return times_.size();
}

double
Trajectory::value_at(double t, const std::string &name, double tol) const {
    size_t const idx = find_time(t, tol);
    if (idx >= times_.size()) {
        std::stringstream ss;
        ss << "Trajectory has no row at t = " << t << ".";
        throw std::out_of_range(ss.str());
    }
    return states_[idx].get(name);
}

Trajectory::ResultsType
Trajectory::to_results() const {
    ResultsType results;
    results["time"] = times_;
    for (const auto &name : names_) { results[name] = column(name); }
    return results;
}

namespace {

template<typename Metric>
double
max_difference(const Trajectory &a, const Trajectory &b, const std::string &field, double tol, Metric metric) {
    double worst = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        size_t const j = b.find_time(a.time(i), tol);
        if (j >= b.size()) { continue; }
        worst = std::max(worst, metric(a.state(i).get(field), b.state(j).get(field)));
    }
    return worst;
}

} // namespace

double
max_relative_difference(const Trajectory &a, const Trajectory &b, const std::string &field, double tol) {
    return max_difference(a, b, field, tol, [](double x, double ref) { return std::abs(x - ref) / std::abs(ref); });
}

double
max_absolute_difference(const Trajectory &a, const Trajectory &b, const std::string &field, double tol) {
    return max_difference(a, b, field, tol, [](double x, double ref) { return std::abs(x - ref); });
}

} // namespace minimod
