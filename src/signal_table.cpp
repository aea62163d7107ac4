#include "minimod/signal_table.hpp"
#include "minimod/errors.hpp"
#include "minimod/interpolation/linear_interpolator.hpp"
#include "minimod/interpolation/pchip_interpolator.hpp"

#include <fstream>
#include <istream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace minimod {

namespace {

std::string
trim(const std::string &s) {
    const char *const ws = " \t\r\n";
    size_t const first = s.find_first_not_of(ws);
    if (first == std::string::npos) { return ""; }
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::vector<std::string>
split_fields(const std::string &line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) { fields.push_back(trim(field)); }
    // getline drops an empty last field
    if (!line.empty() && line.back() == ',') { fields.emplace_back(); }
    return fields;
}

} // namespace

SignalTable::SignalTable(std::string index_name,
                         std::vector<double> index,
                         std::map<std::string, std::vector<double>> columns)
  : index_name_(std::move(index_name))
  , index_(std::move(index))
  , columns_(std::move(columns)) {
    if (index_.empty()) { throw ConfigurationError("SignalTable index cannot be empty."); }
    for (size_t i = 1; i < index_.size(); ++i) {
        if (!(index_[i] > index_[i - 1])) {
            throw ConfigurationError("SignalTable index '" + index_name_ + "' must be strictly increasing (row " +
                                     std::to_string(i) + ").");
        }
    }
    for (const auto &pair : columns_) {
        if (pair.second.size() != index_.size()) {
            throw ConfigurationError("SignalTable column '" + pair.first + "' has " +
                                     std::to_string(pair.second.size()) + " rows, expected " +
                                     std::to_string(index_.size()) + ".");
        }
    }
}

SignalTable
SignalTable::parse_csv(std::istream &in) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) { break; }
    }
    if (line.empty()) { throw ConfigurationError("CSV input has no header row."); }

    std::vector<std::string> const header = split_fields(line);
    std::set<std::string> seen;
    for (const auto &name : header) {
        if (name.empty()) { throw ConfigurationError("CSV header contains an empty column name."); }
        if (!seen.insert(name).second) { throw ConfigurationError("CSV header repeats column '" + name + "'."); }
    }
    if (header.size() < 2) { throw ConfigurationError("CSV needs an index column and at least one signal column."); }

    std::vector<std::vector<double>> cols(header.size());
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty()) { continue; }

        std::vector<std::string> const cells = split_fields(line);
        if (cells.size() != header.size()) {
            throw ConfigurationError("CSV line " + std::to_string(line_no) + " has " + std::to_string(cells.size()) +
                                     " cells, expected " + std::to_string(header.size()) + ".");
        }
        for (size_t c = 0; c < cells.size(); ++c) {
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(cells[c], &consumed);
            } catch (const std::logic_error &) {
                consumed = 0; // stod throws invalid_argument or out_of_range
            }
            if (cells[c].empty() || consumed != cells[c].size()) {
                throw ConfigurationError("CSV line " + std::to_string(line_no) + ", column '" + header[c] +
                                         "': '" + cells[c] + "' is not a number.");
            }
            cols[c].push_back(value);
        }
    }

    std::map<std::string, std::vector<double>> columns;
    for (size_t c = 1; c < header.size(); ++c) { columns[header[c]] = std::move(cols[c]); }
    return SignalTable(header[0], std::move(cols[0]), std::move(columns));
}

SignalTable
SignalTable::read_csv(const std::string &path) {
    std::ifstream file(path);
    if (!file) { throw std::runtime_error("Could not open signal table '" + path + "'."); }
    return parse_csv(file);
}

std::vector<std::string>
SignalTable::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto &pair : columns_) { names.push_back(pair.first); }
    return names;
}

const std::vector<double> &
SignalTable::column(const std::string &name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) { throw std::out_of_range("SignalTable has no column named '" + name + "'."); }
    return it->second;
}

std::shared_ptr<const Interpolator>
SignalTable::interpolate(const std::string &name, InterpolationKind kind) const {
    const std::vector<double> &values = column(name);
    switch (kind) {
        case InterpolationKind::Pchip: return std::make_shared<const PchipInterpolator>(index_, values);
        case InterpolationKind::Linear: break;
    }
    return std::make_shared<const LinearInterpolator>(index_, values);
}

} // namespace minimod
