#ifndef MINIMOD_SIGNAL_TABLE_HPP
#define MINIMOD_SIGNAL_TABLE_HPP

#include "minimod/interpolation/interpolator.hpp"

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace minimod {

enum class InterpolationKind {
    Linear,
    Pchip,
};

/**
 * @brief Time-indexed table of measured signals, e.g. glucose and insulin samples.
 *
 * The first column is the index and must be strictly increasing; the remaining columns are
 * numeric signals of the same length. The first row supplies baseline values.
 */
class SignalTable {
  public:
    /**
     * @throws ConfigurationError if the index is empty or not strictly increasing, or a column
     *         length differs from the index length.
     */
    SignalTable(std::string index_name, std::vector<double> index, std::map<std::string, std::vector<double>> columns);

    /**
     * @brief Parse comma-separated text with a header row.
     * @throws ConfigurationError on a malformed header, ragged rows or non-numeric cells.
     */
    static SignalTable parse_csv(std::istream &in);

    /**
     * @brief Read a CSV file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static SignalTable read_csv(const std::string &path);

    const std::string &index_name() const { return index_name_; }
    const std::vector<double> &index() const { return index_; }
    size_t size() const { return index_.size(); }

    bool has_column(const std::string &name) const { return columns_.count(name) != 0; }
    std::vector<std::string> column_names() const;

    /// @throws std::out_of_range if the column does not exist.
    const std::vector<double> &column(const std::string &name) const;

    /// Value of a column in the first row.
    double first(const std::string &name) const { return column(name).front(); }

    /// Interpolator over one column, valid on [index().front(), index().back()].
    std::shared_ptr<const Interpolator> interpolate(const std::string &name,
                                                    InterpolationKind kind = InterpolationKind::Linear) const;

  private:
    std::string index_name_;
    std::vector<double> index_;
    std::map<std::string, std::vector<double>> columns_;
};

} // namespace minimod

#endif // MINIMOD_SIGNAL_TABLE_HPP
