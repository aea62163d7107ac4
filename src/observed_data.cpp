#include "minimod/observed_data.hpp"
#include "minimod/errors.hpp"

namespace minimod {

void
ObservedData::validate() const {
    if (times.empty()) { throw ConfigurationError("ObservedData times vector cannot be empty."); }
    for (size_t i = 1; i < times.size(); ++i) {
        if (!(times[i] > times[i - 1])) {
            throw ConfigurationError("ObservedData times must be strictly increasing (index " + std::to_string(i) +
                                     ").");
        }
    }
    if (measurements.empty()) { throw ConfigurationError("ObservedData measurements map cannot be empty."); }
    for (const auto &pair : measurements) {
        if (pair.second.size() != times.size()) {
            throw ConfigurationError("Measurement vector size for field '" + pair.first + "' (" +
                                     std::to_string(pair.second.size()) + ") must match size of times vector (" +
                                     std::to_string(times.size()) + ").");
        }
    }
}

} // namespace minimod
