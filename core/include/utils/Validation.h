#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <stdexcept>
#include <string>

// Fail-fast parameter checks used at construction time.
// Every helper throws std::invalid_argument naming the field and the offending value.
namespace Validation {

inline std::string describe(const std::string& field, const std::string& rule, double value) {
    return field + " " + rule + " (got " + std::to_string(value) + ")";
}

inline void requireFinite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(describe(field, "must be finite", value));
    }
}

inline void requireUnitInterval(const std::string& field, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw std::invalid_argument(describe(field, "must be in [0,1]", value));
    }
}

inline void requirePositive(const std::string& field, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument(describe(field, "must be > 0", value));
    }
}

inline void requireNonNegative(const std::string& field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(describe(field, "must be >= 0", value));
    }
}

inline void requireRange(const std::string& field, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw std::invalid_argument(field + " must be in [" + std::to_string(lo) + "," +
                                    std::to_string(hi) + "] (got " + std::to_string(value) + ")");
    }
}

}  // namespace Validation

#endif
