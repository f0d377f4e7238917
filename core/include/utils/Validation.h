#ifndef CAVESIM_VALIDATION_H
#define CAVESIM_VALIDATION_H

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

// Invariant checks for debug builds. Compiled out under NDEBUG.
namespace validation {

#ifndef NDEBUG

inline void checkOpinions(const double* values, std::size_t n, const char* context) {
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(values[i]) || values[i] < -1.0 || values[i] > 1.0) {
            throw std::logic_error(std::string(context) + ": opinion component " + std::to_string(i) +
                                   " out of [-1,1] (" + std::to_string(values[i]) + ")");
        }
    }
}

inline void checkNonNegative(double value, const char* context) {
    if (!(value >= 0.0)) {
        throw std::logic_error(std::string(context) + ": expected non-negative value, got " +
                               std::to_string(value));
    }
}

inline void checkIndex(std::size_t index, std::size_t bound, const char* context) {
    if (index >= bound) {
        throw std::logic_error(std::string(context) + ": index " + std::to_string(index) +
                               " out of range " + std::to_string(bound));
    }
}

#else

inline void checkOpinions(const double*, std::size_t, const char*) {}
inline void checkNonNegative(double, const char*) {}
inline void checkIndex(std::size_t, std::size_t, const char*) {}

#endif

} // namespace validation

#endif // CAVESIM_VALIDATION_H
