#ifndef CAVESIM_ERRORS_H
#define CAVESIM_ERRORS_H

#include <stdexcept>
#include <string>

// ---------- Error Taxonomy ----------
// All errors are local and deterministic: a caller contract violation or an
// exhausted model configuration. Nothing here is retried.

// Invalid build parameters (cave sizes, K, S, noise, injected opinions)
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Two opinion vectors of unequal length were compared
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

// Polarization requested on fewer than two agents
class EmptyNetworkError : public std::invalid_argument {
public:
    explicit EmptyNetworkError(const std::string& what) : std::invalid_argument(what) {}
};

// Update rule invoked on an agent without neighbors
class NoNeighborsError : public std::runtime_error {
public:
    explicit NoNeighborsError(const std::string& what) : std::runtime_error(what) {}
};

// Rewiring requested beyond the available non-neighbor pairs
class EdgeExhaustedError : public std::runtime_error {
public:
    explicit EdgeExhaustedError(const std::string& what) : std::runtime_error(what) {}
};

// Operation invoked out of the allowed simulation state order
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

#endif // CAVESIM_ERRORS_H
