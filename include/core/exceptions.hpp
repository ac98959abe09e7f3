// exceptions.hpp
// Exception Types and Error Kinds for the Rolling Minimum-Variance Backtester
// Hard failures are exceptions; recoverable per-period conditions travel as ErrorKind values

#pragma once

#include <stdexcept>
#include <string>

namespace minvar {

// ============================================================================
// Exception Types for Unrecoverable Failures
// ============================================================================

class BacktestException : public std::runtime_error {
public:
    explicit BacktestException(const std::string& msg) : std::runtime_error(msg) {}
};

class DataException : public BacktestException {
public:
    explicit DataException(const std::string& msg) : BacktestException("Data Error: " + msg) {}
};

class InsufficientUniverseException : public BacktestException {
public:
    explicit InsufficientUniverseException(const std::string& msg)
        : BacktestException("Insufficient Universe: " + msg) {}
};

// ============================================================================
// Error Kinds Reported at Component Boundaries
// ============================================================================

enum class ErrorKind {
    NONE,
    INSUFFICIENT_UNIVERSE,
    SINGULAR_COVARIANCE,
    OPTIMIZATION_NON_CONVERGENCE,
    INFEASIBLE
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::INSUFFICIENT_UNIVERSE: return "InsufficientUniverse";
        case ErrorKind::SINGULAR_COVARIANCE: return "SingularCovariance";
        case ErrorKind::OPTIMIZATION_NON_CONVERGENCE: return "OptimizationNonConvergence";
        case ErrorKind::INFEASIBLE: return "Infeasible";
    }
    return "Unknown";
}

} // namespace minvar
