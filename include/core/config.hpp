// config.hpp
// Run Configuration for the Rolling Minimum-Variance Backtester
// All defaults are explicit values set at construction; presets are returned by value

#pragma once

#include <cmath>
#include <string>
#include <vector>
#include "exceptions.hpp"
#include "types.hpp"

namespace minvar {

// ============================================================================
// Backtest Configuration
// ============================================================================

struct BacktestConfig {
    std::vector<std::string> tickers;  // Empty means every ticker in the series
    int start_year;
    int end_year;
    size_t estimation_window;          // Months
    size_t rebalance_step;             // Months between rebalances
    Constraints constraints;
    double risk_free_rate;             // Annualized decimal
    CoverageParams coverage;
    double degraded_threshold;         // Degraded-period rate that triggers RunDegraded
    bool narrow_underdetermined_universe;
    std::vector<CovarianceMethod> methods;
    size_t num_threads;
    size_t max_universe;               // Bound on eligible assets (O(N^3) per period)
    bool verbose;

    BacktestConfig()
        : start_year(2010)
        , end_year(2024)
        , estimation_window(36)
        , rebalance_step(1)
        , constraints(Constraints::longShort())
        , risk_free_rate(0.042)
        , coverage(36, 0.10)
        , degraded_threshold(0.20)
        , narrow_underdetermined_universe(true)
        , methods{CovarianceMethod::SAMPLE, CovarianceMethod::SHRINKAGE}
        , num_threads(1)
        , max_universe(500)
        , verbose(false) {}

    static BacktestConfig getDefault() {
        return BacktestConfig();
    }

    // Long-only variant with a 25% single-name cap
    static BacktestConfig longOnlyDefault() {
        BacktestConfig config;
        config.constraints = Constraints::longOnlyCapped(0.25);
        return config;
    }

    // Require a full window of observations for the current estimation_window
    void matchCoverageToWindow() {
        coverage.min_observations = estimation_window;
    }

    void validate() const {
        if (start_year > end_year) {
            throw DataException("Invalid date range: start_year " + std::to_string(start_year) +
                                " > end_year " + std::to_string(end_year));
        }
        if (estimation_window < 2) {
            throw DataException("estimation_window must be at least 2, got " +
                                std::to_string(estimation_window));
        }
        if (rebalance_step == 0) {
            throw DataException("rebalance_step must be positive");
        }
        if (!(constraints.min_weight <= constraints.max_weight)) {
            throw DataException("min_weight must not exceed max_weight");
        }
        if (!std::isfinite(constraints.min_weight) || !std::isfinite(constraints.max_weight)) {
            throw DataException("Weight bounds must be finite");
        }
        if (constraints.upperBound() < constraints.lowerBound()) {
            throw DataException("Long-only constraints leave no room: max_weight below zero");
        }
        if (!std::isfinite(risk_free_rate)) {
            throw DataException("risk_free_rate must be finite");
        }
        if (coverage.max_missing_pct < 0.0 || coverage.max_missing_pct > 1.0) {
            throw DataException("max_missing_pct must be in [0, 1]");
        }
        if (coverage.min_observations > estimation_window) {
            throw DataException("min_observations (" + std::to_string(coverage.min_observations) +
                                ") exceeds estimation_window (" +
                                std::to_string(estimation_window) + ")");
        }
        if (degraded_threshold < 0.0 || degraded_threshold > 1.0) {
            throw DataException("degraded_threshold must be in [0, 1]");
        }
        if (methods.empty()) {
            throw DataException("At least one covariance method is required");
        }
        if (num_threads == 0) {
            throw DataException("num_threads must be positive");
        }
        if (max_universe < 2) {
            throw DataException("max_universe must be at least 2");
        }
    }
};

} // namespace minvar
