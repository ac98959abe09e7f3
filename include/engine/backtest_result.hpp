// backtest_result.hpp
// Backtest Result Records for the Rolling Minimum-Variance Backtester
// Append-only while the engine runs; read-only for every other collaborator

#pragma once

#include <map>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../analytics/performance_analyzer.hpp"
#include "../analytics/turnover_tracker.hpp"

namespace minvar {

class RollingBacktestEngine;

// ============================================================================
// One rebalance of one method
// ============================================================================

struct BacktestRow {
    Date date;
    CovarianceMethod method = CovarianceMethod::SAMPLE;
    WeightVector weights;
    double realized_return = 0.0;
    double turnover = 0.0;
    bool degraded = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
    double shrinkage_intensity = 0.0;   // Estimator diagnostic, 0 for Sample
    double condition_number = 0.0;
    size_t eligible_count = 0;
    size_t missing_realized = 0;        // Eligible tickers with no return at the evaluation date
    bool narrowed = false;
};

// ============================================================================
// Run-level warnings
// ============================================================================

struct RunWarning {
    enum class Kind {
        UNKNOWN_TICKER,
        INSUFFICIENT_UNIVERSE,
        MISSING_REALIZED_RETURN,
        RUN_DEGRADED
    };

    Kind kind;
    Date date;            // Default-constructed for run-wide warnings
    std::string message;
};

inline const char* toString(RunWarning::Kind kind) {
    switch (kind) {
        case RunWarning::Kind::UNKNOWN_TICKER: return "UnknownTicker";
        case RunWarning::Kind::INSUFFICIENT_UNIVERSE: return "InsufficientUniverse";
        case RunWarning::Kind::MISSING_REALIZED_RETURN: return "MissingRealizedReturn";
        case RunWarning::Kind::RUN_DEGRADED: return "RunDegraded";
    }
    return "Unknown";
}

// ============================================================================
// BacktestResult
// ============================================================================

class BacktestResult {
private:
    friend class RollingBacktestEngine;

    std::vector<BacktestRow> rows_;
    std::vector<RunWarning> warnings_;

    void append(BacktestRow row) { rows_.push_back(std::move(row)); }
    void addWarning(RunWarning warning) { warnings_.push_back(std::move(warning)); }

public:
    const std::vector<BacktestRow>& rows() const { return rows_; }
    const std::vector<RunWarning>& warnings() const { return warnings_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    std::vector<BacktestRow> rowsFor(CovarianceMethod method) const {
        std::vector<BacktestRow> out;
        for (const auto& row : rows_) {
            if (row.method == method) out.push_back(row);
        }
        return out;
    }

    std::vector<double> returnsFor(CovarianceMethod method) const {
        std::vector<double> out;
        for (const auto& row : rows_) {
            if (row.method == method) out.push_back(row.realized_return);
        }
        return out;
    }

    std::vector<Date> datesFor(CovarianceMethod method) const {
        std::vector<Date> out;
        for (const auto& row : rows_) {
            if (row.method == method) out.push_back(row.date);
        }
        return out;
    }

    size_t degradedCount(CovarianceMethod method) const {
        size_t n = 0;
        for (const auto& row : rows_) {
            if (row.method == method && row.degraded) ++n;
        }
        return n;
    }

    double degradedRate(CovarianceMethod method) const {
        size_t total = 0;
        for (const auto& row : rows_) {
            if (row.method == method) ++total;
        }
        return total == 0 ? 0.0 : static_cast<double>(degradedCount(method)) / total;
    }

    bool hasWarning(RunWarning::Kind kind) const {
        for (const auto& w : warnings_) {
            if (w.kind == kind) return true;
        }
        return false;
    }
};

// ============================================================================
// Everything a reporting collaborator consumes
// ============================================================================

struct BacktestReport {
    BacktestResult result;
    std::map<CovarianceMethod, PerformanceMetrics> performance;
    std::map<CovarianceMethod, TurnoverSummary> turnover;
    std::vector<std::string> final_tickers;
    double risk_free_rate = 0.0;

    bool runDegraded() const { return result.hasWarning(RunWarning::Kind::RUN_DEGRADED); }
};

} // namespace minvar
