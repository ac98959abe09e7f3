// coverage_filter.hpp
// Coverage Filter for the Rolling Minimum-Variance Backtester
// Decides which tickers carry enough observations inside an estimation window

#pragma once

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../data/return_series.hpp"

namespace minvar {

// ============================================================================
// Coverage Result
// ============================================================================

struct CoverageResult {
    enum class Reason { NONE, TOO_FEW_ASSETS, UNDERDETERMINED };

    std::vector<size_t> eligible_columns;      // Column indices into the window, stable order
    std::vector<std::string> eligible_tickers;
    std::vector<size_t> observation_counts;    // Parallel to eligible_columns
    size_t periods = 0;
    ErrorKind error = ErrorKind::NONE;
    Reason reason = Reason::NONE;
    std::string message;

    bool ok() const { return error == ErrorKind::NONE; }
    size_t size() const { return eligible_columns.size(); }
};

// ============================================================================
// Coverage Filter
// ============================================================================

class CoverageFilter {
private:
    CoverageParams params_;

    static void classify(CoverageResult& result) {
        size_t n = result.eligible_columns.size();
        if (n < 2) {
            result.error = ErrorKind::INSUFFICIENT_UNIVERSE;
            result.reason = CoverageResult::Reason::TOO_FEW_ASSETS;
            result.message = std::to_string(n) + " eligible asset(s); at least 2 required";
        } else if (result.periods < n + 1) {
            result.error = ErrorKind::INSUFFICIENT_UNIVERSE;
            result.reason = CoverageResult::Reason::UNDERDETERMINED;
            result.message = std::to_string(result.periods) + " periods for " + std::to_string(n) +
                             " eligible assets; sample covariance needs periods >= assets + 1";
        } else {
            result.error = ErrorKind::NONE;
            result.reason = CoverageResult::Reason::NONE;
            result.message.clear();
        }
    }

public:
    explicit CoverageFilter(const CoverageParams& params) : params_(params) {}

    const CoverageParams& params() const { return params_; }

    // window: periods x tickers block, NaN marks a missing observation
    CoverageResult filter(const Eigen::MatrixXd& window,
                          const std::vector<std::string>& tickers) const {
        CoverageResult result;
        result.periods = static_cast<size_t>(window.rows());
        if (result.periods == 0) {
            classify(result);
            return result;
        }

        for (Eigen::Index c = 0; c < window.cols(); ++c) {
            size_t count = 0;
            for (Eigen::Index r = 0; r < window.rows(); ++r) {
                if (!ReturnSeries::isMissing(window(r, c))) ++count;
            }
            double missing_fraction = 1.0 - static_cast<double>(count) /
                                            static_cast<double>(result.periods);
            if (count >= params_.min_observations &&
                missing_fraction <= params_.max_missing_pct + 1e-12) {
                result.eligible_columns.push_back(static_cast<size_t>(c));
                result.eligible_tickers.push_back(tickers[static_cast<size_t>(c)]);
                result.observation_counts.push_back(count);
            }
        }

        classify(result);
        return result;
    }

    // Keep the (periods - 1) best-covered assets so the sample estimator is identifiable.
    // Ties keep column order.
    static CoverageResult narrow(const CoverageResult& result) {
        if (result.reason != CoverageResult::Reason::UNDERDETERMINED) return result;

        size_t keep = result.periods > 0 ? result.periods - 1 : 0;
        std::vector<size_t> order(result.eligible_columns.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return result.observation_counts[a] > result.observation_counts[b];
        });
        order.resize(std::min(keep, order.size()));
        std::sort(order.begin(), order.end());

        CoverageResult narrowed;
        narrowed.periods = result.periods;
        for (size_t i : order) {
            narrowed.eligible_columns.push_back(result.eligible_columns[i]);
            narrowed.eligible_tickers.push_back(result.eligible_tickers[i]);
            narrowed.observation_counts.push_back(result.observation_counts[i]);
        }
        classify(narrowed);
        return narrowed;
    }
};

} // namespace minvar
