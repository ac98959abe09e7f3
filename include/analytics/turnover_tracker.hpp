// turnover_tracker.hpp
// Turnover Aggregation for the Rolling Minimum-Variance Backtester
// Gross turnover only; never fed back into realized returns

#pragma once

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>
#include "../core/types.hpp"

namespace minvar {

struct TurnoverSummary {
    size_t num_rebalances = 0;
    double total_turnover = 0.0;
    double average_turnover = 0.0;
    double max_turnover = 0.0;
};

class TurnoverTracker {
private:
    std::vector<double> history_;
    double total_ = 0.0;
    double max_ = 0.0;

public:
    // sum |w_curr - w_prev| over the union of tickers; absent tickers count as zero weight
    static double turnover(const WeightVector& previous, const WeightVector& current) {
        std::set<std::string> universe(previous.tickers.begin(), previous.tickers.end());
        universe.insert(current.tickers.begin(), current.tickers.end());

        double sum = 0.0;
        for (const auto& ticker : universe) {
            sum += std::abs(current.weightOf(ticker) - previous.weightOf(ticker));
        }
        return sum;
    }

    void record(double value) {
        history_.push_back(value);
        total_ += value;
        max_ = std::max(max_, value);
    }

    TurnoverSummary summary() const {
        TurnoverSummary s;
        s.num_rebalances = history_.size();
        s.total_turnover = total_;
        s.max_turnover = max_;
        s.average_turnover = history_.empty() ? 0.0 : total_ / history_.size();
        return s;
    }

    const std::vector<double>& history() const { return history_; }

    void reset() {
        history_.clear();
        total_ = 0.0;
        max_ = 0.0;
    }
};

} // namespace minvar
