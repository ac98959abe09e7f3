// return_series.hpp
// Immutable Monthly Return Series for the Rolling Minimum-Variance Backtester
// Dates x tickers matrix of decimal returns; missing observations are stored as NaN

#pragma once

#include <cmath>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>
#include <Eigen/Dense>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"

namespace minvar {

// ============================================================================
// ReturnSeries
// ============================================================================

class ReturnSeries {
private:
    std::vector<Date> dates_;
    std::vector<std::string> tickers_;
    Eigen::MatrixXd returns_;  // rows = dates, cols = tickers

    void validate() const {
        if (returns_.rows() != static_cast<Eigen::Index>(dates_.size()) ||
            returns_.cols() != static_cast<Eigen::Index>(tickers_.size())) {
            throw DataException("Return matrix shape " + std::to_string(returns_.rows()) + "x" +
                                std::to_string(returns_.cols()) + " does not match " +
                                std::to_string(dates_.size()) + " dates and " +
                                std::to_string(tickers_.size()) + " tickers");
        }

        for (size_t i = 0; i < dates_.size(); ++i) {
            if (!dates_[i].valid()) {
                throw DataException("Invalid date at row " + std::to_string(i));
            }
            if (i > 0 && !(dates_[i - 1] < dates_[i])) {
                throw DataException("Dates must be strictly increasing: " +
                                    dates_[i - 1].toString() + " followed by " +
                                    dates_[i].toString());
            }
        }

        std::unordered_set<std::string> seen;
        for (const auto& ticker : tickers_) {
            if (ticker.empty()) throw DataException("Empty ticker name");
            if (!seen.insert(ticker).second) {
                throw DataException("Duplicate ticker: " + ticker);
            }
        }

        for (Eigen::Index r = 0; r < returns_.rows(); ++r) {
            for (Eigen::Index c = 0; c < returns_.cols(); ++c) {
                if (std::isinf(returns_(r, c))) {
                    throw DataException("Infinite return for " + tickers_[c] + " at " +
                                        dates_[r].toString());
                }
            }
        }
    }

public:
    static double missing() { return std::numeric_limits<double>::quiet_NaN(); }
    static bool isMissing(double value) { return std::isnan(value); }

    ReturnSeries() = default;

    ReturnSeries(std::vector<Date> dates, std::vector<std::string> tickers, Eigen::MatrixXd returns)
        : dates_(std::move(dates)), tickers_(std::move(tickers)), returns_(std::move(returns)) {
        validate();
    }

    size_t numDates() const { return dates_.size(); }
    size_t numTickers() const { return tickers_.size(); }
    bool empty() const { return dates_.empty() || tickers_.empty(); }

    const std::vector<Date>& dates() const { return dates_; }
    const std::vector<std::string>& tickers() const { return tickers_; }
    const Eigen::MatrixXd& values() const { return returns_; }

    const Date& dateAt(size_t row) const { return dates_.at(row); }
    double at(size_t row, size_t col) const {
        return returns_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    // Column index of a ticker, -1 when absent
    int indexOf(const std::string& ticker) const {
        for (size_t i = 0; i < tickers_.size(); ++i) {
            if (tickers_[i] == ticker) return static_cast<int>(i);
        }
        return -1;
    }

    size_t countMissing() const {
        size_t n = 0;
        for (Eigen::Index r = 0; r < returns_.rows(); ++r)
            for (Eigen::Index c = 0; c < returns_.cols(); ++c)
                if (isMissing(returns_(r, c))) ++n;
        return n;
    }

    // Rows with start_year <= year <= end_year
    ReturnSeries sliceYears(int start_year, int end_year) const {
        if (start_year > end_year) {
            throw DataException("Invalid date range: start year " + std::to_string(start_year) +
                                " is after end year " + std::to_string(end_year));
        }

        std::vector<Eigen::Index> rows;
        std::vector<Date> dates;
        for (size_t i = 0; i < dates_.size(); ++i) {
            if (dates_[i].year >= start_year && dates_[i].year <= end_year) {
                rows.push_back(static_cast<Eigen::Index>(i));
                dates.push_back(dates_[i]);
            }
        }

        Eigen::MatrixXd sliced(static_cast<Eigen::Index>(rows.size()), returns_.cols());
        for (size_t r = 0; r < rows.size(); ++r) {
            sliced.row(static_cast<Eigen::Index>(r)) = returns_.row(rows[r]);
        }
        return ReturnSeries(std::move(dates), tickers_, std::move(sliced));
    }

    // Columns for the requested tickers, in request order; unknown names are skipped
    ReturnSeries selectTickers(const std::vector<std::string>& names) const {
        std::vector<std::string> kept;
        std::vector<Eigen::Index> cols;
        for (const auto& name : names) {
            int idx = indexOf(name);
            if (idx < 0) continue;
            bool duplicate = false;
            for (const auto& k : kept) duplicate = duplicate || (k == name);
            if (duplicate) continue;
            kept.push_back(name);
            cols.push_back(idx);
        }

        Eigen::MatrixXd selected(returns_.rows(), static_cast<Eigen::Index>(cols.size()));
        for (size_t c = 0; c < cols.size(); ++c) {
            selected.col(static_cast<Eigen::Index>(c)) = returns_.col(cols[c]);
        }
        return ReturnSeries(dates_, std::move(kept), std::move(selected));
    }
};

} // namespace minvar
