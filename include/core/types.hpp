// types.hpp
// Value Types for the Rolling Minimum-Variance Backtester
// Dates, position constraints, coverage parameters and weight vectors

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace minvar {

// ============================================================================
// Calendar Date (monthly observations carry their month-end day)
// ============================================================================

struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool valid() const {
        return year > 0 && month >= 1 && month <= 12 && day >= 1 && day <= 31;
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return std::string(buf);
    }

    int serial() const { return year * 10000 + month * 100 + day; }
    int monthKey() const { return year * 12 + (month - 1); }

    bool operator<(const Date& other) const { return serial() < other.serial(); }
    bool operator>(const Date& other) const { return serial() > other.serial(); }
    bool operator<=(const Date& other) const { return serial() <= other.serial(); }
    bool operator==(const Date& other) const { return serial() == other.serial(); }
    bool operator!=(const Date& other) const { return serial() != other.serial(); }
};

// ============================================================================
// Covariance Estimation Methods
// ============================================================================

enum class CovarianceMethod { SAMPLE, SHRINKAGE };

inline const char* toString(CovarianceMethod method) {
    return method == CovarianceMethod::SAMPLE ? "Sample" : "Shrinkage";
}

// ============================================================================
// Position Constraints (uniform across the eligible universe)
// ============================================================================

struct Constraints {
    double min_weight;
    double max_weight;
    bool allow_short;
    bool long_only;

    Constraints()
        : min_weight(-1.0)
        , max_weight(1.0)
        , allow_short(true)
        , long_only(false) {}

    Constraints(double min_w, double max_w, bool shorts, bool long_only_flag)
        : min_weight(min_w)
        , max_weight(max_w)
        , allow_short(shorts)
        , long_only(long_only_flag) {}

    // Long/short with full-notional single-name bounds
    static Constraints longShort() {
        return Constraints(-1.0, 1.0, true, false);
    }

    static Constraints longOnlyCapped(double cap) {
        return Constraints(0.0, cap, false, true);
    }

    double lowerBound() const {
        if (long_only || !allow_short) return std::max(min_weight, 0.0);
        return min_weight;
    }

    double upperBound() const { return max_weight; }

    // Box bounds admit a fully invested portfolio of n assets
    bool feasibleFor(size_t n) const {
        if (n == 0) return false;
        double lb = lowerBound();
        double ub = upperBound();
        return lb <= ub &&
               lb * static_cast<double>(n) <= 1.0 + 1e-12 &&
               ub * static_cast<double>(n) >= 1.0 - 1e-12;
    }
};

// ============================================================================
// Coverage Parameters
// ============================================================================

struct CoverageParams {
    size_t min_observations;
    double max_missing_pct;

    CoverageParams() : min_observations(36), max_missing_pct(0.10) {}
    CoverageParams(size_t min_obs, double max_missing)
        : min_observations(min_obs), max_missing_pct(max_missing) {}
};

// ============================================================================
// Weight Vector: ticker -> weight for one method at one rebalance date
// ============================================================================

struct WeightVector {
    std::vector<std::string> tickers;
    Eigen::VectorXd weights;

    WeightVector() = default;
    WeightVector(std::vector<std::string> names, Eigen::VectorXd w)
        : tickers(std::move(names)), weights(std::move(w)) {}

    static WeightVector equalWeight(const std::vector<std::string>& names) {
        size_t n = names.size();
        Eigen::VectorXd w = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
        if (n > 0) w.setConstant(1.0 / static_cast<double>(n));
        return WeightVector(names, w);
    }

    size_t size() const { return tickers.size(); }
    bool empty() const { return tickers.empty(); }

    double sum() const { return weights.size() > 0 ? weights.sum() : 0.0; }

    // Weight for a ticker, zero when the ticker is not held
    double weightOf(const std::string& ticker) const {
        for (size_t i = 0; i < tickers.size(); ++i) {
            if (tickers[i] == ticker) return weights(static_cast<Eigen::Index>(i));
        }
        return 0.0;
    }

    bool satisfies(const Constraints& constraints, double tol = 1e-6) const {
        if (empty()) return false;
        if (std::abs(sum() - 1.0) > tol) return false;
        double lb = constraints.lowerBound();
        double ub = constraints.upperBound();
        for (Eigen::Index i = 0; i < weights.size(); ++i) {
            if (weights(i) < lb - tol || weights(i) > ub + tol) return false;
        }
        return true;
    }

    bool operator==(const WeightVector& other) const {
        return tickers == other.tickers &&
               weights.size() == other.weights.size() &&
               (weights.size() == 0 || weights == other.weights);
    }
};

} // namespace minvar
