// performance_analyzer.hpp
// Performance Statistics for the Rolling Minimum-Variance Backtester
// Summary metrics over one method's realized monthly returns, plus a two-method comparison

#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace minvar {

// ============================================================================
// Distribution Moments
// ============================================================================

class StatisticalUtils {
public:
    static double mean(const std::vector<double>& returns) {
        if (returns.empty()) return 0.0;
        return std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    }

    // Sample standard deviation (n - 1)
    static double stdDev(const std::vector<double>& returns) {
        if (returns.size() < 2) return 0.0;
        double m = mean(returns);
        double ss = 0.0;
        for (double r : returns) ss += (r - m) * (r - m);
        return std::sqrt(ss / (returns.size() - 1.0));
    }

    // Third standardized moment
    static double calculateSkewness(const std::vector<double>& returns) {
        if (returns.size() < 3) return 0.0;

        double m = mean(returns);
        double m2 = 0.0, m3 = 0.0;
        for (double r : returns) {
            double diff = r - m;
            m2 += diff * diff;
            m3 += diff * diff * diff;
        }
        m2 /= returns.size();
        m3 /= returns.size();

        if (m2 < 1e-20) return 0.0;
        return m3 / std::pow(m2, 1.5);
    }

    // Fourth standardized moment (3 for a normal distribution)
    static double calculateKurtosis(const std::vector<double>& returns) {
        if (returns.size() < 4) return 0.0;

        double m = mean(returns);
        double m2 = 0.0, m4 = 0.0;
        for (double r : returns) {
            double diff2 = (r - m) * (r - m);
            m2 += diff2;
            m4 += diff2 * diff2;
        }
        m2 /= returns.size();
        m4 /= returns.size();

        if (m2 < 1e-20) return 0.0;
        return m4 / (m2 * m2);
    }
};

// ============================================================================
// Performance Metrics
// ============================================================================

struct PerformanceMetrics {
    size_t num_periods = 0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double annualized_volatility = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;      // <= 0
    double win_rate = 0.0;
    double skewness = 0.0;
    double kurtosis = 0.0;
    double excess_kurtosis = 0.0;
    double best_month = 0.0;
    double worst_month = 0.0;
};

class PerformanceAnalyzer {
public:
    static constexpr double PERIODS_PER_YEAR = 12.0;

    // periods_per_year is 12 for monthly rows, 12 / step when each row holds step months
    static PerformanceMetrics analyze(const std::vector<double>& returns, double risk_free_rate,
                                      double periods_per_year = PERIODS_PER_YEAR) {
        PerformanceMetrics m;
        if (returns.empty()) return m;

        const double sqrt_periods = std::sqrt(periods_per_year);
        m.num_periods = returns.size();

        double mean = StatisticalUtils::mean(returns);
        double sd = StatisticalUtils::stdDev(returns);

        m.annualized_return = mean * periods_per_year;
        m.annualized_volatility = sd * sqrt_periods;
        if (m.annualized_volatility > 0.0) {
            m.sharpe_ratio = (m.annualized_return - risk_free_rate) / m.annualized_volatility;
        }

        // Downside deviation against a zero target, full-sample denominator
        double downside_sq = 0.0;
        for (double r : returns) {
            if (r < 0.0) downside_sq += r * r;
        }
        double downside_vol = std::sqrt(downside_sq / returns.size()) * sqrt_periods;
        if (downside_vol > 0.0) {
            m.sortino_ratio = (m.annualized_return - risk_free_rate) / downside_vol;
        }

        m.max_drawdown = maxDrawdown(returns);

        double cumulative = 1.0;
        size_t wins = 0;
        for (double r : returns) {
            cumulative *= (1.0 + r);
            if (r > 0.0) ++wins;
        }
        m.total_return = cumulative - 1.0;
        m.win_rate = static_cast<double>(wins) / returns.size();

        m.skewness = StatisticalUtils::calculateSkewness(returns);
        m.kurtosis = StatisticalUtils::calculateKurtosis(returns);
        m.excess_kurtosis = returns.size() >= 4 ? m.kurtosis - 3.0 : 0.0;

        auto [lo, hi] = std::minmax_element(returns.begin(), returns.end());
        m.worst_month = *lo;
        m.best_month = *hi;
        return m;
    }

    // min_t (cum_t - peak_t) / peak_t over the compounded wealth path
    static double maxDrawdown(const std::vector<double>& returns) {
        double cumulative = 1.0;
        double peak = 0.0;
        double worst = 0.0;
        bool first = true;
        for (double r : returns) {
            cumulative *= (1.0 + r);
            if (first || cumulative > peak) {
                peak = cumulative;
                first = false;
            }
            if (peak > 0.0) {
                worst = std::min(worst, (cumulative - peak) / peak);
            }
        }
        return worst;
    }
};

// ============================================================================
// Two-Method Comparison
// ============================================================================

struct MethodComparison {
    std::string winner;
    double sharpe_difference = 0.0;    // challenger - baseline
    double improvement_pct = 0.0;      // relative Sharpe improvement of the winner
};

inline MethodComparison compareBySharpe(const std::string& baseline_name,
                                        const PerformanceMetrics& baseline,
                                        const std::string& challenger_name,
                                        const PerformanceMetrics& challenger) {
    MethodComparison c;
    c.sharpe_difference = challenger.sharpe_ratio - baseline.sharpe_ratio;
    if (challenger.sharpe_ratio > baseline.sharpe_ratio) {
        c.winner = challenger_name;
        if (baseline.sharpe_ratio != 0.0) {
            c.improvement_pct = c.sharpe_difference / std::abs(baseline.sharpe_ratio) * 100.0;
        }
    } else {
        c.winner = baseline_name;
        if (challenger.sharpe_ratio != 0.0) {
            c.improvement_pct = -c.sharpe_difference / std::abs(challenger.sharpe_ratio) * 100.0;
        }
    }
    return c;
}

} // namespace minvar
