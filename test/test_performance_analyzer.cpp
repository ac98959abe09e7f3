// test_performance_analyzer.cpp
// Unit tests for performance metrics over realized monthly returns

#include <iostream>
#include "test_reporter.hpp"
#include "../include/analytics/performance_analyzer.hpp"

using namespace minvar;
using namespace minvar::testing;

static const std::vector<double> kReturns = {0.10, -0.05, 0.02, -0.10, 0.08};

void test_annualized_moments() {
    PerformanceMetrics m = PerformanceAnalyzer::analyze(kReturns, 0.0);
    double sd = std::sqrt(0.0288 / 4.0);

    check(m.num_periods == 5, "period count");
    checkNear(m.annualized_return, 0.12, 1e-12, "12 * mean");
    checkNear(m.annualized_volatility, sd * std::sqrt(12.0), 1e-12, "sample std * sqrt(12)");
    checkNear(m.sharpe_ratio, 0.12 / (sd * std::sqrt(12.0)), 1e-12, "Sharpe");
}

void test_risk_free_rate_reduces_sharpe() {
    PerformanceMetrics m = PerformanceAnalyzer::analyze(kReturns, 0.042);
    double vol = std::sqrt(0.0288 / 4.0) * std::sqrt(12.0);
    checkNear(m.sharpe_ratio, (0.12 - 0.042) / vol, 1e-12, "excess over rf");
}

void test_sortino_downside_deviation() {
    PerformanceMetrics m = PerformanceAnalyzer::analyze(kReturns, 0.0);
    double downside = std::sqrt((0.0025 + 0.01) / 5.0) * std::sqrt(12.0);
    checkNear(m.sortino_ratio, 0.12 / downside, 1e-12, "Sortino");
}

void test_drawdown_and_totals() {
    PerformanceMetrics m = PerformanceAnalyzer::analyze(kReturns, 0.0);
    checkNear(m.max_drawdown, 0.95931 / 1.1 - 1.0, 1e-12, "peak 1.10 to trough 0.95931");
    checkNear(m.total_return, 1.1 * 0.95 * 1.02 * 0.9 * 1.08 - 1.0, 1e-12, "compounded");
    checkNear(m.win_rate, 0.6, 1e-12, "3 of 5 positive");
    checkNear(m.best_month, 0.10, 0.0, "best");
    checkNear(m.worst_month, -0.10, 0.0, "worst");
    check(m.skewness < 0.0, "left-skewed sample");
}

void test_monotone_series_has_no_drawdown() {
    std::vector<double> up = {0.01, 0.02, 0.0, 0.03};
    checkNear(PerformanceAnalyzer::maxDrawdown(up), 0.0, 0.0, "never below peak");

    std::vector<double> crash = {-0.5};
    checkNear(PerformanceAnalyzer::maxDrawdown(crash), 0.0, 0.0, "first point sets the peak");
}

void test_symmetric_kurtosis() {
    std::vector<double> flip = {0.01, -0.01, 0.01, -0.01};
    PerformanceMetrics m = PerformanceAnalyzer::analyze(flip, 0.0);
    checkNear(m.skewness, 0.0, 1e-12, "symmetric");
    checkNear(m.kurtosis, 1.0, 1e-9, "two-point distribution");
    checkNear(m.excess_kurtosis, -2.0, 1e-9, "excess");
}

void test_zero_volatility_sharpe() {
    std::vector<double> flat = {0.125, 0.125, 0.125};
    PerformanceMetrics m = PerformanceAnalyzer::analyze(flat, 0.042);
    checkNear(m.annualized_volatility, 0.0, 1e-15, "no dispersion");
    checkNear(m.sharpe_ratio, 0.0, 0.0, "Sharpe defined as 0");
    checkNear(m.sortino_ratio, 0.0, 0.0, "no downside");
}

void test_empty_series() {
    PerformanceMetrics m = PerformanceAnalyzer::analyze({}, 0.042);
    check(m.num_periods == 0, "no periods");
    checkNear(m.sharpe_ratio, 0.0, 0.0, "Sharpe");
    checkNear(m.total_return, 0.0, 0.0, "total return");
}

void test_compare_by_sharpe() {
    PerformanceMetrics sample;
    sample.sharpe_ratio = 0.5;
    PerformanceMetrics shrink;
    shrink.sharpe_ratio = 0.6;

    MethodComparison c = compareBySharpe("Sample", sample, "Shrinkage", shrink);
    check(c.winner == "Shrinkage", "higher Sharpe wins");
    checkNear(c.sharpe_difference, 0.1, 1e-12, "difference");
    checkNear(c.improvement_pct, 20.0, 1e-9, "relative improvement");

    MethodComparison tie = compareBySharpe("Sample", sample, "Shrinkage", sample);
    check(tie.winner == "Sample", "ties go to the baseline");
}

int main() {
    std::cout << "\n=== Performance Analyzer Test Suite ===" << std::endl;
    std::cout << "=======================================\n" << std::endl;

    TestReporter reporter;
    reporter.test("Annualized Moments", test_annualized_moments);
    reporter.test("Risk-Free Rate", test_risk_free_rate_reduces_sharpe);
    reporter.test("Sortino Downside Deviation", test_sortino_downside_deviation);
    reporter.test("Drawdown and Totals", test_drawdown_and_totals);
    reporter.test("Monotone Series Drawdown", test_monotone_series_has_no_drawdown);
    reporter.test("Symmetric Kurtosis", test_symmetric_kurtosis);
    reporter.test("Zero Volatility Sharpe", test_zero_volatility_sharpe);
    reporter.test("Empty Series", test_empty_series);
    reporter.test("Compare By Sharpe", test_compare_by_sharpe);

    return reporter.report();
}
