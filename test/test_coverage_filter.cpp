// test_coverage_filter.cpp
// Unit tests for window coverage filtering and universe narrowing

#include <iostream>
#include "test_reporter.hpp"
#include "../include/risk/coverage_filter.hpp"

using namespace minvar;
using namespace minvar::testing;

void test_full_coverage_all_eligible() {
    Eigen::MatrixXd window = randomReturns(36, 5, 7);
    CoverageFilter filter(CoverageParams(36, 0.10));

    CoverageResult result = filter.filter(window, tickerNames(5));
    check(result.ok(), "full window is ok");
    check(result.size() == 5, "all five tickers eligible");
    check(result.eligible_tickers.front() == "T000", "column order kept");
    check(result.periods == 36, "periods recorded");
}

void test_five_of_thirty_six_missing_excluded() {
    Eigen::MatrixXd window = randomReturns(36, 4, 11);
    for (int r = 0; r < 5; ++r) window(r * 7, 2) = ReturnSeries::missing();

    CoverageFilter filter(CoverageParams(36, 0.10));
    CoverageResult result = filter.filter(window, tickerNames(4));

    check(result.ok(), "remaining universe is ok");
    check(result.size() == 3, "one ticker excluded");
    for (const auto& t : result.eligible_tickers) check(t != "T002", "T002 excluded");
}

void test_missing_fraction_threshold() {
    // 3 of 36 missing is 8.3%, within 10% once min_observations allows it
    Eigen::MatrixXd window = randomReturns(36, 3, 13);
    for (int r = 0; r < 3; ++r) window(r, 0) = ReturnSeries::missing();
    for (int r = 0; r < 4; ++r) window(r + 10, 1) = ReturnSeries::missing();

    CoverageFilter filter(CoverageParams(30, 0.10));
    CoverageResult result = filter.filter(window, tickerNames(3));

    check(result.size() == 2, "4 of 36 missing (11.1%) excluded");
    check(result.eligible_tickers[0] == "T000", "8.3% missing kept");
    check(result.observation_counts[0] == 33, "observation count");
}

void test_too_few_assets() {
    Eigen::MatrixXd window = randomReturns(12, 3, 17);
    window.col(1).setConstant(ReturnSeries::missing());
    window.col(2).setConstant(ReturnSeries::missing());

    CoverageFilter filter(CoverageParams(12, 0.0));
    CoverageResult result = filter.filter(window, tickerNames(3));

    check(!result.ok(), "single asset is not ok");
    check(result.error == ErrorKind::INSUFFICIENT_UNIVERSE, "insufficient universe");
    check(result.reason == CoverageResult::Reason::TOO_FEW_ASSETS, "too few assets reason");
    check(!result.message.empty(), "message populated");
}

void test_underdetermined_window() {
    Eigen::MatrixXd window = randomReturns(10, 15, 19);
    CoverageFilter filter(CoverageParams(10, 0.0));
    CoverageResult result = filter.filter(window, tickerNames(15));

    check(!result.ok(), "T <= N is flagged");
    check(result.reason == CoverageResult::Reason::UNDERDETERMINED, "underdetermined reason");
    check(result.size() == 15, "eligible set still listed");
}

void test_narrow_keeps_best_covered() {
    Eigen::MatrixXd window = randomReturns(6, 8, 23);
    window(0, 1) = ReturnSeries::missing();
    window(0, 4) = ReturnSeries::missing();
    window(1, 4) = ReturnSeries::missing();

    CoverageFilter filter(CoverageParams(4, 0.5));
    CoverageResult result = filter.filter(window, tickerNames(8));
    check(result.reason == CoverageResult::Reason::UNDERDETERMINED, "8 assets, 6 periods");

    CoverageResult narrowed = CoverageFilter::narrow(result);
    check(narrowed.ok(), "narrowed universe is ok");
    check(narrowed.size() == 5, "periods - 1 assets kept");
    for (const auto& t : narrowed.eligible_tickers) {
        check(t != "T001" && t != "T004", "gappy tickers dropped first");
    }
    check(narrowed.eligible_tickers.front() == "T000", "column order restored");
    check(narrowed.eligible_tickers.back() == "T006", "ties broken by column order");
}

void test_narrow_is_noop_when_ok() {
    Eigen::MatrixXd window = randomReturns(24, 4, 29);
    CoverageFilter filter(CoverageParams(24, 0.0));
    CoverageResult result = filter.filter(window, tickerNames(4));
    CoverageResult narrowed = CoverageFilter::narrow(result);
    check(narrowed.eligible_columns == result.eligible_columns, "unchanged");
}

int main() {
    std::cout << "\n=== Coverage Filter Test Suite ===" << std::endl;
    std::cout << "==================================\n" << std::endl;

    TestReporter reporter;
    reporter.test("Full Coverage", test_full_coverage_all_eligible);
    reporter.test("Five of 36 Missing Excluded", test_five_of_thirty_six_missing_excluded);
    reporter.test("Missing Fraction Threshold", test_missing_fraction_threshold);
    reporter.test("Too Few Assets", test_too_few_assets);
    reporter.test("Underdetermined Window", test_underdetermined_window);
    reporter.test("Narrow Keeps Best Covered", test_narrow_keeps_best_covered);
    reporter.test("Narrow No-op", test_narrow_is_noop_when_ok);

    return reporter.report();
}
