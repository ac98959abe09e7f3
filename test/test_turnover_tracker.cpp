// test_turnover_tracker.cpp
// Unit tests for rebalance turnover

#include <iostream>
#include "test_reporter.hpp"
#include "../include/analytics/turnover_tracker.hpp"

using namespace minvar;
using namespace minvar::testing;

static WeightVector weights(std::vector<std::string> names, std::vector<double> values) {
    Eigen::VectorXd w(static_cast<Eigen::Index>(values.size()));
    for (size_t i = 0; i < values.size(); ++i) w(static_cast<Eigen::Index>(i)) = values[i];
    return WeightVector(std::move(names), w);
}

void test_identical_vectors() {
    WeightVector a = weights({"A", "B", "C"}, {0.2, 0.3, 0.5});
    checkNear(TurnoverTracker::turnover(a, a), 0.0, 0.0, "no change, no turnover");
}

void test_simple_shift() {
    WeightVector a = weights({"A", "B"}, {0.6, 0.4});
    WeightVector b = weights({"A", "B"}, {0.5, 0.5});
    checkNear(TurnoverTracker::turnover(a, b), 0.2, 1e-15, "0.1 sold plus 0.1 bought");
}

void test_long_only_bounded_by_two() {
    WeightVector a = weights({"A", "B", "C"}, {1.0, 0.0, 0.0});
    WeightVector b = weights({"A", "B", "C"}, {0.0, 0.5, 0.5});
    checkNear(TurnoverTracker::turnover(a, b), 2.0, 1e-15, "full rotation");

    std::mt19937 rng(5);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    for (int trial = 0; trial < 100; ++trial) {
        Eigen::VectorXd x(4), y(4);
        for (int i = 0; i < 4; ++i) { x(i) = u(rng); y(i) = u(rng); }
        WeightVector p(tickerNames(4), x / x.sum());
        WeightVector q(tickerNames(4), y / y.sum());
        check(TurnoverTracker::turnover(p, q) <= 2.0 + 1e-12, "long-only turnover <= 2");
    }
}

void test_ticker_enters_and_leaves() {
    WeightVector before = weights({"A", "B"}, {0.5, 0.5});
    WeightVector after = weights({"B", "C"}, {0.5, 0.5});
    // A: 0.5 -> 0, B unchanged, C: 0 -> 0.5
    checkNear(TurnoverTracker::turnover(before, after), 1.0, 1e-15, "union of tickers");
}

void test_order_independent() {
    WeightVector a = weights({"A", "B", "C"}, {0.2, 0.3, 0.5});
    WeightVector b = weights({"C", "A", "B"}, {0.5, 0.2, 0.3});
    checkNear(TurnoverTracker::turnover(a, b), 0.0, 0.0, "matched by ticker");
}

void test_summary() {
    TurnoverTracker tracker;
    tracker.record(0.2);
    tracker.record(0.6);
    tracker.record(0.1);

    TurnoverSummary s = tracker.summary();
    check(s.num_rebalances == 3, "count");
    checkNear(s.total_turnover, 0.9, 1e-15, "total");
    checkNear(s.average_turnover, 0.3, 1e-15, "average");
    checkNear(s.max_turnover, 0.6, 0.0, "max");
    check(tracker.history().size() == 3, "history kept");

    tracker.reset();
    check(tracker.summary().num_rebalances == 0, "reset");
    checkNear(tracker.summary().average_turnover, 0.0, 0.0, "empty average");
}

int main() {
    std::cout << "\n=== Turnover Tracker Test Suite ===" << std::endl;
    std::cout << "===================================\n" << std::endl;

    TestReporter reporter;
    reporter.test("Identical Vectors", test_identical_vectors);
    reporter.test("Simple Shift", test_simple_shift);
    reporter.test("Long-Only Bounded By Two", test_long_only_bounded_by_two);
    reporter.test("Ticker Enters and Leaves", test_ticker_enters_and_leaves);
    reporter.test("Order Independent", test_order_independent);
    reporter.test("Summary", test_summary);

    return reporter.report();
}
