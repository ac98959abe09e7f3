// rolling_backtest_engine.hpp
// Rolling-Window Backtest Engine for the Rolling Minimum-Variance Backtester
// COLLECT_WINDOW -> FILTER_COVERAGE -> ESTIMATE_COVARIANCE -> OPTIMIZE -> REALIZE_RETURN -> RECORD

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>
#include <Eigen/Dense>
#include "../core/config.hpp"
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../data/return_series.hpp"
#include "../interfaces/return_source.hpp"
#include "../risk/coverage_filter.hpp"
#include "../risk/covariance_estimator.hpp"
#include "../optimizer/min_variance_optimizer.hpp"
#include "../analytics/performance_analyzer.hpp"
#include "../analytics/turnover_tracker.hpp"
#include "backtest_result.hpp"

namespace minvar {

// ============================================================================
// Rolling Backtest Engine
// ============================================================================

class RollingBacktestEngine {
public:
    struct EngineStats {
        size_t periods_evaluated = 0;
        size_t rows_recorded = 0;
        size_t degraded_rows = 0;
        size_t skipped_periods = 0;
        size_t narrowed_periods = 0;
        size_t threads_used = 1;
        double runtime_seconds = 0.0;
    };

private:
    // Per-method output of the parallelizable stage
    struct MethodOutcome {
        CovarianceMethod method = CovarianceMethod::SAMPLE;
        WeightVector weights;
        double diagnostic = 0.0;
        double condition_number = 0.0;
        ErrorKind error = ErrorKind::NONE;
        bool degraded = false;
        std::string message;
    };

    struct PeriodOutcome {
        size_t row = 0;                     // Evaluation row t
        CoverageResult coverage;
        bool skipped = false;
        bool fatal = false;
        bool narrowed = false;
        std::string note;
        std::vector<MethodOutcome> methods;
        std::exception_ptr failure;
    };

    BacktestConfig config_;
    MinVarianceOptimizer optimizer_;
    CoverageFilter coverage_filter_;
    EngineStats stats_;

    void warn(BacktestResult& result, RunWarning::Kind kind, const Date& date,
              const std::string& message) const {
        std::cerr << "[Engine] WARNING: " << message << std::endl;
        result.addWarning({kind, date, message});
    }

    // Date range, ticker selection and history checks; everything here is fatal
    ReturnSeries prepareUniverse(const ReturnSeries& series, BacktestResult& result) const {
        if (series.empty()) {
            throw DataException("Return series is empty");
        }

        ReturnSeries ranged = series.sliceYears(config_.start_year, config_.end_year);

        if (!config_.tickers.empty()) {
            for (const auto& ticker : config_.tickers) {
                if (ranged.indexOf(ticker) < 0) {
                    warn(result, RunWarning::Kind::UNKNOWN_TICKER, Date(),
                         "Ticker " + ticker + " not present in return series; dropped");
                }
            }
            ranged = ranged.selectTickers(config_.tickers);
        }

        if (ranged.numTickers() < 2) {
            throw DataException("At least 2 tickers are required, found " +
                                std::to_string(ranged.numTickers()));
        }
        if (ranged.numTickers() > config_.max_universe) {
            throw DataException("Universe of " + std::to_string(ranged.numTickers()) +
                                " tickers exceeds max_universe " +
                                std::to_string(config_.max_universe));
        }
        if (ranged.numDates() <= config_.estimation_window) {
            throw DataException("Insufficient history: " + std::to_string(ranged.numDates()) +
                                " months in " + std::to_string(config_.start_year) + "-" +
                                std::to_string(config_.end_year) + ", estimation window of " +
                                std::to_string(config_.estimation_window) +
                                " needs at least " + std::to_string(config_.estimation_window + 1));
        }
        return ranged;
    }

    // Pure function of (series, t): reads rows [t - W, t - 1] only
    PeriodOutcome computePeriod(const ReturnSeries& series, size_t t, bool first_window) const {
        PeriodOutcome out;
        out.row = t;

        const size_t W = config_.estimation_window;
        const Eigen::MatrixXd window = series.values().block(
            static_cast<Eigen::Index>(t - W), 0,
            static_cast<Eigen::Index>(W), series.values().cols());

        out.coverage = coverage_filter_.filter(window, series.tickers());

        if (!out.coverage.ok()) {
            bool underdetermined = out.coverage.reason == CoverageResult::Reason::UNDERDETERMINED;
            if (underdetermined && !config_.narrow_underdetermined_universe) {
                // Carried forward; the sample estimator reports it as SingularCovariance
            } else if (first_window) {
                out.fatal = true;
                out.note = out.coverage.message;
                return out;
            } else if (underdetermined) {
                CoverageResult narrowed = CoverageFilter::narrow(out.coverage);
                out.note = out.coverage.message + "; narrowed to " +
                           std::to_string(narrowed.size()) + " assets";
                out.coverage = narrowed;
                out.narrowed = true;
                if (!narrowed.ok()) {
                    out.skipped = true;
                    out.note += " (" + narrowed.message + "); period skipped";
                    return out;
                }
            } else {
                out.skipped = true;
                out.note = out.coverage.message + "; period skipped";
                return out;
            }
        }

        const Eigen::MatrixXd sample = completeWindow(window, out.coverage.eligible_columns);

        for (CovarianceMethod method : config_.methods) {
            MethodOutcome m;
            m.method = method;

            CovarianceEstimate estimate = estimateCovariance(method, sample);
            m.diagnostic = estimate.diagnostic;
            m.condition_number = estimate.condition_number;

            if (!estimate.ok()) {
                m.error = estimate.error;
                m.message = std::string(toString(method)) + " covariance is singular";
            } else {
                OptimizationResult solved = optimizer_.optimize(estimate.matrix, config_.constraints);
                if (solved.ok()) {
                    m.weights = WeightVector(out.coverage.eligible_tickers, solved.weights);
                } else {
                    m.error = solved.error;
                    m.message = solved.message;
                }
            }

            if (m.error != ErrorKind::NONE) {
                m.weights = WeightVector::equalWeight(out.coverage.eligible_tickers);
                m.degraded = true;
            }
            out.methods.push_back(std::move(m));
        }
        return out;
    }

    void computeRemaining(const ReturnSeries& series, std::vector<PeriodOutcome>& outcomes,
                          const std::vector<size_t>& periods) {
        const size_t n = periods.size();
        const size_t workers = std::min(config_.num_threads, n > 1 ? n - 1 : size_t(1));
        stats_.threads_used = std::max<size_t>(1, workers);

        if (workers <= 1) {
            for (size_t i = 1; i < n; ++i) {
                outcomes[i] = computePeriod(series, periods[i], false);
            }
            return;
        }

        std::atomic<size_t> next{1};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t k = 0; k < workers; ++k) {
            pool.emplace_back([&]() {
                for (;;) {
                    size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= n) break;
                    try {
                        outcomes[i] = computePeriod(series, periods[i], false);
                    } catch (...) {
                        // Rethrown in order by the serialized pass
                        outcomes[i].failure = std::current_exception();
                    }
                }
            });
        }
        for (auto& th : pool) th.join();
    }

public:
    explicit RollingBacktestEngine(const BacktestConfig& config)
        : RollingBacktestEngine(config, MinVarianceOptimizer::OptimizerConfig::getDefault()) {}

    RollingBacktestEngine(const BacktestConfig& config,
                          const MinVarianceOptimizer::OptimizerConfig& optimizer_config)
        : config_(config)
        , optimizer_(optimizer_config)
        , coverage_filter_(config.coverage) {
        config_.validate();
    }

    const BacktestConfig& config() const { return config_; }
    const EngineStats& getStats() const { return stats_; }

    BacktestReport run(IReturnSource& source) {
        ReturnSeries series = source.load();
        return run(series);
    }

    BacktestReport run(const ReturnSeries& input) {
        auto start_time = std::chrono::high_resolution_clock::now();
        stats_ = EngineStats();

        BacktestReport report;
        report.risk_free_rate = config_.risk_free_rate;
        BacktestResult& result = report.result;

        const ReturnSeries series = prepareUniverse(input, result);
        report.final_tickers = series.tickers();

        const size_t W = config_.estimation_window;
        const size_t T = series.numDates();
        std::vector<size_t> periods;
        for (size_t t = W; t < T; t += config_.rebalance_step) periods.push_back(t);

        if (config_.verbose) {
            std::cout << "[Engine] " << series.numTickers() << " tickers, " << T << " months ("
                      << series.dateAt(0).toString() << " to " << series.dateAt(T - 1).toString()
                      << "), " << periods.size() << " rebalances" << std::endl;
        }

        std::vector<PeriodOutcome> outcomes(periods.size());
        outcomes[0] = computePeriod(series, periods[0], true);
        if (outcomes[0].fatal) {
            throw InsufficientUniverseException("first window ending " +
                                                series.dateAt(periods[0] - 1).toString() +
                                                ": " + outcomes[0].note);
        }
        computeRemaining(series, outcomes, periods);

        // Serialized pass: turnover needs the previous recorded weights of the same method
        std::map<CovarianceMethod, WeightVector> previous;
        std::map<CovarianceMethod, TurnoverTracker> trackers;
        size_t missing_realized_total = 0;

        for (auto& outcome : outcomes) {
            if (outcome.failure) std::rethrow_exception(outcome.failure);
            ++stats_.periods_evaluated;

            const Date& date = series.dateAt(outcome.row);
            if (outcome.narrowed) ++stats_.narrowed_periods;
            if (!outcome.note.empty()) {
                warn(result, RunWarning::Kind::INSUFFICIENT_UNIVERSE, date,
                     date.toString() + ": " + outcome.note);
            }
            if (outcome.skipped) {
                ++stats_.skipped_periods;
                continue;
            }

            for (auto& m : outcome.methods) {
                BacktestRow row;
                row.date = date;
                row.method = m.method;
                row.degraded = m.degraded;
                row.error = m.error;
                row.error_message = m.message;
                row.shrinkage_intensity = m.diagnostic;
                row.condition_number = m.condition_number;
                row.eligible_count = m.weights.size();
                row.narrowed = outcome.narrowed;
                row.weights = m.weights;

                // Held from t until the next rebalance; weights estimated strictly before t
                const size_t hold_end = std::min(outcome.row + config_.rebalance_step, T);
                double growth = 1.0;
                double realized = 0.0;
                for (size_t s = outcome.row; s < hold_end; ++s) {
                    double month = 0.0;
                    for (size_t i = 0; i < m.weights.size(); ++i) {
                        double r = series.at(s, outcome.coverage.eligible_columns[i]);
                        if (ReturnSeries::isMissing(r)) {
                            ++row.missing_realized;
                            continue;
                        }
                        month += m.weights.weights(static_cast<Eigen::Index>(i)) * r;
                    }
                    if (hold_end - outcome.row == 1) {
                        realized = month;
                    } else {
                        growth *= (1.0 + month);
                        realized = growth - 1.0;
                    }
                }
                row.realized_return = realized;
                missing_realized_total += row.missing_realized;

                auto prev = previous.find(m.method);
                if (prev != previous.end()) {
                    row.turnover = TurnoverTracker::turnover(prev->second, m.weights);
                    trackers[m.method].record(row.turnover);
                }
                previous[m.method] = m.weights;

                if (config_.verbose) {
                    std::cout << "[Engine] " << date.toString() << " " << toString(m.method)
                              << " eligible=" << row.eligible_count
                              << " lambda=" << row.shrinkage_intensity
                              << " return=" << row.realized_return
                              << " turnover=" << row.turnover
                              << (row.degraded ? std::string(" DEGRADED (") + toString(row.error) + ")" : "")
                              << std::endl;
                }

                if (row.degraded) ++stats_.degraded_rows;
                ++stats_.rows_recorded;
                result.append(std::move(row));
            }
        }

        if (missing_realized_total > 0) {
            warn(result, RunWarning::Kind::MISSING_REALIZED_RETURN, Date(),
                 std::to_string(missing_realized_total) +
                 " realized returns were missing at evaluation dates and counted as zero");
        }

        for (CovarianceMethod method : config_.methods) {
            double rate = result.degradedRate(method);
            if (rate > config_.degraded_threshold) {
                warn(result, RunWarning::Kind::RUN_DEGRADED, Date(),
                     std::string("RunDegraded: ") + toString(method) + " fell back to equal weight in " +
                     std::to_string(result.degradedCount(method)) + " periods (" +
                     std::to_string(rate * 100.0) + "% > " +
                     std::to_string(config_.degraded_threshold * 100.0) + "%)");
            }
            report.performance[method] =
                PerformanceAnalyzer::analyze(result.returnsFor(method), config_.risk_free_rate,
                                             PerformanceAnalyzer::PERIODS_PER_YEAR /
                                             static_cast<double>(config_.rebalance_step));
            report.turnover[method] = trackers[method].summary();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        stats_.runtime_seconds = std::chrono::duration<double>(end_time - start_time).count();

        if (config_.verbose) {
            std::cout << "[Engine] " << stats_.rows_recorded << " rows recorded, "
                      << stats_.degraded_rows << " degraded, " << stats_.skipped_periods
                      << " skipped in " << stats_.runtime_seconds << "s" << std::endl;
        }
        return report;
    }
};

} // namespace minvar
