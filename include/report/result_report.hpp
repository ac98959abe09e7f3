// result_report.hpp
// Plain-Text and CSV Rendering of Backtest Reports
// Sample vs Shrinkage comparison table, warnings, and the per-period result table

#pragma once

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../analytics/performance_analyzer.hpp"
#include "../engine/backtest_result.hpp"

namespace minvar {

// ============================================================================
// Comparison Report
// ============================================================================

class ResultReport {
private:
    std::ostringstream report_;

    void addSection(const std::string& title) {
        report_ << "\n" << std::string(70, '=') << "\n";
        report_ << title << "\n";
        report_ << std::string(70, '=') << "\n\n";
    }

    static std::string pct(double value, int precision) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value * 100.0 << "%";
        return ss.str();
    }

    static std::string num(double value, int precision) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        return ss.str();
    }

    void addMetricRow(const std::string& name, const std::string& a, const std::string& b,
                      const std::string& diff) {
        report_ << std::left << std::setw(25) << name << std::setw(14) << a
                << std::setw(14) << b << diff << "\n";
    }

public:
    void addComparison(const BacktestReport& report) {
        auto sample_it = report.performance.find(CovarianceMethod::SAMPLE);
        auto shrink_it = report.performance.find(CovarianceMethod::SHRINKAGE);
        if (sample_it == report.performance.end() || shrink_it == report.performance.end()) {
            addSection("PERFORMANCE");
            for (const auto& [method, m] : report.performance) {
                report_ << toString(method) << ": Sharpe " << num(m.sharpe_ratio, 3)
                        << ", annualized return " << pct(m.annualized_return, 2) << "\n";
            }
            return;
        }

        const PerformanceMetrics& s = sample_it->second;
        const PerformanceMetrics& l = shrink_it->second;

        addSection("PERFORMANCE COMPARISON");
        addMetricRow("METRIC", "SAMPLE", "SHRINKAGE", "DIFFERENCE");
        report_ << std::string(65, '-') << "\n";
        addMetricRow("Total Return", pct(s.total_return, 1), pct(l.total_return, 1),
                     pct(l.total_return - s.total_return, 1));
        addMetricRow("Annualized Return", pct(s.annualized_return, 2), pct(l.annualized_return, 2),
                     pct(l.annualized_return - s.annualized_return, 2));
        addMetricRow("Annualized Volatility", pct(s.annualized_volatility, 2),
                     pct(l.annualized_volatility, 2),
                     pct(l.annualized_volatility - s.annualized_volatility, 2));
        addMetricRow("Sharpe Ratio", num(s.sharpe_ratio, 3), num(l.sharpe_ratio, 3),
                     num(l.sharpe_ratio - s.sharpe_ratio, 3));
        addMetricRow("Sortino Ratio", num(s.sortino_ratio, 3), num(l.sortino_ratio, 3),
                     num(l.sortino_ratio - s.sortino_ratio, 3));
        addMetricRow("Max Drawdown", pct(s.max_drawdown, 2), pct(l.max_drawdown, 2),
                     pct(l.max_drawdown - s.max_drawdown, 2));
        addMetricRow("Win Rate", pct(s.win_rate, 1), pct(l.win_rate, 1),
                     pct(l.win_rate - s.win_rate, 1));
        addMetricRow("Best Month", pct(s.best_month, 2), pct(l.best_month, 2),
                     pct(l.best_month - s.best_month, 2));
        addMetricRow("Worst Month", pct(s.worst_month, 2), pct(l.worst_month, 2),
                     pct(l.worst_month - s.worst_month, 2));
        addMetricRow("Skewness", num(s.skewness, 3), num(l.skewness, 3),
                     num(l.skewness - s.skewness, 3));
        addMetricRow("Kurtosis", num(s.kurtosis, 3), num(l.kurtosis, 3),
                     num(l.kurtosis - s.kurtosis, 3));

        auto t_s = report.turnover.find(CovarianceMethod::SAMPLE);
        auto t_l = report.turnover.find(CovarianceMethod::SHRINKAGE);
        if (t_s != report.turnover.end() && t_l != report.turnover.end()) {
            addMetricRow("Average Turnover", pct(t_s->second.average_turnover, 1),
                         pct(t_l->second.average_turnover, 1),
                         pct(t_l->second.average_turnover - t_s->second.average_turnover, 1));
        }

        MethodComparison c = compareBySharpe("Sample Covariance", s, "Ledoit-Wolf Shrinkage", l);
        report_ << "\nWINNER: " << c.winner << " (+" << num(std::abs(c.improvement_pct), 1)
                << "% Sharpe improvement)\n";
    }

    void addSummary(const BacktestReport& report) {
        addSection("BACKTEST SUMMARY");
        const auto& rows = report.result.rows();
        report_ << "Valid tickers used:     " << report.final_tickers.size() << "\n";
        report_ << "Rows recorded:          " << rows.size() << "\n";
        if (!rows.empty()) {
            report_ << "Date range:             " << rows.front().date.toString() << " to "
                    << rows.back().date.toString() << "\n";
        }
        for (const auto& [method, m] : report.performance) {
            report_ << "Periods (" << std::left << std::setw(9) << toString(method) << "):    "
                    << m.num_periods << ", degraded " << report.result.degradedCount(method) << "\n";
        }

        if (!report.result.warnings().empty()) {
            report_ << "\nWarnings:\n";
            for (const auto& w : report.result.warnings()) {
                report_ << "  [" << toString(w.kind) << "] " << w.message << "\n";
            }
        }
    }

    std::string getReport() const {
        return report_.str();
    }

    void print() const {
        std::cout << getReport();
    }
};

// ============================================================================
// CSV Export of the Result Table (one row per date x method x ticker)
// ============================================================================

inline void writeResultsCsv(const BacktestResult& result, std::ostream& out) {
    out << "date,method,ticker,weight,realized_return,turnover,degraded,error,"
           "shrinkage_intensity,eligible_count\n";
    out << std::setprecision(10);
    for (const auto& row : result.rows()) {
        for (size_t i = 0; i < row.weights.size(); ++i) {
            out << row.date.toString() << ',' << toString(row.method) << ','
                << row.weights.tickers[i] << ','
                << row.weights.weights(static_cast<Eigen::Index>(i)) << ','
                << row.realized_return << ',' << row.turnover << ','
                << (row.degraded ? 1 : 0) << ',' << toString(row.error) << ','
                << row.shrinkage_intensity << ',' << row.eligible_count << "\n";
        }
    }
}

inline void writeResultsCsv(const BacktestResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw DataException("Failed to open output file: " + path);
    }
    writeResultsCsv(result, file);
}

} // namespace minvar
