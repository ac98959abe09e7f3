// main.cpp
// Rolling Minimum-Variance Backtester
// Sample vs Ledoit-Wolf covariance, constrained minimum-variance portfolios, monthly rebalancing

#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/exceptions.hpp"
#include "data/csv_return_source.hpp"
#include "engine/rolling_backtest_engine.hpp"
#include "report/result_report.hpp"

using namespace minvar;

// ============================================================================
// Command Line Options
// ============================================================================

struct CliOptions {
    std::string data_file = "data/market_universe_2000_2024.csv";
    std::string output_file;
    BacktestConfig config = BacktestConfig::getDefault();
};

void printUsage(const char* program_name) {
    std::cout << "Rolling Minimum-Variance Backtester\n";
    std::cout << "===================================\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --data FILE          Long-format CSV: date,ticker,return (default: data/market_universe_2000_2024.csv)\n";
    std::cout << "  -s, --tickers A,B,C      Tickers to include (default: every ticker in the file)\n";
    std::cout << "      --start YEAR         First year (default: 2010)\n";
    std::cout << "      --end YEAR           Last year (default: 2024)\n";
    std::cout << "  -w, --window MONTHS      Estimation window (default: 36)\n";
    std::cout << "      --step MONTHS        Months between rebalances (default: 1)\n";
    std::cout << "      --min-weight X       Lower weight bound (default: -1.0)\n";
    std::cout << "      --max-weight X       Upper weight bound (default: 1.0)\n";
    std::cout << "      --long-only          Disallow short positions\n";
    std::cout << "      --rf RATE            Annual risk-free rate (default: 0.042)\n";
    std::cout << "      --min-obs N          Minimum observations per window (default: window)\n";
    std::cout << "      --max-missing X      Maximum missing fraction per window (default: 0.10)\n";
    std::cout << "      --degraded X         Degraded-period rate that raises RunDegraded (default: 0.20)\n";
    std::cout << "      --no-narrow          Keep underdetermined universes instead of narrowing them\n";
    std::cout << "  -j, --threads N          Worker threads for per-period estimation (default: 1)\n";
    std::cout << "  -o, --output FILE        Write the per-period result table as CSV\n";
    std::cout << "      --verbose            Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --data returns.csv --window 36 --rf 0.042\n";
    std::cout << "  " << program_name << " -d returns.csv --long-only --max-weight 0.25 --start 2020 --end 2023\n";
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    size_t start = 0, end;
    while ((end = text.find(',', start)) != std::string::npos) {
        if (end > start) items.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    if (start < text.size()) items.push_back(text.substr(start));
    return items;
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    BacktestConfig& config = options.config;
    bool min_obs_given = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            return false;
        }
        else if ((arg == "-d" || arg == "--data") && has_value) {
            options.data_file = argv[++i];
        }
        else if ((arg == "-s" || arg == "--tickers") && has_value) {
            config.tickers = splitList(argv[++i]);
        }
        else if (arg == "--start" && has_value) {
            config.start_year = std::stoi(argv[++i]);
        }
        else if (arg == "--end" && has_value) {
            config.end_year = std::stoi(argv[++i]);
        }
        else if ((arg == "-w" || arg == "--window") && has_value) {
            config.estimation_window = std::stoul(argv[++i]);
        }
        else if (arg == "--step" && has_value) {
            config.rebalance_step = std::stoul(argv[++i]);
        }
        else if (arg == "--min-weight" && has_value) {
            config.constraints.min_weight = std::stod(argv[++i]);
        }
        else if (arg == "--max-weight" && has_value) {
            config.constraints.max_weight = std::stod(argv[++i]);
        }
        else if (arg == "--long-only") {
            config.constraints.long_only = true;
            config.constraints.allow_short = false;
        }
        else if (arg == "--rf" && has_value) {
            config.risk_free_rate = std::stod(argv[++i]);
        }
        else if (arg == "--min-obs" && has_value) {
            config.coverage.min_observations = std::stoul(argv[++i]);
            min_obs_given = true;
        }
        else if (arg == "--max-missing" && has_value) {
            config.coverage.max_missing_pct = std::stod(argv[++i]);
        }
        else if (arg == "--degraded" && has_value) {
            config.degraded_threshold = std::stod(argv[++i]);
        }
        else if (arg == "--no-narrow") {
            config.narrow_underdetermined_universe = false;
        }
        else if ((arg == "-j" || arg == "--threads") && has_value) {
            config.num_threads = std::stoul(argv[++i]);
        }
        else if ((arg == "-o" || arg == "--output") && has_value) {
            options.output_file = argv[++i];
        }
        else if (arg == "--verbose") {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    if (!min_obs_given) config.matchCoverageToWindow();
    return true;
}

void printConfiguration(const CliOptions& options) {
    const BacktestConfig& c = options.config;
    std::cout << "Configuration:\n";
    std::cout << "  Data file:         " << options.data_file << "\n";
    std::cout << "  Period:            " << c.start_year << "-" << c.end_year << "\n";
    std::cout << "  Estimation window: " << c.estimation_window << " months\n";
    std::cout << "  Weight range:      [" << std::fixed << std::setprecision(2)
              << c.constraints.lowerBound() * 100.0 << "%, "
              << c.constraints.upperBound() * 100.0 << "%]"
              << (c.constraints.long_only ? " long-only" : "") << "\n";
    std::cout << "  Risk-free rate:    " << c.risk_free_rate * 100.0 << "%\n";
    std::cout << "  Coverage:          min " << c.coverage.min_observations << " obs, max "
              << c.coverage.max_missing_pct * 100.0 << "% missing\n";
    if (!c.tickers.empty()) {
        std::cout << "  Tickers:           ";
        for (size_t i = 0; i < c.tickers.size(); ++i) {
            std::cout << c.tickers[i] << (i + 1 < c.tickers.size() ? "," : "");
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        if (!parseArguments(argc, argv, options)) {
            printUsage(argv[0]);
            return (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))
                   ? 0 : 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    printConfiguration(options);

    try {
        CsvReturnSource source(options.data_file);
        RollingBacktestEngine engine(options.config);

        std::cout << "Loading returns from: " << options.data_file << "\n";
        ReturnSeries series = source.load();
        std::cout << "Loaded " << series.numDates() << " months x " << series.numTickers()
                  << " tickers (" << series.countMissing() << " missing observations, "
                  << source.getDuplicatesDropped() << " duplicates dropped)\n";

        std::cout << "Running rolling backtest...\n";
        BacktestReport report = engine.run(series);

        ResultReport text;
        text.addComparison(report);
        text.addSummary(report);
        text.print();

        const auto& stats = engine.getStats();
        std::cout << "\nExecution:\n";
        std::cout << "  Time Elapsed:      " << std::fixed << std::setprecision(3)
                  << stats.runtime_seconds << " seconds\n";
        std::cout << "  Periods Evaluated: " << stats.periods_evaluated << "\n";
        std::cout << "  Worker Threads:    " << stats.threads_used << "\n";

        if (!options.output_file.empty()) {
            writeResultsCsv(report.result, options.output_file);
            std::cout << "Results saved to: " << options.output_file << "\n";
        }
        return 0;

    } catch (const InsufficientUniverseException& e) {
        std::cerr << "\nBacktest Error: " << e.what() << std::endl;
        return 2;
    } catch (const BacktestException& e) {
        std::cerr << "\nBacktest Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
