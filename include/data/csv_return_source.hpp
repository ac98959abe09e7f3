// csv_return_source.hpp
// CSV Return Source for the Rolling Minimum-Variance Backtester
// Loads long-format monthly returns (date,ticker,return[,...]) into a ReturnSeries

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <Eigen/Dense>
#include "../interfaces/return_source.hpp"
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "return_series.hpp"

namespace minvar {

// ============================================================================
// CSV Return Source for Historical Monthly Returns
// ============================================================================

class CsvReturnSource : public IReturnSource {
public:
    struct CsvConfig {
        char delimiter;
        std::string date_column;
        std::string ticker_column;
        std::string return_column;

        CsvConfig()
            : delimiter(',')
            , date_column("date")
            , ticker_column("ticker")
            , return_column("return") {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

private:
    std::string filepath_;
    CsvConfig config_;
    std::vector<std::string> tickers_;
    size_t duplicates_dropped_ = 0;
    size_t rows_parsed_ = 0;

    static std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n\"");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n\"");
        return s.substr(first, last - first + 1);
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> splitLine(const std::string& line) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, config_.delimiter)) {
            tokens.push_back(trim(token));
        }
        // Trailing delimiter means a trailing empty field
        if (!line.empty() && line.back() == config_.delimiter) tokens.push_back("");
        return tokens;
    }

    static Date parseDate(const std::string& text) {
        // YYYY-MM-DD, optionally followed by a time component
        int y = 0, m = 0, d = 0;
        if (std::sscanf(text.c_str(), "%d-%d-%d", &y, &m, &d) != 3) {
            throw DataException("Unparseable date: '" + text + "'");
        }
        Date date(y, m, d);
        if (!date.valid()) throw DataException("Invalid date: '" + text + "'");
        return date;
    }

    static bool isMissingToken(const std::string& token) {
        std::string t = lower(token);
        return t.empty() || t == "nan" || t == "na" || t == "null" || t == "none";
    }

    static size_t findColumn(const std::vector<std::string>& header, const std::string& name) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (lower(header[i]) == lower(name)) return i;
        }
        throw DataException("CSV header is missing column '" + name + "'");
    }

public:
    explicit CsvReturnSource(std::string filepath)
        : filepath_(std::move(filepath)), config_(CsvConfig::getDefault()) {}

    CsvReturnSource(std::string filepath, const CsvConfig& config)
        : filepath_(std::move(filepath)), config_(config) {}

    ReturnSeries load() override {
        std::ifstream file(filepath_);
        if (!file.is_open()) {
            throw DataException("Failed to open CSV file: " + filepath_);
        }
        return parse(file);
    }

    // Parsing is separated from file access so streams can be fed directly
    ReturnSeries parse(std::istream& in) {
        std::string line;
        if (!std::getline(in, line)) {
            throw DataException("Empty CSV input: " + filepath_);
        }

        auto header = splitLine(line);
        size_t date_col = findColumn(header, config_.date_column);
        size_t ticker_col = findColumn(header, config_.ticker_column);
        size_t return_col = findColumn(header, config_.return_column);
        size_t needed = std::max(date_col, std::max(ticker_col, return_col)) + 1;

        std::map<int, Date> dates;  // keyed by calendar month, sorted
        std::set<std::string> ticker_set;
        std::map<std::pair<int, std::string>, double> cells;

        duplicates_dropped_ = 0;
        rows_parsed_ = 0;
        size_t line_num = 1;
        while (std::getline(in, line)) {
            ++line_num;
            if (trim(line).empty()) continue;

            auto tokens = splitLine(line);
            if (tokens.size() < needed) {
                throw DataException("Invalid CSV format at line " + std::to_string(line_num));
            }

            Date date;
            double value = ReturnSeries::missing();
            try {
                date = parseDate(tokens[date_col]);
                if (!isMissingToken(tokens[return_col])) {
                    const std::string& token = tokens[return_col];
                    size_t consumed = 0;
                    value = std::stod(token, &consumed);
                    if (consumed != token.size()) {
                        throw std::invalid_argument("trailing characters in return '" + token + "'");
                    }
                }
            } catch (const std::exception& e) {
                throw DataException("Error parsing line " + std::to_string(line_num) + ": " + e.what());
            }

            const std::string& ticker = tokens[ticker_col];
            if (ticker.empty()) {
                throw DataException("Missing ticker at line " + std::to_string(line_num));
            }

            // One row per month; the latest day seen labels the row
            auto slot = dates.emplace(date.monthKey(), date).first;
            if (slot->second < date) slot->second = date;
            ticker_set.insert(ticker);
            // First occurrence of a (month, ticker) pair wins
            if (!cells.emplace(std::make_pair(date.monthKey(), ticker), value).second) {
                ++duplicates_dropped_;
            }
            ++rows_parsed_;
        }

        if (cells.empty()) {
            throw DataException("No return rows loaded from: " + filepath_);
        }

        std::vector<Date> date_list;
        std::unordered_map<int, Eigen::Index> row_of;
        for (const auto& [month, date] : dates) {
            row_of[month] = static_cast<Eigen::Index>(date_list.size());
            date_list.push_back(date);
        }

        tickers_.clear();
        std::unordered_map<std::string, Eigen::Index> col_of;
        for (const auto& ticker : ticker_set) {
            col_of[ticker] = static_cast<Eigen::Index>(tickers_.size());
            tickers_.push_back(ticker);
        }

        Eigen::MatrixXd matrix = Eigen::MatrixXd::Constant(
            static_cast<Eigen::Index>(date_list.size()),
            static_cast<Eigen::Index>(tickers_.size()),
            ReturnSeries::missing());
        for (const auto& [key, value] : cells) {
            matrix(row_of.at(key.first), col_of.at(key.second)) = value;
        }

        return ReturnSeries(std::move(date_list), tickers_, std::move(matrix));
    }

    std::vector<std::string> getTickers() const override {
        return tickers_;
    }

    std::string describe() const override {
        return "CsvReturnSource(" + filepath_ + ")";
    }

    size_t getDuplicatesDropped() const { return duplicates_dropped_; }
    size_t getRowsParsed() const { return rows_parsed_; }
};

} // namespace minvar
