// test_csv_return_source.cpp
// Unit tests for long-format CSV loading and ReturnSeries slicing

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include "test_reporter.hpp"
#include "../include/data/csv_return_source.hpp"

using namespace minvar;
using namespace minvar::testing;

void test_parse_long_format() {
    std::istringstream in(
        "date,ticker,return\n"
        "2020-01-31,MSFT,0.02\n"
        "2020-01-31,AAPL,0.01\n"
        "2020-02-29,AAPL,-0.03\n"
        "2020-02-29,MSFT,0.04\n");

    CsvReturnSource source("memory");
    ReturnSeries series = source.parse(in);

    check(series.numDates() == 2, "two dates");
    check(series.numTickers() == 2, "two tickers");
    check(series.tickers()[0] == "AAPL", "tickers sorted");
    check(series.dateAt(1) == Date(2020, 2, 29), "dates sorted");
    checkNear(series.at(0, 1), 0.02, 0.0, "MSFT January");
    checkNear(series.at(1, 0), -0.03, 0.0, "AAPL February");
    check(source.getRowsParsed() == 4, "rows parsed");
    check(source.getTickers().size() == 2, "tickers exposed");
}

void test_header_any_order_and_case() {
    std::istringstream in(
        "Ticker,Adj,RETURN,Date\n"
        "AAA,1,0.01,2021-03-31\n"
        "BBB,1,0.02,2021-03-31 00:00:00\n");

    CsvReturnSource source("memory");
    ReturnSeries series = source.parse(in);
    check(series.numTickers() == 2, "extra columns ignored");
    checkNear(series.at(0, 1), 0.02, 0.0, "return column located by name");
}

void test_missing_values() {
    std::istringstream in(
        "date,ticker,return\n"
        "2020-01-31,AAA,0.01\n"
        "2020-01-31,BBB,NaN\n"
        "2020-02-29,AAA,\n"
        "2020-02-29,BBB,0.02\n"
        "2020-03-31,AAA,0.03\n");

    CsvReturnSource source("memory");
    ReturnSeries series = source.parse(in);
    check(ReturnSeries::isMissing(series.at(0, 1)), "NaN token");
    check(ReturnSeries::isMissing(series.at(1, 0)), "empty token");
    check(ReturnSeries::isMissing(series.at(2, 1)), "absent row");
    check(series.countMissing() == 3, "three gaps");
}

void test_duplicates_keep_first() {
    std::istringstream in(
        "date,ticker,return\n"
        "2020-01-31,AAA,0.01\n"
        "2020-01-31,AAA,0.99\n"
        "2020-01-31,BBB,0.02\n");

    CsvReturnSource source("memory");
    ReturnSeries series = source.parse(in);
    checkNear(series.at(0, 0), 0.01, 0.0, "first occurrence wins");
    check(source.getDuplicatesDropped() == 1, "duplicate counted");
}

void test_mixed_days_share_month() {
    std::istringstream in(
        "date,ticker,return\n"
        "2020-01-30,AAA,0.01\n"
        "2020-01-31,BBB,0.02\n"
        "2020-02-28,AAA,0.03\n"
        "2020-02-28,BBB,0.04\n"
        "2020-02-29,AAA,0.99\n");

    CsvReturnSource source("memory");
    ReturnSeries series = source.parse(in);

    check(series.numDates() == 2, "one row per calendar month");
    check(series.dateAt(0) == Date(2020, 1, 31), "latest day labels the month");
    checkNear(series.at(0, 0), 0.01, 0.0, "AAA January");
    checkNear(series.at(0, 1), 0.02, 0.0, "BBB January on a different day");
    check(series.countMissing() == 0, "no gaps from day mismatch");
    checkNear(series.at(1, 0), 0.03, 0.0, "first February value for AAA kept");
    check(source.getDuplicatesDropped() == 1, "second AAA February row is a duplicate");
}

void test_malformed_input() {
    CsvReturnSource source("memory");

    std::istringstream no_header("date,symbol,return\n2020-01-31,AAA,0.01\n");
    checkThrows<DataException>([&]() { source.parse(no_header); }, "missing ticker column");

    std::istringstream bad_date("date,ticker,return\n2020-13-31,AAA,0.01\n");
    checkThrows<DataException>([&]() { source.parse(bad_date); }, "month 13");

    std::istringstream bad_value("date,ticker,return\n2020-01-31,AAA,abc\n");
    checkThrows<DataException>([&]() { source.parse(bad_value); }, "non-numeric return");

    std::istringstream trailing("date,ticker,return\n2020-01-31,AAA,0.01abc\n");
    checkThrows<DataException>([&]() { source.parse(trailing); }, "trailing characters after number");

    std::istringstream percent("date,ticker,return\n2020-01-31,AAA,1.5%\n");
    checkThrows<DataException>([&]() { source.parse(percent); }, "percent suffix");

    std::istringstream empty("");
    checkThrows<DataException>([&]() { source.parse(empty); }, "empty input");

    std::istringstream header_only("date,ticker,return\n");
    checkThrows<DataException>([&]() { source.parse(header_only); }, "no rows");

    CsvReturnSource missing_file("/nonexistent/returns.csv");
    checkThrows<DataException>([&]() { missing_file.load(); }, "missing file");
}

void test_load_from_file() {
    const std::string path = "test_csv_return_source.tmp.csv";
    {
        std::ofstream out(path);
        out << "date,ticker,return\n2022-01-31,AAA,0.01\n2022-01-31,BBB,0.02\n";
    }
    CsvReturnSource source(path);
    ReturnSeries series = source.load();
    std::remove(path.c_str());

    check(series.numDates() == 1 && series.numTickers() == 2, "file loaded");
    check(source.describe().find(path) != std::string::npos, "describe names the file");
}

void test_slice_and_select() {
    ReturnSeries series = randomSeries(2018, 48, 4, 3);

    ReturnSeries ranged = series.sliceYears(2019, 2020);
    check(ranged.numDates() == 24, "two calendar years");
    check(ranged.dateAt(0).year == 2019, "starts in 2019");
    checkThrows<DataException>([&]() { series.sliceYears(2021, 2019); }, "inverted range");

    ReturnSeries picked = series.selectTickers({"T003", "ZZZ", "T001", "T003"});
    check(picked.numTickers() == 2, "unknown and duplicate names skipped");
    check(picked.tickers()[0] == "T003", "request order kept");
    checkNear(picked.at(5, 1), series.at(5, 1), 0.0, "column values carried");
}

void test_series_validation() {
    Eigen::MatrixXd values = Eigen::MatrixXd::Zero(2, 2);
    std::vector<Date> dates = {Date(2020, 2, 29), Date(2020, 1, 31)};
    checkThrows<DataException>([&]() { ReturnSeries s(dates, {"A", "B"}, values); }, "unordered dates");
    checkThrows<DataException>([&]() { ReturnSeries s(monthlyDates(2020, 2), {"A", "A"}, values); },
                               "duplicate tickers");
    checkThrows<DataException>([&]() { ReturnSeries s(monthlyDates(2020, 3), {"A", "B"}, values); },
                               "shape mismatch");
}

int main() {
    std::cout << "\n=== CSV Return Source Test Suite ===" << std::endl;
    std::cout << "====================================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Parsing:" << std::endl;
    reporter.test("Long Format", test_parse_long_format);
    reporter.test("Header Order and Case", test_header_any_order_and_case);
    reporter.test("Missing Values", test_missing_values);
    reporter.test("Duplicates Keep First", test_duplicates_keep_first);
    reporter.test("Mixed Days Share Month", test_mixed_days_share_month);
    reporter.test("Malformed Input", test_malformed_input);
    reporter.test("Load From File", test_load_from_file);

    std::cout << "\nReturn Series:" << std::endl;
    reporter.test("Slice and Select", test_slice_and_select);
    reporter.test("Validation", test_series_validation);

    return reporter.report();
}
