#include <catch2/catch.hpp>
#include <string>
#include "CommonTypes.hpp"
#include "Logger.hpp"
#include "Report.hpp"
#include "TestUtils.hpp"
// -------------------------------------------------------------------------
TEST_CASE("Report: layout and two-decimal runtime", "[report]")
{
    RunStatistics stats;
    stats.totalRuntime = 12.3456;
    stats.restarts = 2;
    stats.timeoutTerminations = 1;
    stats.crashes = 3;
    stats.linesLogged = 42;

    REQUIRE(formatReport(stats) ==
        "\n=== Process Monitoring Report ===\n"
        "Total runtime: 12.35 seconds\n"
        "Restarts: 2\n"
        "Terminations due to timeout: 1\n"
        "Crashes: 3\n"
        "Total lines logged: 42\n"
        "=================================\n");
}
// -------------------------------------------------------------------------
TEST_CASE("Report: zero runtime keeps two decimals", "[report]")
{
    RunStatistics stats;
    std::string report = formatReport(stats);
    REQUIRE(report.find("Total runtime: 0.00 seconds\n") != std::string::npos);
    REQUIRE(report.find("Total lines logged: 0\n") != std::string::npos);
}
// -------------------------------------------------------------------------
TEST_CASE("Report: written to the log as one INFO record", "[report]")
{
    TempLog tmp;
    Logger logger(tmp.path());
    std::string err;
    REQUIRE(logger.open(err));

    RunStatistics stats;
    stats.totalRuntime = 0.5;
    generateReport(logger, stats);

    auto lines = readLines(tmp.path());
    REQUIRE(lines.size() == 9);
    REQUIRE(lines[0].find(" - INFO - ") != std::string::npos);
    REQUIRE(lines[1] == "=== Process Monitoring Report ===");
    REQUIRE(lines[2] == "Total runtime: 0.50 seconds");
    REQUIRE(lines[7] == "=================================");
    REQUIRE(lines[8].empty());
}
