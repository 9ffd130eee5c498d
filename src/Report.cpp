#include "Report.hpp"
#include "CommonTypes.hpp"
#include "Logger.hpp"

#include <cstdio>

std::string formatReport(const RunStatistics& stats) {
    char buf[512];
    std::snprintf(buf, sizeof(buf),
        "\n=== Process Monitoring Report ===\n"
        "Total runtime: %.2f seconds\n"
        "Restarts: %zu\n"
        "Terminations due to timeout: %zu\n"
        "Crashes: %zu\n"
        "Total lines logged: %zu\n"
        "=================================\n",
        stats.totalRuntime,
        stats.restarts.load(),
        stats.timeoutTerminations.load(),
        stats.crashes.load(),
        stats.linesLogged.load());
    return buf;
}

void generateReport(Logger& logger, const RunStatistics& stats) {
    logger.info("%s", formatReport(stats).c_str());
}
