#include "CommandLine.hpp"
#include "CommonTypes.hpp"
#include "Logger.hpp"
#include "ProcessMonitor.hpp"
#include "Signals.hpp"

#include <cstdio>
#include <string>

// procmonitor --command="ping example.com" --logfile=output.log --restart --timeout=60
int main(int argc, char* argv[]) {
    ProcessConfig config;
    std::string err;

    if (!parseArgs(argc, argv, config, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        printUsage(argv[0]);
        return 1;
    }

    // Единственный лог сеанса; дальше передаётся по ссылке
    Logger logger(config.logfile);
    if (!logger.open(err)) {
        std::fprintf(stderr, "Cannot open logfile: %s\n", err.c_str());
        return 1;
    }
    logger.setLevel(config.debug ? Logger::Level::Debug : Logger::Level::Info);

    if (!installSignalHandlers(err)) {
        logger.error("%s", err.c_str());
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }

    ProcessMonitor monitor(config, logger);
    return monitor.run();
}
