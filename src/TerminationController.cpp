#include "TerminationController.hpp"
#include "CommonTypes.hpp"
#include "Logger.hpp"
#include "ProcessHandle.hpp"

#include <signal.h>
#include <string>

TerminationController::TerminationController(Logger& logger, RunStatistics& stats,
                                             std::chrono::milliseconds gracePeriod)
    : logger_(logger)
    , stats_(stats)
    , gracePeriod_(gracePeriod)
{}

void TerminationController::terminate(ProcessHandle& proc, bool dueToTimeout) {
    if (proc.poll())
        return;

    logger_.info("Terminating process with PID %d.", int(proc.pid()));
    escalate(proc);

    if (dueToTimeout)
        stats_.timeoutTerminations++;
}

void TerminationController::escalate(ProcessHandle& proc) {
    std::string err;

    if (proc.sendSignal(SIGTERM, err)) {
        logger_.info("Sent termination signal to process.");
        if (proc.waitFor(gracePeriod_)) {
            logger_.info("Process terminated gracefully.");
            return;
        }
        logger_.warn("Process did not terminate in time; killing it.");
    } else {
        logger_.error("Error while terminating process: %s.", err.c_str());
    }

    if (!proc.sendSignal(SIGKILL, err)) {
        logger_.error("Error while killing process: %s.", err.c_str());
        return;
    }
    // SIGKILL считаем всегда действующим, предела ожидания нет
    logger_.warn("Waiting for PID %d to exit after SIGKILL with no time limit.", int(proc.pid()));
    proc.wait();
    logger_.info("Process killed.");
}
