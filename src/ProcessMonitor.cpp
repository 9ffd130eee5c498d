#include "ProcessMonitor.hpp"
#include "Logger.hpp"
#include "OutputRelay.hpp"
#include "ProcessHandle.hpp"
#include "Report.hpp"
#include "Signals.hpp"
#include "TimeoutWatchdog.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

ProcessMonitor::ProcessMonitor(const ProcessConfig& config, Logger& logger)
    : ProcessMonitor(config, logger, Options{})
{}

ProcessMonitor::ProcessMonitor(const ProcessConfig& config, Logger& logger, const Options& options)
    : config_(config)
    , logger_(logger)
    , options_(options)
    , terminator_(logger, stats_, options.gracePeriod)
{}

void ProcessMonitor::requestStop() {
    stop_ = true;
}

bool ProcessMonitor::stopRequested() const {
    return stop_.load() || pendingSignal() != 0;
}

int ProcessMonitor::run() {
    int status = 0;

    logger_.debug("Monitoring started: restart=%s, timeout=%d s.",
                  config_.restart ? "yes" : "no", config_.timeoutSec);

    while (true) {
        ProcessHandle proc;
        if (!startProcess(proc)) {
            // Команда, которая не запустилась, не запустится и при повторе
            status = 1;
            break;
        }

        bool interrupted = superviseInstance(proc);

        if (logger_.failed()) {
            status = 1;
            break;
        }
        if (interrupted || !config_.restart)
            break;

        logger_.info("Restart flag is set. Restarting process.");
        if (!pauseBeforeRestart()) {
            logInterruption();
            break;
        }
        stats_.restarts++;
    }

    finish();

    if (logger_.failed()) {
        std::fprintf(stderr, "Log file %s could not be written; output may be incomplete.\n",
                     logger_.path().c_str());
        status = 1;
    }
    return status;
}

bool ProcessMonitor::startProcess(ProcessHandle& proc) {
    std::string cmdline;
    for (const auto& arg : config_.command) {
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += arg;
    }
    logger_.info("Starting process: %s", cmdline.c_str());

    spawnCount_++;
    std::string err;
    if (!proc.spawn(config_.command, err)) {
        logger_.error("Failed to start process: %s", err.c_str());
        return false;
    }
    logger_.info("Process started with PID %d", int(proc.pid()));
    return true;
}

bool ProcessMonitor::superviseInstance(ProcessHandle& proc) {
    const auto startedAt = std::chrono::steady_clock::now();

    OutputRelay relay(logger_, stats_.linesLogged);
    relay.start(proc.outputFd());

    TimeoutWatchdog watchdog(terminator_);
    if (config_.hasTimeout()) {
        logger_.info("Timeout set to %d seconds.", config_.timeoutSec);
        watchdog.arm(proc, std::chrono::seconds(config_.timeoutSec));
    }

    bool interrupted = false;
    while (!proc.waitFor(options_.pollInterval)) {
        // Сбой лога тоже останавливает сеанс: писать вывод больше некуда
        if (stopRequested() || logger_.failed()) {
            interrupted = true;
            logInterruption();
            terminator_.terminate(proc);
            break;
        }
    }

    std::chrono::duration<double> runtime = std::chrono::steady_clock::now() - startedAt;
    stats_.totalRuntime += runtime.count();

    if (config_.hasTimeout()) {
        if (watchdog.cancel())
            logger_.info("Timeout timer cancelled.");
        else
            logger_.debug("Timeout timer already fired.");
    }

    relay.join();
    logger_.info("Process finished.");

    // Ненулевой код считается падением и при остановке по сигналу или
    // requestStop(): остановленный ребёнок выходит с -15
    int code = proc.exitCode();
    if (code != 0) {
        stats_.crashes++;
        logger_.warn("Process exited with return code %d.", code);
    }
    return interrupted;
}

bool ProcessMonitor::pauseBeforeRestart() {
    const auto deadline = std::chrono::steady_clock::now() + options_.restartDelay;
    while (!stopRequested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(options_.pollInterval, left));
    }
    return false;
}

void ProcessMonitor::logInterruption() {
    if (int sig = pendingSignal())
        logger_.info("Received %s. Initiating graceful shutdown.", strsignal(sig));
    else if (stop_.load())
        logger_.info("Stop requested. Initiating graceful shutdown.");
    else
        logger_.error("Log file can no longer be written. Stopping.");
}

void ProcessMonitor::finish() {
    if (reported_) return;
    reported_ = true;
    generateReport(logger_, stats_);
    logger_.info("Process monitoring finished.");
}
