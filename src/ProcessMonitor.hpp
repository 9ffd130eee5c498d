#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

#include "CommonTypes.hpp"
#include "TerminationController.hpp"

class Logger;
class ProcessHandle;

// Цикл мониторинга одной команды.
// Итерация: запуск, ретрансляция вывода в лог, таймер таймаута, ожидание
// выхода, затем отмена таймера, join ретранслятора и учёт кода выхода.
// С --restart после паузы запускаем снова. SIGINT/SIGTERM или requestStop()
// останавливают текущий процесс и завершают сеанс.
// Итоговый отчёт пишется ровно один раз на любом пути выхода.
class ProcessMonitor {
public:
    struct Options {
        std::chrono::milliseconds gracePeriod  { TerminationController::kDefaultGracePeriod };
        std::chrono::milliseconds restartDelay { std::chrono::seconds(1) };
        std::chrono::milliseconds pollInterval { std::chrono::milliseconds(50) };
    };

    ProcessMonitor(const ProcessConfig& config, Logger& logger);
    ProcessMonitor(const ProcessConfig& config, Logger& logger, const Options& options);

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    // Код выхода для main(): 0, либо 1 при ошибке запуска или сбое лога
    int run();

    // Потокобезопасно, то же что SIGINT
    void requestStop();

    const RunStatistics& stats() const { return stats_; }
    size_t spawnCount() const { return spawnCount_.load(); }

private:
    bool stopRequested() const;
    bool startProcess(ProcessHandle& proc);
    // true, если сеанс прерван
    bool superviseInstance(ProcessHandle& proc);
    bool pauseBeforeRestart();
    void logInterruption();
    void finish();

    const ProcessConfig   config_;
    Logger&               logger_;
    Options               options_;
    RunStatistics         stats_;
    TerminationController terminator_;
    std::atomic<bool>     stop_ { false };
    std::atomic<size_t>   spawnCount_ { 0 };
    bool                  reported_ = false;
};
