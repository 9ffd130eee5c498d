#pragma once

#include <chrono>

class Logger;
class ProcessHandle;
struct RunStatistics;

// Остановка процесса: SIGTERM, ожидание gracePeriod, затем SIGKILL и
// ожидание без ограничения. Уже завершённый процесс не трогаем.
// dueToTimeout увеличивает счётчик таймаутов, если процесс был жив.
class TerminationController {
public:
    static constexpr std::chrono::seconds kDefaultGracePeriod{5};

    TerminationController(Logger& logger, RunStatistics& stats,
                          std::chrono::milliseconds gracePeriod = kDefaultGracePeriod);

    void terminate(ProcessHandle& proc, bool dueToTimeout = false);

private:
    void escalate(ProcessHandle& proc);

    Logger&                   logger_;
    RunStatistics&            stats_;
    std::chrono::milliseconds gracePeriod_;
};
