#pragma once

#include <sys/types.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

// Дочерний процесс, stdout и stderr которого слиты в один пайп.
// Ребёнка забирает (waitpid) тот поток, который первым увидел выход.
// Сигналы шлются под тем же мьютексом и только до waitpid, поэтому
// переиспользованный pid не пострадает.
class ProcessHandle {
public:
    ProcessHandle() = default;
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // PATH lookup, stdin = /dev/null. false + err если запуск не удался.
    bool spawn(const std::vector<std::string>& argv, std::string& err);

    pid_t pid() const { return pid_; }

    // Читающий конец пайпа с объединённым выводом
    int outputFd() const { return outFd_; }

    // Неблокирующая проверка, true если процесс завершён
    bool poll();

    // Ждёт не дольше timeout, true если процесс завершён
    bool waitFor(std::chrono::milliseconds timeout);

    // Ждёт без ограничения
    void wait();

    // Код выхода, либо -N при смерти от сигнала N. Валиден после завершения.
    int exitCode() const;

    // true если сигнал доставлен или процесс уже завершён
    bool sendSignal(int sig, std::string& err);

private:
    bool reapLocked();

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    int   outFd_ = -1;
    bool  exited_ = false;
    int   exitCode_ = 0;
};
