#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class ProcessHandle;
class TerminationController;

// Отложенное завершение процесса по таймауту. Срабатывает не более одного раза.
class TimeoutWatchdog {
public:
    enum class State { Idle, Armed, Cancelled, Fired };

    explicit TimeoutWatchdog(TerminationController& terminator);
    ~TimeoutWatchdog();

    TimeoutWatchdog(const TimeoutWatchdog&) = delete;
    TimeoutWatchdog& operator=(const TimeoutWatchdog&) = delete;

    void arm(ProcessHandle& proc, std::chrono::milliseconds timeout);

    // Отменяет и дожидается потока. Если таймер уже сработал, ждёт конца
    // завершения процесса. true, если отмена успела до срабатывания.
    bool cancel();

    State state() const;

private:
    void watchFunc(ProcessHandle* proc, std::chrono::milliseconds timeout);

    TerminationController&  terminator_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    State                   state_ = State::Idle;
    bool                    cancelRequested_ = false;
    std::thread             watchThread_;
};
