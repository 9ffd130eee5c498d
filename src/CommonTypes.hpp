// CommonTypes.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

struct ProcessConfig {
    std::vector<std::string> command;
    std::string logfile;
    bool restart = false;
    int timeoutSec = 0;     // 0 = без таймаута
    bool debug = false;

    bool hasTimeout() const { return timeoutSec > 0; }
};

// Статистика сеанса. Счётчики, которые трогают чужие потоки, атомарные.
struct RunStatistics {
    double              totalRuntime = 0.0;      // секунды, пишет только цикл
    std::atomic<size_t> restarts { 0 };
    std::atomic<size_t> timeoutTerminations { 0 };
    std::atomic<size_t> crashes { 0 };
    std::atomic<size_t> linesLogged { 0 };
};
