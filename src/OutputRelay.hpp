#pragma once
#include <atomic>
#include <string>
#include <thread>

class Logger;

// Поток, переносящий строки вывода ребёнка в лог.
// Один экземпляр на один запуск процесса.
class OutputRelay {
public:
    OutputRelay(Logger& logger, std::atomic<size_t>& linesLogged);
    ~OutputRelay();

    OutputRelay(const OutputRelay&) = delete;
    OutputRelay& operator=(const OutputRelay&) = delete;

    void start(int fd);
    // Возвращается, когда поток вывода закрыт
    void join();

private:
    void relayFunc();
    void emitLine(std::string& line);

    Logger&              logger_;
    std::atomic<size_t>& linesLogged_;
    int                  fd_ = -1;
    std::thread          relayThread_;
};
