#include "OutputRelay.hpp"
#include "Logger.hpp"

#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>

OutputRelay::OutputRelay(Logger& logger, std::atomic<size_t>& linesLogged)
    : logger_(logger)
    , linesLogged_(linesLogged)
{}

OutputRelay::~OutputRelay() {
    join();
}

void OutputRelay::start(int fd) {
    fd_ = fd;
    relayThread_ = std::thread(&OutputRelay::relayFunc, this);
}

void OutputRelay::join() {
    if (relayThread_.joinable())
        relayThread_.join();
}

void OutputRelay::emitLine(std::string& line) {
    // Обрезаем пробелы и \r с обеих сторон
    size_t b = 0, e = line.size();
    while (b < e && std::isspace(static_cast<unsigned char>(line[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(line[e - 1]))) --e;

    // После сбоя лога только дочитываем пайп
    if (!logger_.failed()) {
        logger_.write(Logger::Level::Info, line.data() + b, e - b);
        if (!logger_.failed())
            linesLogged_++;
    }
    line.clear();
}

void OutputRelay::relayFunc() {
    char buf[4096];
    std::string line;

    while (true) {
        ssize_t r = ::read(fd_, buf, sizeof(buf));
        if (r > 0) {
            const char* p = buf;
            const char* end = buf + r;
            while (p < end) {
                const char* nl = static_cast<const char*>(std::memchr(p, '\n', size_t(end - p)));
                if (!nl) {
                    line.append(p, size_t(end - p));
                    break;
                }
                line.append(p, size_t(nl - p));
                emitLine(line);
                p = nl + 1;
            }
        } else if (r == 0) {
            break;  // EOF: процесс завершён и пайп пуст
        } else if (errno == EINTR) {
            continue;
        } else {
            logger_.error("OutputRelay: read failed: %s", std::strerror(errno));
            break;
        }
    }

    // хвост без перевода строки
    if (!line.empty())
        emitLine(line);
}
