#include "Logger.hpp"

#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <vector>

Logger::Logger(const std::string& path, size_t maxBytes, int backupCount)
    : path_(path)
    , maxBytes_(maxBytes)
    , backupCount_(backupCount)
{}

Logger::~Logger() {
    if (fp_) std::fclose(fp_);
}

bool Logger::open(std::string& err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (fp_) return true;
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) {
        err = "cannot open " + path_ + ": " + std::strerror(errno);
        return false;
    }
    std::fseek(fp_, 0, SEEK_END);
    long pos = std::ftell(fp_);
    size_ = pos > 0 ? size_t(pos) : 0;
    return true;
}

void Logger::setLevel(Level lvl) {
    std::lock_guard<std::mutex> lk(mutex_);
    level_ = lvl;
}

bool Logger::isDebug() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return level_ == Level::Debug;
}

void Logger::error(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    log(Level::Error, fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    log(Level::Warn, fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    log(Level::Info, fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    log(Level::Debug, fmt, ap);
    va_end(ap);
}

static std::string formatTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    long ms = long(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ",%03ld", ms);
    return buf;
}

void Logger::log(Level lvl, const char* fmt, va_list ap) {
    // Форматируем вне мьютекса
    va_list ap2;
    va_copy(ap2, ap);
    int len = std::vsnprintf(nullptr, 0, fmt, ap2);
    va_end(ap2);
    if (len < 0) return;
    std::vector<char> msg(size_t(len) + 1);
    std::vsnprintf(msg.data(), msg.size(), fmt, ap);

    write(lvl, msg.data(), size_t(len));
}

void Logger::write(Level lvl, const char* msg, size_t len) {
    static const char* names[] = { "ERROR","WARNING","INFO","DEBUG" };

    std::string record = formatTimestamp();
    record += " - ";
    record += names[int(lvl)];
    record += " - ";
    record.append(msg, len);
    record += '\n';

    std::lock_guard<std::mutex> lk(mutex_);
    if (level_ < lvl) return;
    if (!fp_ || (shouldRollover(record.size()) && !doRollover())) {
        failed_ = true;
        return;
    }

    if (std::fwrite(record.data(), 1, record.size(), fp_) != record.size()
        || std::fflush(fp_) != 0) {
        failed_ = true;
        return;
    }
    size_ += record.size();
}

bool Logger::shouldRollover(size_t nextRecord) const {
    if (maxBytes_ == 0 || backupCount_ <= 0 || size_ == 0) return false;
    return size_ + nextRecord >= maxBytes_;
}

// <path>.1 самый свежий, <path>.N самый старый
bool Logger::doRollover() {
    std::fclose(fp_);
    fp_ = nullptr;

    for (int i = backupCount_ - 1; i > 0; --i) {
        std::string src = path_ + "." + std::to_string(i);
        std::string dst = path_ + "." + std::to_string(i + 1);
        if (::access(src.c_str(), F_OK) == 0) {
            if (::access(dst.c_str(), F_OK) == 0 && std::remove(dst.c_str()) != 0)
                std::fprintf(stderr, "Logger: cannot remove %s: %s\n", dst.c_str(), std::strerror(errno));
            if (std::rename(src.c_str(), dst.c_str()) != 0)
                std::fprintf(stderr, "Logger: cannot rename %s: %s\n", src.c_str(), std::strerror(errno));
        }
    }
    std::string first = path_ + ".1";
    if (::access(first.c_str(), F_OK) == 0 && std::remove(first.c_str()) != 0)
        std::fprintf(stderr, "Logger: cannot remove %s: %s\n", first.c_str(), std::strerror(errno));
    if (std::rename(path_.c_str(), first.c_str()) != 0)
        std::fprintf(stderr, "Logger: cannot rename %s: %s\n", path_.c_str(), std::strerror(errno));

    fp_ = std::fopen(path_.c_str(), "w");
    if (!fp_) {
        std::fprintf(stderr, "Logger: cannot reopen %s: %s\n", path_.c_str(), std::strerror(errno));
        return false;
    }
    size_ = 0;
    return true;
}
