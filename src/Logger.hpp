#pragma once
#include <atomic>
#include <mutex>
#include <cstdarg>
#include <cstdio>
#include <string>

// Ротируемый лог сеанса. Создаётся один раз в main() и передаётся по ссылке.
class Logger {
public:
    enum class Level { Error=0, Warn, Info, Debug };

    static constexpr size_t kDefaultMaxBytes    = 5 * 1024 * 1024;
    static constexpr int    kDefaultBackupCount = 3;

    explicit Logger(const std::string& path,
                    size_t maxBytes = kDefaultMaxBytes,
                    int backupCount = kDefaultBackupCount);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Открывает файл в режиме дозаписи
    bool open(std::string& err);

    void setLevel(Level lvl);
    bool isDebug() const;

    void error(const char* fmt, ...);
    void warn (const char* fmt, ...);
    void info (const char* fmt, ...);
    void debug(const char* fmt, ...);

    // Сообщение как есть, без форматирования; допускает '\0' внутри
    void write(Level lvl, const char* data, size_t len);

    // Была ошибка записи или ротации. Флаг не сбрасывается.
    bool failed() const { return failed_.load(); }

    const std::string& path() const { return path_; }

private:
    void log(Level lvl, const char* fmt, va_list ap);
    bool shouldRollover(size_t nextRecord) const;
    bool doRollover();

    std::string path_;
    size_t      maxBytes_;
    int         backupCount_;
    Level       level_ = Level::Info;
    FILE*       fp_ = nullptr;
    size_t      size_ = 0;
    std::atomic<bool> failed_ { false };
    mutable std::mutex mutex_;
};
