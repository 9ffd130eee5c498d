#include "ProcessHandle.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern char **environ;

ProcessHandle::~ProcessHandle() {
    if (outFd_ != -1) {
        ::close(outFd_);
        outFd_ = -1;
    }
    std::lock_guard<std::mutex> lk(mutex_);
    if (pid_ > 0 && !reapLocked()) {
        // Не оставляем зомби и живых сирот
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
        exited_ = true;
    }
}

bool ProcessHandle::spawn(const std::vector<std::string>& argv, std::string& err) {
    if (argv.empty()) {
        err = "empty command";
        return false;
    }

    // 1. пайп; оба конца CLOEXEC, чтобы не утекали в следующие запуски
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        err = std::string("pipe2 failed: ") + std::strerror(errno);
        return false;
    }

    // 2. argv
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv)
        args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // 3. stdout и stderr в один пайп, stdin из /dev/null
    posix_spawn_file_actions_t actions;
    int ret = posix_spawn_file_actions_init(&actions);
    if (ret != 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        err = std::string("posix_spawn_file_actions_init failed: ") + std::strerror(ret);
        return false;
    }
    if ((ret = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0)) != 0
        || (ret = posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO)) != 0
        || (ret = posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO)) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        ::close(fds[0]);
        ::close(fds[1]);
        err = std::string("posix_spawn file actions failed: ") + std::strerror(ret);
        return false;
    }

    pid_t pid = -1;
    ret = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    // родитель никогда не пишет в пайп
    ::close(fds[1]);

    if (ret != 0) {
        ::close(fds[0]);
        err = std::string(argv[0]) + ": " + std::strerror(ret);
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    pid_ = pid;
    outFd_ = fds[0];
    exited_ = false;
    exitCode_ = 0;
    return true;
}

bool ProcessHandle::reapLocked() {
    if (exited_) return true;
    if (pid_ <= 0) return false;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r == -1 && errno == EINTR);

    if (r == 0) return false;
    if (r == pid_) {
        if (WIFEXITED(status))
            exitCode_ = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            exitCode_ = -WTERMSIG(status);
        else
            exitCode_ = -1;
    } else {
        // ECHILD: ребёнка забрал кто-то другой, код неизвестен
        exitCode_ = -1;
    }
    exited_ = true;
    return true;
}

bool ProcessHandle::poll() {
    std::lock_guard<std::mutex> lk(mutex_);
    return reapLocked();
}

bool ProcessHandle::waitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto step = std::chrono::milliseconds(20);

    while (true) {
        if (poll()) return true;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(step, left));
    }
}

void ProcessHandle::wait() {
    while (!waitFor(std::chrono::milliseconds(100))) {}
}

int ProcessHandle::exitCode() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return exitCode_;
}

bool ProcessHandle::sendSignal(int sig, std::string& err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (reapLocked()) return true;
    if (::kill(pid_, sig) != 0) {
        err = std::string("kill(") + std::to_string(pid_) + ", " + std::to_string(sig)
            + ") failed: " + std::strerror(errno);
        return false;
    }
    return true;
}
