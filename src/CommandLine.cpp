#include "CommandLine.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>

bool splitCommand(const std::string& cmdline, std::vector<std::string>& out, std::string& err) {
    enum class State { Space, Word, Single, Double };
    State st = State::Space;
    std::string token;
    out.clear();

    for (size_t i = 0; i < cmdline.size(); ++i) {
        char c = cmdline[i];
        switch (st) {
        case State::Space:
        case State::Word:
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (st == State::Word) {
                    out.push_back(token);
                    token.clear();
                    st = State::Space;
                }
            } else if (c == '\'') {
                st = State::Single;
            } else if (c == '"') {
                st = State::Double;
            } else if (c == '\\') {
                if (i + 1 >= cmdline.size()) {
                    err = "no escaped character";
                    return false;
                }
                token += cmdline[++i];
                st = State::Word;
            } else {
                token += c;
                st = State::Word;
            }
            break;
        case State::Single:
            if (c == '\'') st = State::Word;
            else token += c;
            break;
        case State::Double:
            if (c == '"') {
                st = State::Word;
            } else if (c == '\\' && i + 1 < cmdline.size()
                       && (cmdline[i + 1] == '"' || cmdline[i + 1] == '\\')) {
                token += cmdline[++i];
            } else {
                token += c;
            }
            break;
        }
    }

    if (st == State::Single || st == State::Double) {
        err = "no closing quotation";
        return false;
    }
    if (st == State::Word)
        out.push_back(token);
    return true;
}

static bool parseTimeout(const std::string& v, int& out) {
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || n <= 0 || n > INT_MAX)
        return false;
    out = int(n);
    return true;
}

bool parseArgs(int argc, char* argv[], ProcessConfig& config, std::string& err) {
    std::string command;
    std::string timeout;
    bool haveCommand = false;

    // Значение из "--key=value" или из следующего аргумента
    auto takeValue = [&](int& i, const std::string& s, const std::string& key, std::string& dst) -> bool {
        if (s.rfind(key + "=", 0) == 0) {
            dst = s.substr(key.size() + 1);
            return true;
        }
        if (s == key) {
            if (i + 1 >= argc) {
                err = "missing value for " + key;
                return false;
            }
            dst = argv[++i];
            return true;
        }
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        std::string s(argv[i]);
        if (s == "debug") {
            config.debug = true;
        } else if (s == "--restart") {
            config.restart = true;
        } else if (takeValue(i, s, "--command", command)) {
            haveCommand = true;
        } else if (takeValue(i, s, "--logfile", config.logfile)) {
        } else if (takeValue(i, s, "--timeout", timeout)) {
            if (!parseTimeout(timeout, config.timeoutSec)) {
                err = "invalid timeout: '" + timeout + "' (expected positive number of seconds)";
                return false;
            }
        } else {
            if (err.empty())
                err = "unknown argument: " + s;
            return false;
        }
    }

    if (!haveCommand || config.logfile.empty()) {
        err = "required arguments: --command=... --logfile=...";
        return false;
    }

    std::string splitErr;
    if (!splitCommand(command, config.command, splitErr)) {
        err = "command parse error: " + splitErr;
        return false;
    }
    if (config.command.empty()) {
        err = "command is empty";
        return false;
    }
    return true;
}

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --command=\"cmd args...\" --logfile=path [--restart] [--timeout=seconds] [debug]\n",
        prog);
}
