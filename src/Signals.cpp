#include "Signals.hpp"

#include <signal.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>

static volatile std::sig_atomic_t g_pendingSignal = 0;

static void onSignal(int sig) {
    g_pendingSignal = sig;
}

bool installSignalHandlers(std::string& err) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int sig : { SIGINT, SIGTERM }) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            err = std::string("sigaction(") + strsignal(sig) + ") failed: " + std::strerror(errno);
            return false;
        }
    }
    return true;
}

int pendingSignal() {
    return g_pendingSignal;
}

void clearPendingSignal() {
    g_pendingSignal = 0;
}
