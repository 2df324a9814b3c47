#include "tui/Signal.hpp"

#include <csignal>

std::atomic_bool g_stop_requested{false};

namespace {
// Each of these ends the session without a choice.
constexpr int kStopSignals[] = {SIGINT, SIGTERM, SIGHUP};

void OnStopSignal(int) {
    g_stop_requested.store(true, std::memory_order_relaxed);
}
}

void InitStopSignalHandlers() {
    g_stop_requested.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = OnStopSignal;
    sigemptyset(&action.sa_mask);
    // A second signal while the loop is stuck gets the default action.
    action.sa_flags = SA_RESETHAND;
    for (int signo : kStopSignals) {
        sigaction(signo, &action, nullptr);
    }
}
