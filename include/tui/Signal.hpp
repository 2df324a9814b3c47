#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Set by the SIGINT/SIGTERM/SIGHUP handler; the session loop exits without choosing a path.
extern std::atomic_bool g_stop_requested;

// Installs handlers that only set the flag (async-signal-safe).
void InitStopSignalHandlers();

#endif // TUI_SIGNAL_HPP
