#pragma once
#include <functional>
#include <csignal>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run in registration order; the final callback (at most one per signal) runs last.
// They run on a watcher thread, never inside the signal handler, so they may log and lock.
void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Start the watcher and install the handler for every signal that has callbacks.
void setup();

// Restore default dispositions, stop the watcher and drop all callbacks.
void reset();

// Last signal delivered through the handler, 0 if none.
int last_signal();

}
