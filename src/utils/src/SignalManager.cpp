#include "SignalManager.hpp"

namespace SignalManager {

static std::set<int> watched;
static volatile std::sig_atomic_t received_signal = 0;

// Only stores the signal number; anything more is not async-signal-safe
void signal_handler(int signum) {
    received_signal = signum;
}

void watch(int signum) {
    watched.insert(signum);
}

void setup() {
    for (int signum : watched) {
        std::signal(signum, signal_handler);
    }
}

int last_signal() {
    return received_signal;
}

void reset() {
    for (int signum : watched) {
        std::signal(signum, SIG_DFL);
    }
    watched.clear();
    received_signal = 0;
}

}
