#pragma once
#include <csignal>
#include <set>

namespace SignalManager {

// Record `signum` once setup() installs the handler
void watch(int signum);

// Install the recording handler for every watched signal
void setup();

// Most recent signal received, 0 when none
int last_signal();

// Restore default dispositions and forget watched signals
void reset();

}
