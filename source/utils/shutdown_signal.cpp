#include "utils/shutdown_signal.hpp"

#include <csignal>

#include <signal.h>

namespace shutdown_signal {

static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

bool install_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    bool installed = sigaction(SIGINT, &action, nullptr) == 0;
    installed &= sigaction(SIGTERM, &action, nullptr) == 0;
    return installed;
}

bool requested() {
    return shutdown_requested != 0;
}

} // namespace shutdown_signal
