#ifndef CRMCPS_SHUTDOWN_SIGNAL_HPP
#define CRMCPS_SHUTDOWN_SIGNAL_HPP

// SIGINT/SIGTERM handling for the server loop.

namespace shutdown_signal {

// Installs handlers for SIGINT and SIGTERM without SA_RESTART, so a read
// blocked on stdin returns (EINTR) and the loop can stop promptly.
// Returns false if either handler could not be installed.
bool install_handlers();

// True once SIGINT or SIGTERM has been received.
bool requested();

} // namespace shutdown_signal

#endif // CRMCPS_SHUTDOWN_SIGNAL_HPP
