#pragma once

#include <chrono>

namespace warden::shutdown {

/// Route SIGINT and SIGTERM to the termination flag.
void install_signal_handlers();

bool termination_requested();

/// Set the flag as if a signal had arrived.
void request_termination();

void clear_termination_request();

/// Sleep until `timeout` elapses or termination is requested. Returns true
/// when termination was requested.
bool wait_for_termination(std::chrono::milliseconds timeout);

}  // namespace warden::shutdown
