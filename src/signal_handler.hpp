#pragma once

// SIGINT/SIGTERM request shutdown, SIGWINCH flags a terminal resize,
// SIGPIPE is ignored so broken sockets surface as write errors.
void setup_signal_handlers();

bool shutdown_requested();
void request_shutdown();

// True once per SIGWINCH delivered since the last call.
bool consume_resize_signal();
