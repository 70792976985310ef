#pragma once

#include <stop_token>

namespace bale {

// Blocks SIGINT/SIGTERM in every thread and waits for them on a dedicated one,
// so it must run before any other thread starts. The first signal requests
// `stop`, letting transfers abort and remove their partial files; a second
// one exits immediately with 128 + signal.
void termination_handler_install(std::stop_source stop);

}  // namespace bale
