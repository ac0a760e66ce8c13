#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace ramutex {

// client_logger returns the console logger of one peer, named
// "Client <id>". Loggers are created once and then shared.
std::shared_ptr<spdlog::logger> client_logger(int client_id);

}  // namespace ramutex
