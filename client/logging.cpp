#include "logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ramutex {

std::shared_ptr<spdlog::logger> client_logger(int client_id) {
  static std::mutex create_mutex;
  std::lock_guard<std::mutex> lock(create_mutex);

  const std::string name = "Client " + std::to_string(client_id);
  auto logger = spdlog::get(name);
  if (logger) return logger;
  logger = spdlog::stdout_color_mt(name);
  logger->set_pattern("[%H:%M:%S.%e] [%n] %^%v%$");
  return logger;
}

}  // namespace ramutex
