#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace titlebook::common {

/// Log an unrecoverable fault, flush the loggers and terminate.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("titlebook fatal: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace titlebook::common
