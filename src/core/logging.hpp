#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "configuration.hpp"

namespace dex_stream::core {

inline constexpr const char* kLogPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

/**
 * @brief Build a named logger from the [system] section
 *
 * Console sink always; a file sink as well when log_file is set. The logger
 * is not registered globally: callers pass it to the components that log.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(const SystemConfig& config,
                                                          const std::string& name = "dex_stream");

}  // namespace dex_stream::core
