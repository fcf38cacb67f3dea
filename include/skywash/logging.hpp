#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace skywash {

/** @brief Create the shared console + rotating file logger once; later calls return it. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error when initialize_logger has not run yet. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief One JSON object per line, with the message escaped as a JSON string. */
std::unique_ptr<spdlog::formatter> make_json_line_formatter();

}  // namespace skywash
