#pragma once

#include "skywash/logging.hpp"

#include <filesystem>
#include <memory>

namespace skywash::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "skywash_tests_logs";
        return skywash::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace skywash::test
