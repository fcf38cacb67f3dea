// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the mission simulator.
//
// Recognized variables
// - SKYWASH_LOG_DIR       log directory (default "logs")
// - SKYWASH_LOG_LEVEL     spdlog level name (default "info")
// - SKYWASH_SCAN_SECONDS  positive scan length in seconds (default 60)
// - SKYWASH_SEED          non-negative integer seed (default 42)
//
// Values that cannot be parsed or are out of range are reported through the
// logger and replaced by their defaults.

#include "skywash/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

#include "skywash/logging.hpp"

namespace skywash {

namespace {
constexpr double k_default_scan_seconds{60.0};
constexpr std::uint64_t k_default_seed{42};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

double parse_positive_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            auto logger = get_logger();
            logger->warn("Ignoring non-positive value {}; using fallback {}", raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::uint64_t parse_seed(const char* raw_value, std::uint64_t fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string_view str_raw{raw_value};
    if (str_raw.empty() || str_raw.front() == '-') {
        auto logger = get_logger();
        logger->warn("Seed must be a non-negative integer; using fallback {}", fallback);
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const unsigned long long parsed_value = std::stoull(raw_value, &consumed);
        if (consumed != str_raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::uint64_t>(parsed_value);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse seed from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("SKYWASH_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("SKYWASH_LOG_LEVEL", k_default_log_level);
    config.scan_duration = load_scan_duration();
    config.random_seed = load_random_seed();
    config.home_position = Position{0.0, 0.0, 0.0};

    logger->info("Configuration loaded: scan_seconds={} seed={} log_level={} max_altitude_m={}",
                 config.scan_duration.count(),
                 config.random_seed,
                 config.log_level,
                 config.profile.max_altitude_m);
    return config;
}

Duration ConfigurationLoader::load_scan_duration() {
    return Duration{parse_positive_double(std::getenv("SKYWASH_SCAN_SECONDS"), k_default_scan_seconds)};
}

std::uint64_t ConfigurationLoader::load_random_seed() {
    return parse_seed(std::getenv("SKYWASH_SEED"), k_default_seed);
}

}  // namespace skywash
