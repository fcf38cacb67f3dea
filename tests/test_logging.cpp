#include <string>

#include <catch2/catch.hpp>
#include <spdlog/details/log_msg.h>

#include "skywash/logging.hpp"

namespace {

std::string format_line(const std::string& payload) {
    const auto formatter = skywash::make_json_line_formatter();
    const spdlog::details::log_msg msg{"skywash", spdlog::level::warn, payload};
    spdlog::memory_buf_t buffer;
    formatter->format(msg, buffer);
    return std::string(buffer.data(), buffer.size());
}

}  // namespace

TEST_CASE("JSON log lines carry the level and plain messages unchanged") {
    const std::string line = format_line("Detected window 3 at position (1.00, 2.00, 0.00)");

    REQUIRE_THAT(line, Catch::Matchers::StartsWith(R"({"ts":")"));
    REQUIRE_THAT(line, Catch::Matchers::Contains(R"("level":"warning")"));
    REQUIRE_THAT(line, Catch::Matchers::Contains(R"json("msg":"Detected window 3 at position (1.00, 2.00, 0.00)"})json"));
}

TEST_CASE("JSON log lines escape quotes, backslashes and control characters") {
    const std::string line = format_line("Unknown log level \"loud\" in C:\\logs\n\x01");

    REQUIRE_THAT(line, Catch::Matchers::Contains(R"("msg":"Unknown log level \"loud\" in C:\\logs\n\u0001"})"));
}
