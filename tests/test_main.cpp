#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

/**
 * @brief Main test entry point for the mqttd tests
 */
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output clean; tests asserting on logs install their own sink
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("test_logger", null_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::off);

    return RUN_ALL_TESTS();
}
