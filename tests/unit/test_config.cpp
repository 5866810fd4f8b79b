// ============================================================================
// PACER - Configuration Unit Tests
// ============================================================================

#include "pacer/config/config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace pacer;
using namespace pacer::config;
using namespace std::chrono_literals;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const AppConfig config = parse_config("");

    EXPECT_EQ(config.logging.level, utils::LogLevel::Info);
    EXPECT_EQ(config.runtime.threads, 1u);
    EXPECT_EQ(config.rate_limiter.delay, Duration{1s});
    EXPECT_EQ(config.rate_limiter.output_capacity, kRateLimitedCapacity);
    EXPECT_EQ(config.producer.duration, Duration{5100ms});
    EXPECT_EQ(config.producer.input_capacity, 1000u);
}

TEST(ConfigTest, ReadsEverySection) {
    const AppConfig config = parse_config(R"(
logging:
  level: debug
  pattern: "%v"
  file: pacer.log
  async: true
  max_files: 3
runtime:
  threads: 4
  name: workers
rate_limiter:
  name: sensor
  delay_ms: 250
  output_capacity: 8
producer:
  duration_ms: 1000
  input_capacity: 0
)");

    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_EQ(config.logging.pattern, "%v");
    EXPECT_EQ(config.logging.log_file, "pacer.log");
    EXPECT_TRUE(config.logging.async);
    EXPECT_EQ(config.logging.max_files, 3u);

    EXPECT_EQ(config.runtime.threads, 4u);
    EXPECT_EQ(config.runtime.name, "workers");

    EXPECT_EQ(config.rate_limiter.name, "sensor");
    EXPECT_EQ(config.rate_limiter.delay, Duration{250ms});
    EXPECT_EQ(config.rate_limiter.output_capacity, 8u);

    EXPECT_EQ(config.producer.duration, Duration{1000ms});
    EXPECT_EQ(config.producer.input_capacity, kUnbounded);
}

TEST(ConfigTest, PartialSectionKeepsOtherDefaults) {
    const AppConfig config = parse_config("rate_limiter:\n  delay_ms: 0\n");

    EXPECT_EQ(config.rate_limiter.delay, Duration::zero());
    EXPECT_EQ(config.rate_limiter.output_capacity, kRateLimitedCapacity);
    EXPECT_EQ(config.rate_limiter.name, "rate_limiter");
}

TEST(ConfigTest, RejectsNegativeDelay) {
    EXPECT_THROW((void)parse_config("rate_limiter:\n  delay_ms: -5\n"), ConfigError);
}

TEST(ConfigTest, RejectsDelayOutOfRange) {
    EXPECT_THROW((void)parse_config("rate_limiter:\n  delay_ms: 10000000000000\n"), ConfigError);
    EXPECT_THROW((void)parse_config("producer:\n  duration_ms: 10000000000000\n"), ConfigError);
}

TEST(ConfigTest, AcceptsLargestRepresentableDelay) {
    const auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max());
    const AppConfig config =
        parse_config("rate_limiter:\n  delay_ms: " + std::to_string(max_ms.count()) + "\n");
    EXPECT_EQ(config.rate_limiter.delay, Duration{max_ms});
}

TEST(ConfigTest, RejectsZeroOutputCapacity) {
    EXPECT_THROW((void)parse_config("rate_limiter:\n  output_capacity: 0\n"), ConfigError);
}

TEST(ConfigTest, RejectsZeroThreads) {
    EXPECT_THROW((void)parse_config("runtime:\n  threads: 0\n"), ConfigError);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW((void)parse_config("logging:\n  level: loud\n"), ConfigError);
}

TEST(ConfigTest, RejectsWrongType) {
    EXPECT_THROW((void)parse_config("rate_limiter:\n  delay_ms: soon\n"), ConfigError);
}

TEST(ConfigTest, RejectsMalformedYaml) {
    EXPECT_THROW((void)parse_config("rate_limiter: [unterminated\n"), ConfigError);
}

TEST(ConfigTest, RejectsNonMappingRoot) {
    EXPECT_THROW((void)parse_config("- a\n- b\n"), ConfigError);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW((void)load_config("/nonexistent/pacer.yaml"), ConfigError);
}

TEST(ConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "pacer_config_test.yaml";
    {
        std::ofstream out(path);
        out << "rate_limiter:\n  delay_ms: 40\n";
    }

    const AppConfig config = load_config(path);
    EXPECT_EQ(config.rate_limiter.delay, Duration{40ms});

    std::remove(path.c_str());
}
