// ============================================================================
// PACER - Configuration Loader
// ============================================================================

#include "pacer/config/config.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace pacer::config {

namespace {

// Missing keys fall back, present keys must convert
template <typename T>
T get_or(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node child = node[key];
    return child ? child.as<T>() : fallback;
}

int64_t non_negative(const YAML::Node& node, const char* key, int64_t fallback) {
    const auto value = get_or<int64_t>(node, key, fallback);
    if (value < 0) {
        throw ConfigError(std::string(key) + " must not be negative");
    }
    return value;
}

// Millisecond keys, bounded by what Duration can hold
Duration read_ms(const YAML::Node& node, const char* key, Duration fallback) {
    static constexpr int64_t kMaxMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max()).count();

    const auto value = non_negative(
        node, key, std::chrono::duration_cast<std::chrono::milliseconds>(fallback).count());
    if (value > kMaxMs) {
        throw ConfigError(std::string(key) + " must not exceed " + std::to_string(kMaxMs));
    }
    return std::chrono::milliseconds{value};
}

void read_logging(const YAML::Node& node, utils::LogConfig& logging) {
    if (!node) {
        return;
    }
    if (node["level"]) {
        try {
            logging.level = utils::parse_log_level(node["level"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("logging.level: ") + e.what());
        }
    }
    logging.pattern = get_or<std::string>(node, "pattern", logging.pattern);
    logging.log_file = get_or<std::string>(node, "file", logging.log_file);
    logging.async = get_or<bool>(node, "async", logging.async);
    logging.queue_size = static_cast<size_t>(
        non_negative(node, "queue_size", static_cast<int64_t>(logging.queue_size)));
    logging.max_file_size_mb = static_cast<size_t>(
        non_negative(node, "max_file_size_mb", static_cast<int64_t>(logging.max_file_size_mb)));
    logging.max_files = static_cast<size_t>(
        non_negative(node, "max_files", static_cast<int64_t>(logging.max_files)));
}

void read_runtime(const YAML::Node& node, runtime::RuntimeConfig& runtime) {
    if (!node) {
        return;
    }
    runtime.threads = static_cast<size_t>(
        non_negative(node, "threads", static_cast<int64_t>(runtime.threads)));
    if (runtime.threads == 0) {
        throw ConfigError("runtime.threads must be at least 1");
    }
    runtime.name = get_or<std::string>(node, "name", runtime.name);
}

void read_rate_limiter(const YAML::Node& node, throttle::RateLimitOptions& options) {
    if (!node) {
        return;
    }
    options.name = get_or<std::string>(node, "name", options.name);

    options.delay = read_ms(node, "delay_ms", options.delay);

    options.output_capacity = static_cast<size_t>(
        non_negative(node, "output_capacity", static_cast<int64_t>(options.output_capacity)));
    if (options.output_capacity == 0) {
        throw ConfigError("rate_limiter.output_capacity must be at least 1");
    }
}

void read_producer(const YAML::Node& node, ProducerConfig& producer) {
    if (!node) {
        return;
    }
    producer.duration = read_ms(node, "duration_ms", producer.duration);
    producer.input_capacity = static_cast<size_t>(
        non_negative(node, "input_capacity", static_cast<int64_t>(producer.input_capacity)));
}

AppConfig from_yaml(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    try {
        read_logging(root["logging"], config.logging);
        read_runtime(root["runtime"], config.runtime);
        read_rate_limiter(root["rate_limiter"], config.rate_limiter);
        read_producer(root["producer"], config.producer);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }
    return config;
}

}  // namespace

// ============================================================================
// Loaders
// ============================================================================

AppConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return from_yaml(root);
}

AppConfig parse_config(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed YAML: ") + e.what());
    }
    return from_yaml(root);
}

}  // namespace pacer::config
