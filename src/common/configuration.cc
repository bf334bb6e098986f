#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace FseDump {

// Global function to get configuration instance
const FseDumpConfig& GetConfig() {
    return Configuration::getInstance().config();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts a leading minus and wraps it
        if (std::string_view(env_val).find('-') != std::string_view::npos) {
            LOG(WARNING) << "Negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

// Copies every key present under the "fse_dump" root into config.
void ApplyYAML(const YAML::Node& yaml, FseDumpConfig& config) {
    if (!yaml["fse_dump"]) {
        LOG(WARNING) << "Configuration has no 'fse_dump' root key, using defaults";
        return;
    }
    auto root = yaml["fse_dump"];

    if (root["hub"]) {
        auto hub = root["hub"];
        if (hub["queue_capacity"]) config.hub.queue_capacity.set(hub["queue_capacity"].as<size_t>());
    }

    if (root["sink"]) {
        auto sink = root["sink"];
        if (sink["poll_interval_ms"]) config.sink.poll_interval_ms.set(sink["poll_interval_ms"].as<int>());
    }

    if (root["decode"]) {
        auto decode = root["decode"];
        if (decode["strict_page_end"]) config.decode.strict_page_end.set(decode["strict_page_end"].as<bool>());
        if (decode["file_timestamps"]) config.decode.file_timestamps.set(decode["file_timestamps"].as<bool>());
        if (decode["worker_threads"]) config.decode.worker_threads.set(decode["worker_threads"].as<int>());
    }

    if (root["output"]) {
        auto output = root["output"];
        if (output["hex_ids"]) config.output.hex_ids.set(output["hex_ids"].as<bool>());
        if (output["alt_flags"]) config.output.alt_flags.set(output["alt_flags"].as<bool>());
        if (output["extra_id"]) config.output.extra_id.set(output["extra_id"].as<bool>());
    }
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYAML(yaml, config_);
        LOG(INFO) << "Loaded configuration from " << filename;
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYAML(yaml, config_);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const size_t capacity = config_.hub.queue_capacity.get();
    if (capacity < 1) {
        validation_errors_.push_back("Hub queue capacity must be at least 1");
    } else if (capacity > kMaxQueueCapacity) {
        validation_errors_.push_back("Hub queue capacity cannot exceed " + std::to_string(kMaxQueueCapacity));
    }

    if (config_.sink.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Sink poll interval must be at least 1ms");
    }

    if (config_.decode.worker_threads.get() < 0) {
        validation_errors_.push_back("Worker threads cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    if (validate()) {
        return true;
    }
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return false;
}

} // namespace FseDump
