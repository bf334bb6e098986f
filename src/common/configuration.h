#ifndef FSEDUMP_CONFIGURATION_H_
#define FSEDUMP_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace FseDump {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

// Upper bound on hub.queue_capacity; every consumer preallocates its queue
constexpr size_t kMaxQueueCapacity = size_t{1} << 20;

/**
 * Main configuration structure
 */
struct FseDumpConfig {
    // Broadcast hub
    struct Hub {
        // Records buffered per consumer before Publish() blocks the decoder
        ConfigValue<size_t> queue_capacity{4096, "FSEDUMP_QUEUE_CAPACITY"};
    } hub;

    // Sink threads
    struct Sink {
        ConfigValue<int> poll_interval_ms{100, "FSEDUMP_SINK_POLL_MS"};
    } sink;

    // Decoder behaviour
    struct Decode {
        // Treat a page that ends before its declared length as a failure
        ConfigValue<bool> strict_page_end{false, "FSEDUMP_STRICT_PAGE_END"};
        // Stamp records with the mtime of the file they were decoded from
        ConfigValue<bool> file_timestamps{true, "FSEDUMP_FILE_TIMESTAMPS"};
        // 0 = std::thread::hardware_concurrency(); only used with --parallel
        ConfigValue<int> worker_threads{0, "FSEDUMP_WORKER_THREADS"};
    } decode;

    // Export formatting
    struct Output {
        ConfigValue<bool> hex_ids{true, "FSEDUMP_HEX_IDS"};
        ConfigValue<bool> alt_flags{false, "FSEDUMP_ALT_FLAGS"};
        ConfigValue<bool> extra_id{true, "FSEDUMP_EXTRA_ID"};
    } output;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const FseDumpConfig& config() const { return config_; }
    FseDumpConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getQueueCapacity() const { return config_.hub.queue_capacity.get(); }
    int getSinkPollIntervalMs() const { return config_.sink.poll_interval_ms.get(); }
    int getWorkerThreads() const { return config_.decode.worker_threads.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore built-in defaults (tests)
    void reset() { config_ = FseDumpConfig{}; }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FseDumpConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool validateConfig();
};

// Global accessor used by the rest of the code base
const FseDumpConfig& GetConfig();

} // namespace FseDump

#endif // FSEDUMP_CONFIGURATION_H_
