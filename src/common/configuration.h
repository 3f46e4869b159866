#ifndef CLAIMSTONE_CONFIGURATION_H_
#define CLAIMSTONE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Claimstone {

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

/**
 * Main configuration structure
 */
struct ClaimstoneConfig {
    // Version information
    struct Version {
        ConfigValue<int> major{1, "CLAIMSTONE_VERSION_MAJOR"};
        ConfigValue<int> minor{0, "CLAIMSTONE_VERSION_MINOR"};
    } version;

    // Replicated keyspace
    struct Storage {
        ConfigValue<int> replication_factor{3, "CLAIMSTONE_REPLICATION_FACTOR"};
        ConfigValue<size_t> shards_per_replica{64, "CLAIMSTONE_SHARDS_PER_REPLICA"};
        // Tombstones younger than this survive compaction
        ConfigValue<size_t> gc_grace_seconds{864000, "CLAIMSTONE_GC_GRACE_SECONDS"};
    } storage;

    // Defaults for uniqueness attempts
    struct Uniqueness {
        // 0 disables the probe TTL
        ConfigValue<int> ttl_seconds{0, "CLAIMSTONE_UNIQUENESS_TTL"};
        ConfigValue<std::string> consistency_level{"LOCAL_QUORUM", "CLAIMSTONE_CONSISTENCY_LEVEL"};
        ConfigValue<std::string> column_prefix{"_LOCK_", "CLAIMSTONE_COLUMN_PREFIX"};
        ConfigValue<int> lock_timeout_ms{60000, "CLAIMSTONE_LOCK_TIMEOUT_MS"};
        ConfigValue<bool> fail_on_stale_lock{false, "CLAIMSTONE_FAIL_ON_STALE_LOCK"};
    } uniqueness;

    struct Logging {
        ConfigValue<int> verbosity{0, "CLAIMSTONE_LOG_VERBOSITY"};
    } logging;
};

/**
 * Configuration manager. Tools use the process-wide instance; tests may
 * build their own.
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const ClaimstoneConfig& config() const { return config_; }
    ClaimstoneConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getReplicationFactor() const { return config_.storage.replication_factor.get(); }
    size_t getShardsPerReplica() const { return config_.storage.shards_per_replica.get(); }
    int getUniquenessTtl() const { return config_.uniqueness.ttl_seconds.get(); }
    std::string getConsistencyLevel() const { return config_.uniqueness.consistency_level.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ClaimstoneConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
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

} // namespace Claimstone

#endif // CLAIMSTONE_CONFIGURATION_H_
