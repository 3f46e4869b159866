#include "configuration.h"
#include "env_flags.h"
#include "exceptions.h"
#include "../storage/consistency_level.h"
#include <cstdlib>
#include <stdexcept>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Claimstone {

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
        if (IsEnvTrueValue(env_val)) {
            return true;
        } else if (IsEnvFalseValue(env_val)) {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["claimstone"]) {
        LOG(WARNING) << "Configuration has no top-level 'claimstone' section, keeping defaults";
        return;
    }
    auto root = yaml["claimstone"];

    // Version
    if (root["version"]) {
        auto version = root["version"];
        if (version["major"]) config_.version.major.set(version["major"].as<int>());
        if (version["minor"]) config_.version.minor.set(version["minor"].as<int>());
    }

    // Storage
    if (root["storage"]) {
        auto storage = root["storage"];
        if (storage["replication_factor"]) config_.storage.replication_factor.set(storage["replication_factor"].as<int>());
        if (storage["shards_per_replica"]) config_.storage.shards_per_replica.set(storage["shards_per_replica"].as<size_t>());
        if (storage["gc_grace_seconds"]) config_.storage.gc_grace_seconds.set(storage["gc_grace_seconds"].as<size_t>());
    }

    // Uniqueness
    if (root["uniqueness"]) {
        auto uniqueness = root["uniqueness"];
        if (uniqueness["ttl_seconds"]) config_.uniqueness.ttl_seconds.set(uniqueness["ttl_seconds"].as<int>());
        if (uniqueness["consistency_level"]) config_.uniqueness.consistency_level.set(uniqueness["consistency_level"].as<std::string>());
        if (uniqueness["column_prefix"]) config_.uniqueness.column_prefix.set(uniqueness["column_prefix"].as<std::string>());
        if (uniqueness["lock_timeout_ms"]) config_.uniqueness.lock_timeout_ms.set(uniqueness["lock_timeout_ms"].as<int>());
        if (uniqueness["fail_on_stale_lock"]) config_.uniqueness.fail_on_stale_lock.set(uniqueness["fail_on_stale_lock"].as<bool>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    int replication_factor = config_.storage.replication_factor.get();
    if (replication_factor < 1) {
        validation_errors_.push_back("Replication factor must be at least 1");
    }

    if (config_.storage.shards_per_replica.get() < 1) {
        validation_errors_.push_back("Shards per replica must be at least 1");
    }

    if (config_.uniqueness.ttl_seconds.get() < 0) {
        validation_errors_.push_back("Uniqueness TTL cannot be negative");
    }

    try {
        ConsistencyLevel level = parseConsistencyLevel(config_.uniqueness.consistency_level.get());
        if (replication_factor >= 1) {
            RequiredReplicas(level, replication_factor);
        }
    } catch (const std::invalid_argument& e) {
        validation_errors_.push_back(e.what());
    } catch (const StorageException& e) {
        validation_errors_.push_back(e.what());
    }

    if (config_.uniqueness.column_prefix.get().empty()) {
        validation_errors_.push_back("Column prefix must not be empty");
    }

    if (config_.uniqueness.lock_timeout_ms.get() < 1) {
        validation_errors_.push_back("Lock timeout must be at least 1ms");
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Claimstone
