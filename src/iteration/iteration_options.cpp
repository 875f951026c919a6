// EN: IterationOptions implementation
// FR: Implémentation de IterationOptions

#include "loopsaver/iteration/iteration_options.hpp"

#include <limits>
#include <optional>
#include <stdexcept>

namespace LSV {

namespace {

bool readBool(const ConfigManager& config, const std::string& section, const std::string& key, bool fallback) {
    if (!config.has(section, key)) {
        return fallback;
    }
    auto value = config.get(section, key).tryAs<bool>();
    if (!value) {
        throw std::invalid_argument("Configuration " + section + "." + key + " must be a boolean");
    }
    return *value;
}

int readInt(const ConfigManager& config, const std::string& section, const std::string& key, int fallback,
            int min_value, int max_value) {
    if (!config.has(section, key)) {
        return fallback;
    }
    auto value = config.get(section, key).tryAs<int>();
    if (!value) {
        throw std::invalid_argument("Configuration " + section + "." + key + " must be an integer");
    }
    if (*value < min_value || *value > max_value) {
        throw std::invalid_argument("Configuration " + section + "." + key + " must be between " +
                                    std::to_string(min_value) + " and " + std::to_string(max_value));
    }
    return *value;
}

} // namespace

std::unique_ptr<IStateCodec> IterationOptions::makeCodec() const {
    if (safe) {
        return std::make_unique<JsonLinesCodec>();
    }
    return std::make_unique<MsgpackBlobCodec>(compress_blob, compression_level, max_materialized_items);
}

IterationOptions IterationOptions::fromConfig(const ConfigManager& config, const std::string& section) {
    IterationOptions options;
    options.safe = readBool(config, section, "safe", options.safe);
    options.cache_first = readBool(config, section, "cache_first", options.cache_first);
    options.compress_blob = readBool(config, section, "compress_blob", options.compress_blob);
    options.compression_level = readInt(config, section, "compression_level", options.compression_level, -1, 9);
    options.max_materialized_items = static_cast<size_t>(
        readInt(config, section, "max_materialized_items", static_cast<int>(options.max_materialized_items), 0,
                std::numeric_limits<int>::max()));
    options.rewind_on_resume = readBool(config, section, "rewind_on_resume", options.rewind_on_resume);
    options.replay_in_flight = readBool(config, section, "replay_in_flight", options.replay_in_flight);
    options.rewind_window = static_cast<size_t>(
        readInt(config, section, "rewind_window", static_cast<int>(options.rewind_window), 1,
                std::numeric_limits<int>::max()));
    return options;
}

std::vector<ConfigManager::ValidationRule> IterationOptions::validationRules(const std::string& section) {
    std::vector<ConfigManager::ValidationRule> rules;

    auto add = [&](const std::string& key, const std::string& type, std::optional<double> min_value,
                   std::optional<double> max_value, const std::string& description) {
        ConfigManager::ValidationRule rule;
        rule.key = section + "." + key;
        rule.type = type;
        rule.min_value = min_value;
        rule.max_value = max_value;
        rule.description = description;
        rules.push_back(rule);
    };

    add("safe", "bool", std::nullopt, std::nullopt, "Stream JSON lines checkpoints instead of MessagePack blobs");
    add("cache_first", "bool", std::nullopt, std::nullopt, "Prefer checkpointed items over a fresh source");
    add("compress_blob", "bool", std::nullopt, std::nullopt, "Deflate MessagePack blobs with zlib");
    add("compression_level", "int", -1.0, 9.0, "zlib compression level");
    add("max_materialized_items", "int", 0.0, std::nullopt, "Blob materialization limit, 0 for none");
    add("rewind_on_resume", "bool", std::nullopt, std::nullopt, "Realign resumed file offsets to a line start");
    add("replay_in_flight", "bool", std::nullopt, std::nullopt, "Replay the line being processed on interruption");
    add("rewind_window", "int", 1.0, std::nullopt, "Initial backward scan window in bytes");

    return rules;
}

} // namespace LSV
