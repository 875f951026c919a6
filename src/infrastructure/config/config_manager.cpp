// EN: ConfigManager - YAML loading, environment overrides and rule checks for checkpoint options.
// FR: ConfigManager - chargement YAML, surcharges d'environnement et vérification des règles pour les options de checkpoint.

#include "loopsaver/infrastructure/config/config_manager.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace LSV {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            std::string joined;
            for (const auto& item : v) {
                joined += joined.empty() ? item : "," + item;
            }
            return joined;
        } else {
            return std::to_string(v);
        }
    }, *value_);
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(filename)) {
        LSV_LOG_ERROR_META("config", "Configuration file not found", {{"path", filename}});
        return false;
    }

    try {
        loadYamlNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LSV_LOG_ERROR_META("config", "Failed to load configuration", {{"path", filename}, {"error", e.what()}});
        return false;
    }

    LSV_LOG_INFO_META("config", "Configuration loaded", {{"path", filename}});
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loadYamlNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LSV_LOG_ERROR_META("config", "Failed to parse configuration", {{"error", e.what()}});
        return false;
    }
    return true;
}

// EN: Only top-level maps become sections; other top-level entries are skipped.
// FR: Seules les maps de premier niveau deviennent des sections ; les autres entrées sont ignorées.
void ConfigManager::loadYamlNode(const YAML::Node& yaml) {
    std::map<std::string, Section> loaded;

    if (yaml.IsMap()) {
        for (const auto& entry : yaml) {
            const std::string name = entry.first.as<std::string>();
            if (!entry.second.IsMap()) {
                LSV_LOG_WARN_META("config", "Ignoring top-level entry that is not a section", {{"section", name}});
                continue;
            }
            Section& section = loaded[name];
            for (const auto& item : entry.second) {
                section[item.first.as<std::string>()] = parseYamlValue(item.second);
            }
        }
    }

    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            items.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(items);
    }

    if (!node.IsScalar()) {
        return ConfigValue();
    }

    const std::string raw = node.as<std::string>();

    // EN: Quoted scalars carry the "!" tag and stay strings.
    // FR: Les scalaires entre guillemets portent le tag "!" et restent des chaînes.
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(raw));
    }

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return ConfigValue(flag);
    }

    if (raw.find_first_of(".eE") == std::string::npos) {
        int number = 0;
        if (YAML::convert<int>::decode(node, number)) {
            return ConfigValue(number);
        }
    }

    double real = 0.0;
    if (YAML::convert<double>::decode(node, real)) {
        return ConfigValue(real);
    }

    return ConfigValue(expandVariables(raw));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    for (const auto& [section_name, section] : sections_) {
        emitter << YAML::Key << section_name << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : section) {
            emitter << YAML::Key << key << YAML::Value;
            if (auto flag = value.tryAs<bool>()) {
                emitter << *flag;
            } else if (auto number = value.tryAs<int>()) {
                emitter << *number;
            } else if (auto real = value.tryAs<double>()) {
                emitter << *real;
            } else if (auto text = value.tryAs<std::string>()) {
                emitter << *text;
            } else if (auto items = value.tryAs<std::vector<std::string>>()) {
                emitter << YAML::BeginSeq;
                for (const auto& item : *items) {
                    emitter << item;
                }
                emitter << YAML::EndSeq;
            } else {
                emitter << YAML::Null;
            }
        }
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndMap;

    if (!emitter.good()) {
        LSV_LOG_ERROR_META("config", "Failed to emit configuration", {{"error", emitter.GetLastError()}});
        return false;
    }

    std::ofstream file(filename);
    file << emitter.c_str();
    if (!file) {
        LSV_LOG_ERROR_META("config", "Failed to write configuration", {{"path", filename}});
        return false;
    }

    LSV_LOG_INFO_META("config", "Configuration saved", {{"path", filename}});
    return true;
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t applied = 0;
    for (const auto& rule : validation_rules_) {
        std::string env_name = prefix + rule.key;
        std::transform(env_name.begin(), env_name.end(), env_name.begin(), [](unsigned char c) {
            return c == '.' ? '_' : static_cast<char>(std::toupper(c));
        });

        const std::string raw = getEnvironmentVariable(env_name);
        if (raw.empty()) {
            continue;
        }

        auto parsed = parseTyped(raw, rule.type);
        if (!parsed) {
            LSV_LOG_WARN_META("config", "Ignoring environment override of the wrong type",
                              {{"variable", env_name}, {"type", rule.type}});
            continue;
        }

        auto [section, key] = splitRuleKey(rule.key);
        sections_[section][key] = *parsed;
        LSV_LOG_DEBUG_META("config", "Environment override applied", {{"key", rule.key}});
        ++applied;
    }
    return applied;
}

std::pair<std::string, std::string> ConfigManager::splitRuleKey(const std::string& rule_key) {
    const size_t dot = rule_key.find('.');
    if (dot == std::string::npos) {
        return {"default", rule_key};
    }
    return {rule_key.substr(0, dot), rule_key.substr(dot + 1)};
}

std::optional<ConfigValue> ConfigManager::parseTyped(const std::string& raw, const std::string& type) {
    if (type == "bool") {
        std::string lower = raw;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return ConfigValue(true);
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return ConfigValue(false);
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        if (type == "int") {
            int value = std::stoi(raw, &consumed);
            return consumed == raw.size() ? std::optional<ConfigValue>(ConfigValue(value)) : std::nullopt;
        }
        if (type == "double") {
            double value = std::stod(raw, &consumed);
            return consumed == raw.size() ? std::optional<ConfigValue>(ConfigValue(value)) : std::nullopt;
        }
    } catch (const std::logic_error&) {
        // EN: std::invalid_argument and std::out_of_range both mean "not this type"
        // FR: std::invalid_argument et std::out_of_range signifient tous deux "pas ce type"
        return std::nullopt;
    }

    if (type == "array") {
        std::vector<std::string> items;
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            items.push_back(item);
        }
        return ConfigValue(items);
    }
    return ConfigValue(raw);
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        auto [section, key] = splitRuleKey(rule.key);
        ConfigValue value = getUnlocked(section, key);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(value, rule, error)) {
            errors.push_back(error);
        }
    }
    return errors.empty();
}

bool ConfigManager::validateValue(const ConfigValue& value, const ValidationRule& rule, std::string& error) const {
    const std::string& key = rule.key;

    bool type_ok = true;
    if (rule.type == "bool") {
        type_ok = value.tryAs<bool>().has_value();
    } else if (rule.type == "int") {
        type_ok = value.tryAs<int>().has_value();
    } else if (rule.type == "double") {
        type_ok = value.tryAs<double>() || value.tryAs<int>();
    } else if (rule.type == "string") {
        type_ok = value.tryAs<std::string>().has_value();
    } else if (rule.type == "array") {
        type_ok = value.tryAs<std::vector<std::string>>().has_value();
    }
    if (!type_ok) {
        error = "Configuration " + key + " must be of type " + rule.type;
        return false;
    }

    if (rule.min_value || rule.max_value) {
        std::optional<double> numeric = value.tryAs<double>();
        if (auto number = value.tryAs<int>()) {
            numeric = static_cast<double>(*number);
        }
        if (numeric && rule.min_value && *numeric < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + std::to_string(*rule.min_value);
            return false;
        }
        if (numeric && rule.max_value && *numeric > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + std::to_string(*rule.max_value);
            return false;
        }
    }

    if (!rule.allowed_values.empty() &&
        std::find(rule.allowed_values.begin(), rule.allowed_values.end(), value.toString()) ==
            rule.allowed_values.end()) {
        error = "Configuration " + key + " has unsupported value " + value.toString();
        return false;
    }

    return true;
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return ConfigValue();
    }
    auto value_it = section_it->second.find(key);
    return value_it != section_it->second.end() ? value_it->second : ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section][key] = value;
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.count(key) > 0;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

// EN: ${NAME} is replaced by the environment value; unset variables are left verbatim.
// FR: ${NAME} est remplacé par la valeur d'environnement ; les variables absentes restent telles quelles.
std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");

    std::string result;
    auto cursor = value.cbegin();
    for (std::sregex_iterator it(value.begin(), value.end(), var_regex), end; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(cursor, match[0].first);
        const std::string replacement = getEnvironmentVariable(match[1].str());
        result += replacement.empty() ? match[0].str() : replacement;
        cursor = match[0].second;
    }
    result.append(cursor, value.cend());
    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

} // namespace LSV
