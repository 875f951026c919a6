#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace LSV {

// EN: One typed configuration value (bool, int, double, string or list of strings).
// FR: Une valeur de configuration typée (bool, int, double, chaîne ou liste de chaînes).
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ConfigValue>>>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    // EN: Value as T, throws std::runtime_error when empty and std::bad_variant_access on type mismatch.
    // FR: Valeur en T, lance std::runtime_error si vide et std::bad_variant_access si le type diffère.
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        return std::get<T>(*value_);
    }

    // EN: Value as T, or std::nullopt when empty or held as another type.
    // FR: Valeur en T, ou std::nullopt si vide ou stockée sous un autre type.
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* held = std::get_if<T>(&*value_)) {
            return *held;
        }
        return std::nullopt;
    }

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Process-wide checkpoint configuration read from YAML, with environment overrides and rule checks.
//     Values are addressed by (section, key); rules name them "section.key".
// FR: Configuration de checkpoint pour le processus, lue depuis YAML, avec surcharges d'environnement
//     et vérification de règles. Les valeurs sont adressées par (section, clé) ; les règles les nomment "section.clé".
class ConfigManager {
public:
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Replace the current values with the YAML document. Returns false (and logs) on failure.
    // FR: Remplace les valeurs courantes par le document YAML. Retourne false (et journalise) en cas d'échec.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    bool saveToFile(const std::string& filename) const;

    // EN: For each rule "section.key", parse <prefix>SECTION_KEY as the rule's type. Returns the number applied.
    // FR: Pour chaque règle "section.clé", parse <prefix>SECTION_CLE selon le type de la règle. Retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "LSV_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Check every rule, filling errors with one message per violation.
    // FR: Vérifie chaque règle, remplit errors avec un message par violation.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;

    // EN: Drop all values and rules.
    // FR: Supprime toutes les valeurs et règles.
    void reset();

private:
    using Section = std::map<std::string, ConfigValue>;

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadYamlNode(const YAML::Node& yaml);
    ConfigValue parseYamlValue(const YAML::Node& node) const;

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const ConfigValue& value, const ValidationRule& rule, std::string& error) const;

    static std::pair<std::string, std::string> splitRuleKey(const std::string& rule_key);
    static std::optional<ConfigValue> parseTyped(const std::string& raw, const std::string& type);

    std::string expandVariables(const std::string& value) const;
    static std::string getEnvironmentVariable(const std::string& name);

    mutable std::mutex mutex_;
    std::map<std::string, Section> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace LSV
