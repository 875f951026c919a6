// EN: JSON record helpers implementation
// FR: Implémentation des utilitaires d'enregistrement JSON

#include "loopsaver/state/json_record.hpp"
#include "loopsaver/infrastructure/system/errors.hpp"

#include <cmath>

namespace LSV::JsonRecord {

void ensureTextRepresentable(const nlohmann::json& value, const std::string& context) {
    switch (value.type()) {
        case nlohmann::json::value_t::binary:
            throw SerializationError(context + ": binary values cannot be written as JSON text");

        case nlohmann::json::value_t::number_float:
            if (!std::isfinite(value.get<double>())) {
                throw SerializationError(context + ": non-finite number cannot be written as JSON text");
            }
            break;

        case nlohmann::json::value_t::array:
            for (const auto& element : value) {
                ensureTextRepresentable(element, context);
            }
            break;

        case nlohmann::json::value_t::object:
            for (const auto& [key, element] : value.items()) {
                ensureTextRepresentable(element, context + "." + key);
            }
            break;

        default:
            break;
    }
}

std::string encode(const nlohmann::json& value, const std::string& context) {
    ensureTextRepresentable(value, context);
    try {
        return value.dump();
    } catch (const nlohmann::json::type_error& e) {
        // EN: 316 is raised for strings that are not valid UTF-8.
        // FR: 316 est levée pour les chaînes qui ne sont pas de l'UTF-8 valide.
        throw SerializationError(context + ": " + e.what());
    }
}

nlohmann::json decode(std::string_view text, const std::filesystem::path& origin, size_t line_number) {
    try {
        return nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw CorruptCheckpointError(origin, "line " + std::to_string(line_number) + ": " + e.what());
    }
}

} // namespace LSV::JsonRecord
