// EN: Shared helpers to encode and decode one structured JSON record
// FR: Utilitaires partagés pour encoder et décoder un enregistrement JSON structuré

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace LSV::JsonRecord {

// EN: Throws SerializationError when the value has no faithful JSON text form
//     (binary values, non-finite floats, strings that are not valid UTF-8).
// FR: Lance SerializationError quand la valeur n'a pas de forme texte JSON fidèle
//     (valeurs binaires, flottants non finis, chaînes UTF-8 invalides).
void ensureTextRepresentable(const nlohmann::json& value, const std::string& context);

// EN: Compact single-line encoding. Throws SerializationError.
// FR: Encodage compact sur une ligne. Lance SerializationError.
std::string encode(const nlohmann::json& value, const std::string& context);

// EN: Parse one record. Throws CorruptCheckpointError naming the file and line.
// FR: Parse un enregistrement. Lance CorruptCheckpointError avec le fichier et la ligne.
nlohmann::json decode(std::string_view text, const std::filesystem::path& origin, size_t line_number);

} // namespace LSV::JsonRecord
