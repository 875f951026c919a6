// EN: JSON and YAML file backends implementation
// FR: Implémentation des backends fichier JSON et YAML

#include "loopsaver/state/state_backend.hpp"
#include "loopsaver/state/atomic_file_writer.hpp"
#include "loopsaver/state/json_record.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace LSV {

namespace {

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& element : node) {
                array.push_back(yamlToJson(element));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& item : node) {
                object[item.first.as<std::string>()] = yamlToJson(item.second);
            }
            return object;
        }

        case YAML::NodeType::Scalar:
            break;
    }

    const std::string& raw = node.Scalar();

    // EN: Quoted scalars carry the non-specific "!" tag and are always strings.
    // FR: Les scalaires entre guillemets portent le tag "!" et sont toujours des chaînes.
    if (node.Tag() == "!") {
        return raw;
    }

    bool bool_val = false;
    if (YAML::convert<bool>::decode(node, bool_val)) {
        return bool_val;
    }

    if (raw.find_first_of(".eE") == std::string::npos) {
        int64_t int_val = 0;
        if (YAML::convert<int64_t>::decode(node, int_val)) {
            return int_val;
        }
    }

    double double_val = 0.0;
    if (YAML::convert<double>::decode(node, double_val)) {
        return double_val;
    }

    return raw;
}

void emitJson(YAML::Emitter& emitter, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            emitter << YAML::Null;
            break;
        case nlohmann::json::value_t::boolean:
            emitter << value.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            emitter << value.get<int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned:
            emitter << value.get<uint64_t>();
            break;
        case nlohmann::json::value_t::number_float:
            emitter << value.get<double>();
            break;
        case nlohmann::json::value_t::string:
            emitter << YAML::DoubleQuoted << value.get_ref<const std::string&>();
            break;
        case nlohmann::json::value_t::array:
            emitter << YAML::BeginSeq;
            for (const auto& element : value) {
                emitJson(emitter, element);
            }
            emitter << YAML::EndSeq;
            break;
        case nlohmann::json::value_t::object:
            emitter << YAML::BeginMap;
            for (const auto& [key, element] : value.items()) {
                emitter << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
                emitJson(emitter, element);
            }
            emitter << YAML::EndMap;
            break;
        default:
            throw SerializationError("YAML backend cannot encode value of type " + std::string(value.type_name()));
    }
}

} // namespace

CheckpointState FileStateBackend::load(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        int err = errno;
        throw IOFailure(path, "open for reading", std::error_code(err ? err : ENOENT, std::generic_category()));
    }

    CheckpointState state = decode(in, path);
    LSV_LOG_DEBUG("state_backend", "Loaded " + std::to_string(state.size()) + " keys from " + path.string() +
                  " (" + name() + ")");
    return state;
}

void FileStateBackend::save(const std::filesystem::path& path, const CheckpointState& state) const {
    // EN: Encode fully before touching the filesystem.
    // FR: Encode entièrement avant de toucher au système de fichiers.
    std::string encoded = encode(state);

    AtomicFileWriter writer(path);
    writer.write(encoded);
    writer.commit();
}

bool FileStateBackend::erase(const std::filesystem::path& path) const {
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw IOFailure(path, "remove", ec);
    }
    return removed;
}

CheckpointState JsonFileBackend::decode(std::istream& in, const std::filesystem::path& origin) const {
    std::stringstream buffer;
    buffer << in.rdbuf();
    return CheckpointState::fromJson(JsonRecord::decode(buffer.str(), origin, 1), origin.string());
}

std::string JsonFileBackend::encode(const CheckpointState& state) const {
    nlohmann::json object = state.toJson();
    JsonRecord::ensureTextRepresentable(object, "state");
    try {
        return object.dump(indent_) + "\n";
    } catch (const nlohmann::json::type_error& e) {
        throw SerializationError(std::string("state: ") + e.what());
    }
}

CheckpointState YamlFileBackend::decode(std::istream& in, const std::filesystem::path& origin) const {
    YAML::Node root;
    try {
        root = YAML::Load(in);
    } catch (const YAML::Exception& e) {
        throw CorruptCheckpointError(origin, e.what());
    }

    if (!root.IsMap()) {
        throw CorruptCheckpointError(origin, "expected a YAML map at top level");
    }
    return CheckpointState::fromJson(yamlToJson(root), origin.string());
}

std::string YamlFileBackend::encode(const CheckpointState& state) const {
    nlohmann::json object = state.toJson();

    // EN: Same representability rules as JSON text, UTF-8 included.
    // FR: Mêmes règles de représentabilité que le texte JSON, UTF-8 compris.
    JsonRecord::encode(object, "state");

    YAML::Emitter emitter;
    emitter.SetDoublePrecision(17);
    emitJson(emitter, object);
    if (!emitter.good()) {
        throw SerializationError("YAML emitter error: " + emitter.GetLastError());
    }
    return std::string(emitter.c_str()) + "\n";
}

std::shared_ptr<IStateBackend> makeStateBackend(const std::string& name) {
    if (name == "json") {
        return std::make_shared<JsonFileBackend>();
    }
    if (name == "yaml") {
        return std::make_shared<YamlFileBackend>();
    }
    throw std::invalid_argument("Unknown state backend: " + name);
}

} // namespace LSV
