// EN: CheckpointState implementation
// FR: Implémentation de CheckpointState

#include "loopsaver/state/checkpoint_state.hpp"

namespace LSV {

const nlohmann::json& CheckpointState::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw NotFoundError(key);
    }
    return it->second;
}

std::optional<nlohmann::json> CheckpointState::tryGet(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CheckpointState::set(const std::string& key, nlohmann::json value) {
    values_[key] = std::move(value);
}

bool CheckpointState::erase(const std::string& key) {
    return values_.erase(key) > 0;
}

std::optional<nlohmann::json> CheckpointState::pop(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    nlohmann::json value = std::move(it->second);
    values_.erase(it);
    return value;
}

bool CheckpointState::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

CheckpointState CheckpointState::withoutRemaining() const {
    CheckpointState copy = *this;
    copy.erase(kRemainingKey);
    return copy;
}

nlohmann::json CheckpointState::toJson() const {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [key, value] : values_) {
        object[key] = value;
    }
    return object;
}

CheckpointState CheckpointState::fromJson(const nlohmann::json& json, const std::string& origin) {
    if (!json.is_object()) {
        throw CorruptCheckpointError(origin, std::string("expected a JSON object, found ") + json.type_name());
    }

    CheckpointState state;
    for (const auto& [key, value] : json.items()) {
        state.values_[key] = value;
    }
    return state;
}

} // namespace LSV
