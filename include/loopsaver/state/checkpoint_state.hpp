// EN: Typed checkpoint state container - ordered mapping from string keys to JSON values
// FR: Conteneur typé de l'état du checkpoint - mapping ordonné de clés chaînes vers valeurs JSON

#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "loopsaver/infrastructure/system/errors.hpp"

namespace LSV {

// EN: Reserved keys of the checkpoint state
// FR: Clés réservées de l'état du checkpoint
inline constexpr const char* kRemainingKey = "remaining";
inline constexpr const char* kCurrentKey = "current";
inline constexpr const char* kPositionKey = "pos";

// EN: Ordered key-value state persisted by the checkpoint backends and codecs.
//     `remaining` is reserved for the pending sequence, every other key is caller bookkeeping.
// FR: État clé-valeur ordonné persisté par les backends et codecs de checkpoint.
//     `remaining` est réservé à la séquence en attente, les autres clés appartiennent à l'appelant.
class CheckpointState {
public:
    using Storage = std::map<std::string, nlohmann::json>;
    using const_iterator = Storage::const_iterator;

    CheckpointState() = default;

    // EN: Get a value, throws NotFoundError if the key is absent
    // FR: Obtient une valeur, lance NotFoundError si la clé est absente
    const nlohmann::json& get(const std::string& key) const;

    // EN: Get a value converted to T, throws NotFoundError if absent
    // FR: Obtient une valeur convertie en T, lance NotFoundError si absente
    template<typename T>
    T get(const std::string& key) const {
        return get(key).template get<T>();
    }

    template<typename T>
    T getOr(const std::string& key, const T& default_value) const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second.template get<T>() : default_value;
    }

    std::optional<nlohmann::json> tryGet(const std::string& key) const;

    void set(const std::string& key, nlohmann::json value);

    // EN: Remove a key, returns whether it was present
    // FR: Supprime une clé, retourne si elle était présente
    bool erase(const std::string& key);

    // EN: Remove and return a value if present
    // FR: Supprime et retourne une valeur si présente
    std::optional<nlohmann::json> pop(const std::string& key);

    bool contains(const std::string& key) const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    void clear() { values_.clear(); }

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    bool operator==(const CheckpointState& other) const { return values_ == other.values_; }
    bool operator!=(const CheckpointState& other) const { return !(*this == other); }

    // EN: Copy of the state without the reserved `remaining` key
    // FR: Copie de l'état sans la clé réservée `remaining`
    CheckpointState withoutRemaining() const;

    nlohmann::json toJson() const;

    // EN: Build a state from a JSON object. Anything else is a corrupt checkpoint.
    // FR: Construit un état depuis un objet JSON. Tout autre contenu est un checkpoint corrompu.
    static CheckpointState fromJson(const nlohmann::json& json, const std::string& origin);

private:
    Storage values_;
};

} // namespace LSV
