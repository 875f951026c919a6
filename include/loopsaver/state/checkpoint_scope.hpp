// EN: Completion model shared by every checkpointed object, and the scope guard that finalizes them
// FR: Modèle de terminaison partagé par tous les objets à checkpoint, et la garde de portée qui les finalise

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "loopsaver/state/checkpoint_state.hpp"
#include "loopsaver/state/checkpoint_store.hpp"

namespace LSV {

// EN: How a loop over a checkpointed sequence ended
// FR: Comment une boucle sur une séquence à checkpoint s'est terminée
enum class CompletionStatus {
    Completed,    // EN: Source drained / FR: Source épuisée
    Interrupted   // EN: Early stop, exception or destruction / FR: Arrêt anticipé, exception ou destruction
};

// EN: Returned by forEach callbacks
// FR: Retourné par les callbacks de forEach
enum class LoopControl {
    Continue,
    Stop
};

std::string completionStatusToString(CompletionStatus status);

// EN: Auxiliary state bound to a checkpoint file, finalized exactly once through close().
// FR: État auxiliaire lié à un fichier de checkpoint, finalisé exactement une fois via close().
class Checkpointed {
public:
    virtual ~Checkpointed() = default;

    Checkpointed(const Checkpointed&) = delete;
    Checkpointed& operator=(const Checkpointed&) = delete;

    const CheckpointStore& store() const { return store_; }
    const CheckpointState& state() const { return state_; }

    // EN: Auxiliary state access. get() throws NotFoundError for absent keys.
    // FR: Accès à l'état auxiliaire. get() lance NotFoundError pour les clés absentes.
    const nlohmann::json& get(const std::string& key) const { return state_.get(key); }

    template<typename T>
    T get(const std::string& key) const {
        return state_.get<T>(key);
    }

    template<typename T>
    T getOr(const std::string& key, const T& default_value) const {
        return state_.getOr<T>(key, default_value);
    }

    bool contains(const std::string& key) const { return state_.contains(key); }
    size_t size() const { return state_.size(); }

    // EN: Throws std::invalid_argument for keys reserved by the concrete type
    // FR: Lance std::invalid_argument pour les clés réservées par le type concret
    void set(const std::string& key, nlohmann::json value);
    bool erase(const std::string& key);

    bool closed() const { return closed_; }

    // EN: Finalize with the given status. Later calls are no-ops. Throws on persistence failure.
    // FR: Finalise avec le statut donné. Les appels suivants sont sans effet. Lance en cas d'échec de persistance.
    void close(CompletionStatus status);

    // EN: Same as close() but logs failures instead of throwing (destructors, unwinding).
    // FR: Comme close() mais journalise les échecs au lieu de lancer (destructeurs, déroulement).
    void closeQuietly(CompletionStatus status) noexcept;

protected:
    explicit Checkpointed(CheckpointStore store);

    virtual void onClose(CompletionStatus status) = 0;
    virtual bool isReservedKey(const std::string& key) const;

    // EN: Mark closed without finalizing. Later close() calls leave the checkpoint untouched.
    // FR: Marque fermé sans finaliser. Les appels suivants à close() laissent le checkpoint intact.
    void markClosed() noexcept { closed_ = true; }

    CheckpointStore store_;
    CheckpointState state_;

private:
    bool closed_ = false;
};

// EN: Finalizes a Checkpointed object when the loop driver is done with it.
//     Destroyed without finish() (early return, exception) it finalizes as Interrupted.
// FR: Finalise un objet Checkpointed quand le pilote de boucle en a terminé.
//     Détruit sans finish() (retour anticipé, exception) il finalise en Interrupted.
class CheckpointScope {
public:
    explicit CheckpointScope(Checkpointed& target) : target_(target) {}
    ~CheckpointScope();

    CheckpointScope(const CheckpointScope&) = delete;
    CheckpointScope& operator=(const CheckpointScope&) = delete;

    void finish(CompletionStatus status);

private:
    Checkpointed& target_;
    bool finished_ = false;
};

} // namespace LSV
