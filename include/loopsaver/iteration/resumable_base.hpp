// EN: Type-independent part of the resumable iterators - resume precedence and persistence
// FR: Partie indépendante du type des itérateurs reprenables - priorité de reprise et persistance

#pragma once

#include <filesystem>
#include <memory>

#include "loopsaver/iteration/iteration_options.hpp"
#include "loopsaver/state/checkpoint_scope.hpp"
#include "loopsaver/state/state_codec.hpp"

namespace LSV {

class ResumableBase : public Checkpointed {
public:
    const IterationOptions& options() const { return options_; }
    const IStateCodec& codec() const { return *codec_; }

    // EN: Whether the items come from a checkpoint rather than the fresh source
    // FR: Indique si les éléments viennent d'un checkpoint plutôt que de la source fraîche
    bool resumedFromCheckpoint() const { return resumed_; }

protected:
    ResumableBase(std::filesystem::path checkpoint_path, IterationOptions options);

    // EN: Load the checkpoint if any and apply the cache_first precedence.
    //     Returns the checkpoint's pending items when they win, null otherwise.
    // FR: Charge le checkpoint s'il existe et applique la priorité cache_first.
    //     Retourne les éléments en attente du checkpoint s'ils l'emportent, nul sinon.
    std::unique_ptr<JsonSource> resumeFromCheckpoint(bool has_fresh_source);

    // EN: Remaining items, encoded, handed to the codec on interruption
    // FR: Éléments restants, encodés, transmis au codec lors d'une interruption
    virtual std::unique_ptr<JsonSource> takeRemaining() = 0;

    // EN: Drop the live source without persisting it
    // FR: Abandonne la source vivante sans la persister
    virtual void releaseSource() = 0;

    virtual CheckpointState persistedState() const;

    // EN: A pending item could not be read back. Release the source and close without persisting,
    //     so the checkpoint on disk keeps the unreadable record.
    // FR: Un élément en attente n'a pas pu être relu. Libère la source et ferme sans persister,
    //     pour que le checkpoint sur disque conserve l'enregistrement illisible.
    void abandonCorruptCheckpoint(const CorruptCheckpointError& error);

    void onClose(CompletionStatus status) override;
    bool isReservedKey(const std::string& key) const override;

private:
    IterationOptions options_;
    std::unique_ptr<IStateCodec> codec_;
    bool resumed_ = false;
};

} // namespace LSV
