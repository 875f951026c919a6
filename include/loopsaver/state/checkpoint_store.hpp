// EN: CheckpointStore - binds a state backend to a checkpoint path
// FR: CheckpointStore - associe un backend d'état à un chemin de checkpoint

#pragma once

#include <filesystem>
#include <memory>

#include "loopsaver/state/atomic_file_writer.hpp"
#include "loopsaver/state/checkpoint_state.hpp"
#include "loopsaver/state/state_backend.hpp"

namespace LSV {

// EN: Thin facade over one checkpoint file. Whole-file, synchronous, single writer per path.
// FR: Façade fine sur un fichier de checkpoint. Fichier entier, synchrone, un seul écrivain par chemin.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path path,
                             std::shared_ptr<IStateBackend> backend = std::make_shared<JsonFileBackend>());

    const std::filesystem::path& path() const { return path_; }
    const IStateBackend& backend() const { return *backend_; }

    // EN: Whether the checkpoint file is currently on disk
    // FR: Indique si le fichier de checkpoint est actuellement sur le disque
    bool exists() const;

    // EN: Load the mapping, or an empty state when no checkpoint exists
    // FR: Charge le mapping, ou un état vide quand aucun checkpoint n'existe
    CheckpointState load() const;

    // EN: Atomically replace the checkpoint with state
    // FR: Remplace atomiquement le checkpoint par l'état
    void save(const CheckpointState& state) const;

    // EN: Remove the checkpoint if present, no-op otherwise
    // FR: Supprime le checkpoint s'il existe, sans effet sinon
    bool erase() const;

    // EN: Start a raw atomic write of the checkpoint file (used by the remaining-items codecs)
    // FR: Démarre une écriture atomique brute du fichier de checkpoint (utilisée par les codecs)
    std::unique_ptr<AtomicFileWriter> beginWrite() const;

private:
    std::filesystem::path path_;
    std::shared_ptr<IStateBackend> backend_;
};

} // namespace LSV
