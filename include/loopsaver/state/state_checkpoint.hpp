// EN: StateCheckpoint - scoped key-value state that survives interrupted runs
// FR: StateCheckpoint - état clé-valeur à portée limitée qui survit aux exécutions interrompues

#pragma once

#include <filesystem>
#include <memory>

#include "loopsaver/state/checkpoint_scope.hpp"
#include "loopsaver/state/state_backend.hpp"

namespace LSV {

// EN: Loads the mapping on construction. close(Interrupted) saves it; close(Completed) erases the
//     file when erase_on_success is set and saves otherwise. Destruction without close() counts as
//     Completed, or Interrupted when an exception is unwinding through the owning scope.
// FR: Charge le mapping à la construction. close(Interrupted) le sauvegarde ; close(Completed) efface
//     le fichier si erase_on_success est actif et sauvegarde sinon. La destruction sans close() vaut
//     Completed, ou Interrupted quand une exception traverse la portée propriétaire.
class StateCheckpoint : public Checkpointed {
public:
    explicit StateCheckpoint(std::filesystem::path path, bool erase_on_success = false,
                             std::shared_ptr<IStateBackend> backend = std::make_shared<JsonFileBackend>());
    ~StateCheckpoint() override;

    // EN: Persist the current mapping without closing
    // FR: Persiste le mapping courant sans fermer
    void save();

    bool eraseOnSuccess() const { return erase_on_success_; }

protected:
    void onClose(CompletionStatus status) override;

private:
    bool erase_on_success_;
    int uncaught_on_entry_;
};

} // namespace LSV
