// EN: Error taxonomy for LoopSaver - every failure surfaces to the caller as one of these exceptions
// FR: Taxonomie d'erreurs pour LoopSaver - chaque échec remonte à l'appelant sous forme d'une de ces exceptions

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace LSV {

// EN: Base class for all checkpoint related errors
// FR: Classe de base pour toutes les erreurs liées aux checkpoints
class CheckpointError : public std::runtime_error {
public:
    explicit CheckpointError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Auxiliary key absent from the checkpoint state
// FR: Clé auxiliaire absente de l'état du checkpoint
class NotFoundError : public CheckpointError {
public:
    explicit NotFoundError(const std::string& key)
        : CheckpointError("Key not found in checkpoint state: '" + key + "'"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// EN: Value that cannot be represented in the active checkpoint format
// FR: Valeur non représentable dans le format de checkpoint actif
class SerializationError : public CheckpointError {
public:
    explicit SerializationError(const std::string& message) : CheckpointError(message) {}
};

// EN: Malformed checkpoint content found on load. Never silently reset to an empty state.
// FR: Contenu de checkpoint malformé au chargement. Jamais remplacé silencieusement par un état vide.
class CorruptCheckpointError : public CheckpointError {
public:
    CorruptCheckpointError(const std::filesystem::path& path, const std::string& detail)
        : CheckpointError("Corrupt checkpoint '" + path.string() + "': " + detail), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// EN: Filesystem failure while reading, writing or removing a checkpoint
// FR: Échec du système de fichiers lors de la lecture, l'écriture ou la suppression d'un checkpoint
class IOFailure : public CheckpointError {
public:
    IOFailure(const std::filesystem::path& path, const std::string& operation, std::error_code ec)
        : CheckpointError("I/O failure during " + operation + " of '" + path.string() + "': " + ec.message()),
          path_(path), code_(ec) {}

    const std::filesystem::path& path() const { return path_; }
    std::error_code code() const { return code_; }

private:
    std::filesystem::path path_;
    std::error_code code_;
};

} // namespace LSV
