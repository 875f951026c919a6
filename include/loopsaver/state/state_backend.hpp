// EN: State backends - load, save and erase a flat checkpoint mapping in a given file format
// FR: Backends d'état - charge, sauvegarde et efface un mapping de checkpoint plat dans un format donné

#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include "loopsaver/state/checkpoint_state.hpp"

namespace LSV {

// EN: Backend interface consumed by CheckpointStore
// FR: Interface de backend consommée par CheckpointStore
class IStateBackend {
public:
    virtual ~IStateBackend() = default;

    // EN: Load the mapping stored at path (caller checks existence first)
    // FR: Charge le mapping stocké au chemin (l'appelant vérifie l'existence)
    virtual CheckpointState load(const std::filesystem::path& path) const = 0;

    // EN: Replace the file at path with the encoded mapping
    // FR: Remplace le fichier au chemin par le mapping encodé
    virtual void save(const std::filesystem::path& path, const CheckpointState& state) const = 0;

    // EN: Remove the file if present, returns whether something was removed
    // FR: Supprime le fichier s'il existe, retourne si quelque chose a été supprimé
    virtual bool erase(const std::filesystem::path& path) const = 0;

    virtual std::string name() const = 0;
};

// EN: Common file handling for text formats. Writes go through AtomicFileWriter.
// FR: Gestion de fichier commune aux formats texte. Les écritures passent par AtomicFileWriter.
class FileStateBackend : public IStateBackend {
public:
    CheckpointState load(const std::filesystem::path& path) const override;
    void save(const std::filesystem::path& path, const CheckpointState& state) const override;
    bool erase(const std::filesystem::path& path) const override;

protected:
    virtual CheckpointState decode(std::istream& in, const std::filesystem::path& origin) const = 0;
    virtual std::string encode(const CheckpointState& state) const = 0;
};

// EN: One JSON object per file
// FR: Un objet JSON par fichier
class JsonFileBackend : public FileStateBackend {
public:
    explicit JsonFileBackend(int indent = -1) : indent_(indent) {}

    std::string name() const override { return "json"; }

protected:
    CheckpointState decode(std::istream& in, const std::filesystem::path& origin) const override;
    std::string encode(const CheckpointState& state) const override;

private:
    int indent_;
};

// EN: One YAML map per file (yaml-cpp). Strings are always quoted so they reload as strings.
// FR: Une map YAML par fichier (yaml-cpp). Les chaînes sont toujours entre guillemets pour être relues comme chaînes.
class YamlFileBackend : public FileStateBackend {
public:
    std::string name() const override { return "yaml"; }

protected:
    CheckpointState decode(std::istream& in, const std::filesystem::path& origin) const override;
    std::string encode(const CheckpointState& state) const override;
};

// EN: Pick a backend by name ("json" or "yaml"). Throws std::invalid_argument otherwise.
// FR: Choisit un backend par nom ("json" ou "yaml"). Lance std::invalid_argument sinon.
std::shared_ptr<IStateBackend> makeStateBackend(const std::string& name);

} // namespace LSV
