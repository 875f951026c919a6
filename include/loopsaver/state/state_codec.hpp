// EN: State codecs - the two strategies to persist auxiliary state plus the remaining items
// FR: Codecs d'état - les deux stratégies pour persister l'état auxiliaire et les éléments restants

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "loopsaver/iteration/item_source.hpp"
#include "loopsaver/state/checkpoint_state.hpp"
#include "loopsaver/state/checkpoint_store.hpp"

namespace LSV {

using JsonSource = ItemSource<nlohmann::json>;

// EN: Result of loading an iteration checkpoint
// FR: Résultat du chargement d'un checkpoint d'itération
struct LoadedCheckpoint {
    CheckpointState state;                   // EN: Auxiliary state, never holds `remaining` / FR: État auxiliaire, ne contient jamais `remaining`
    std::unique_ptr<JsonSource> remaining;   // EN: Null when the checkpoint had no pending items / FR: Nul quand le checkpoint n'avait pas d'éléments en attente
};

// EN: Encodes one checkpoint made of auxiliary state and a remaining-items stream
// FR: Encode un checkpoint composé d'un état auxiliaire et d'un flux d'éléments restants
class IStateCodec {
public:
    virtual ~IStateCodec() = default;

    // EN: Load the checkpoint at store.path(). The caller checks that it exists.
    // FR: Charge le checkpoint à store.path(). L'appelant vérifie qu'il existe.
    virtual LoadedCheckpoint load(const CheckpointStore& store) const = 0;

    // EN: Replace the checkpoint with auxiliary state plus every item left in remaining.
    //     On failure the previous checkpoint is left untouched.
    // FR: Remplace le checkpoint par l'état auxiliaire plus tous les éléments restants.
    //     En cas d'échec le checkpoint précédent reste intact.
    virtual void dump(const CheckpointStore& store, const CheckpointState& state, JsonSource& remaining) const = 0;

    // EN: Whether remaining may be an unbounded source
    // FR: Indique si remaining peut être une source non bornée
    virtual bool acceptsUnbounded() const = 0;

    virtual std::string name() const = 0;
};

// EN: Lazily decodes one JSON record per line from an owned reader.
//     The reader is released exactly once: at end of data, on close(), or on destruction.
// FR: Décode paresseusement un enregistrement JSON par ligne depuis un lecteur possédé.
//     Le lecteur est libéré exactement une fois : en fin de données, sur close(), ou à la destruction.
class JsonLinesSource : public JsonSource {
public:
    JsonLinesSource(std::unique_ptr<std::ifstream> reader, std::filesystem::path origin, size_t first_line);
    ~JsonLinesSource() override;

    JsonLinesSource(const JsonLinesSource&) = delete;
    JsonLinesSource& operator=(const JsonLinesSource&) = delete;

    std::optional<nlohmann::json> next() override;
    void close() override;

    bool isOpen() const { return reader_ != nullptr; }
    size_t recordsRead() const { return records_read_; }

private:
    void release();

    std::unique_ptr<std::ifstream> reader_;
    std::filesystem::path origin_;
    size_t line_number_;
    size_t records_read_ = 0;
};

// EN: Safe strategy. Line 1 holds the auxiliary state, each further line one remaining item.
//     Streams both ways: nothing is materialized on dump or on load.
// FR: Stratégie sûre. La ligne 1 contient l'état auxiliaire, chaque ligne suivante un élément restant.
//     Flux dans les deux sens : rien n'est matérialisé à l'écriture ni au chargement.
class JsonLinesCodec : public IStateCodec {
public:
    LoadedCheckpoint load(const CheckpointStore& store) const override;
    void dump(const CheckpointStore& store, const CheckpointState& state, JsonSource& remaining) const override;
    bool acceptsUnbounded() const override { return true; }
    std::string name() const override { return "jsonl"; }
};

// EN: Unsafe strategy. Materializes the remaining items under `remaining` and writes the whole
//     state as one MessagePack blob, optionally zlib-compressed.
//     Caveats for callers: the tail must fit in memory, and blobs must only be loaded from trusted
//     locations since decoding an attacker-controlled blob is not safe.
// FR: Stratégie non sûre. Matérialise les éléments restants sous `remaining` et écrit l'état complet
//     en un blob MessagePack, éventuellement compressé avec zlib.
//     Mises en garde : la queue doit tenir en mémoire, et les blobs ne doivent être chargés que depuis
//     des emplacements de confiance car décoder un blob contrôlé par un attaquant n'est pas sûr.
class MsgpackBlobCodec : public IStateCodec {
public:
    // EN: Magic prefix of compressed blobs
    // FR: Préfixe magique des blobs compressés
    static constexpr const char* kCompressedMagic = "LSVZ";

    explicit MsgpackBlobCodec(bool compress = false, int compression_level = 6, size_t max_items = 0);

    LoadedCheckpoint load(const CheckpointStore& store) const override;
    void dump(const CheckpointStore& store, const CheckpointState& state, JsonSource& remaining) const override;
    bool acceptsUnbounded() const override { return false; }
    std::string name() const override { return "msgpack"; }

    static std::string compressBlob(const std::string& data, int level);
    static std::string decompressBlob(const std::string& data, const std::filesystem::path& origin);

private:
    bool compress_;
    int compression_level_;
    size_t max_items_;
};

} // namespace LSV
