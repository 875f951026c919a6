// EN: Options shared by the resumable iterators and the file position tracker
// FR: Options partagées par les itérateurs reprenables et le suivi de position de fichier

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "loopsaver/infrastructure/config/config_manager.hpp"
#include "loopsaver/state/state_codec.hpp"

namespace LSV {

struct IterationOptions {
    // EN: Streaming JSON lines checkpoints when true, MessagePack blobs when false
    // FR: Checkpoints en lignes JSON en flux si vrai, blobs MessagePack si faux
    bool safe = true;

    // EN: A checkpoint's remaining items win over a freshly supplied source
    // FR: Les éléments restants d'un checkpoint l'emportent sur une source fraîche
    bool cache_first = true;

    bool compress_blob = false;
    int compression_level = 6;

    // EN: Upper bound on items materialized by the blob strategy, 0 for no limit
    // FR: Borne sur les éléments matérialisés par la stratégie blob, 0 pour aucune limite
    size_t max_materialized_items = 0;

    // EN: File position tracking
    // FR: Suivi de position de fichier
    bool rewind_on_resume = true;
    bool replay_in_flight = false;
    size_t rewind_window = 100;

    std::unique_ptr<IStateCodec> makeCodec() const;

    // EN: Read overrides from a configuration section. Throws std::invalid_argument on bad types or ranges.
    // FR: Lit les surcharges depuis une section de configuration. Lance std::invalid_argument sur type ou plage invalide.
    static IterationOptions fromConfig(const ConfigManager& config, const std::string& section = "checkpoint");

    static std::vector<ConfigManager::ValidationRule> validationRules(const std::string& section = "checkpoint");
};

} // namespace LSV
