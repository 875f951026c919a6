// EN: ResumableIterator - iterate a sequence and resume where a previous run stopped
// FR: ResumableIterator - itère une séquence et reprend là où une exécution précédente s'est arrêtée

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "loopsaver/iteration/item_source.hpp"
#include "loopsaver/iteration/iteration_options.hpp"
#include "loopsaver/iteration/pull_iterator.hpp"
#include "loopsaver/iteration/resumable_base.hpp"

namespace LSV {

// EN: Yields items of type T, from the checkpoint's pending items or from a fresh source.
//     Exhaustion erases the checkpoint. Interruption (LoopControl::Stop, exception, destruction
//     before exhaustion) persists the auxiliary state plus every item not yet handed out.
//     An item already handed out when interrupted is not replayed. T must convert to and from
//     nlohmann::json. A persist failure on the destructor path (break out of a range-for) is only
//     logged; call close(CompletionStatus::Interrupted) explicitly to get the exception.
//     A pending item that cannot be read back leaves the checkpoint file untouched.
// FR: Produit des éléments de type T, depuis les éléments en attente du checkpoint ou une source fraîche.
//     L'épuisement efface le checkpoint. L'interruption (LoopControl::Stop, exception, destruction
//     avant épuisement) persiste l'état auxiliaire et tous les éléments pas encore remis.
//     Un élément déjà remis lors de l'interruption n'est pas rejoué. T doit se convertir depuis et vers
//     nlohmann::json. Un échec de persistance depuis le destructeur (sortie d'un range-for) est
//     seulement journalisé ; appeler close(CompletionStatus::Interrupted) explicitement pour obtenir l'exception.
//     Un élément en attente illisible laisse le fichier de checkpoint intact.
template<typename T>
class ResumableIterator : public ResumableBase {
public:
    using value_type = T;
    using iterator = PullIterator<ResumableIterator<T>, T>;

    explicit ResumableIterator(std::filesystem::path checkpoint_path,
                               std::unique_ptr<ItemSource<T>> fresh = nullptr,
                               IterationOptions options = IterationOptions())
        : ResumableBase(std::move(checkpoint_path), options) {
        if (fresh && !fresh->bounded() && !codec().acceptsUnbounded()) {
            throw std::invalid_argument("Unbounded sources cannot be checkpointed with the " + codec().name() +
                                        " strategy, use the safe strategy instead");
        }

        std::unique_ptr<JsonSource> pending = resumeFromCheckpoint(fresh != nullptr);
        if (pending) {
            source_ = decodeItems(std::move(pending), store_.path());
        } else {
            source_ = std::move(fresh);
        }
    }

    ~ResumableIterator() override {
        closeQuietly(CompletionStatus::Interrupted);
    }

    // EN: Next item, or std::nullopt once drained (the checkpoint is then erased)
    // FR: Élément suivant, ou std::nullopt une fois épuisé (le checkpoint est alors effacé)
    std::optional<T> next() {
        if (closed()) {
            return std::nullopt;
        }
        std::optional<T> item;
        try {
            item = pull();
        } catch (const CorruptCheckpointError& e) {
            abandonCorruptCheckpoint(e);
            throw;
        }
        if (!item) {
            close(CompletionStatus::Completed);
        }
        return item;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // EN: Drive the loop. fn returns LoopControl (or nothing to always continue).
    // FR: Pilote la boucle. fn retourne LoopControl (ou rien pour toujours continuer).
    template<typename Fn>
    CompletionStatus forEach(Fn&& fn) {
        return driveLoop(*this, std::forward<Fn>(fn));
    }

protected:
    virtual std::optional<T> pull() {
        return source_ ? source_->next() : std::nullopt;
    }

    std::unique_ptr<JsonSource> takeRemaining() override {
        return encodeItems(std::move(source_));
    }

    void releaseSource() override {
        if (source_) {
            source_->close();
            source_.reset();
        }
    }

    static std::unique_ptr<ItemSource<T>> decodeItems(std::unique_ptr<JsonSource> pending,
                                                      std::filesystem::path origin) {
        return std::make_unique<TransformSource<nlohmann::json, T>>(
            std::move(pending), [origin = std::move(origin)](nlohmann::json&& value) -> T {
                try {
                    return value.get<T>();
                } catch (const nlohmann::json::exception& e) {
                    throw CorruptCheckpointError(origin, std::string("cannot decode pending item: ") + e.what());
                }
            });
    }

    static std::unique_ptr<JsonSource> encodeItems(std::unique_ptr<ItemSource<T>> items) {
        if (!items) {
            return makeVectorSource(std::vector<nlohmann::json>{});
        }
        return std::make_unique<TransformSource<T, nlohmann::json>>(
            std::move(items), [](T&& value) -> nlohmann::json { return nlohmann::json(std::move(value)); });
    }

    std::unique_ptr<ItemSource<T>> source_;
};

// EN: Convenience constructor from any range held in memory
// FR: Constructeur pratique depuis n'importe quelle plage en mémoire
template<typename Range>
auto makeResumableIterator(std::filesystem::path checkpoint_path, const Range& range,
                           IterationOptions options = IterationOptions()) {
    using T = std::decay_t<decltype(*std::begin(range))>;
    return std::make_unique<ResumableIterator<T>>(std::move(checkpoint_path), makeRangeSource(range), options);
}

} // namespace LSV
