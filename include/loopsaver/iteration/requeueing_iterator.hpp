// EN: RequeueingIterator - a resumable iterator that replays the in-flight item after an interruption
// FR: RequeueingIterator - un itérateur reprenable qui rejoue l'élément en cours après une interruption

#pragma once

#include <optional>

#include "loopsaver/iteration/resumable_iterator.hpp"

namespace LSV {

// EN: The item handed out last stays "current" until the consumer asks for the next one.
//     On interruption the persisted pending items are [current] + rest, so an item whose
//     processing did not finish is delivered again on the next run.
// FR: L'élément remis en dernier reste "courant" jusqu'à ce que le consommateur demande le suivant.
//     À l'interruption les éléments en attente persistés sont [courant] + reste, donc un élément dont
//     le traitement n'a pas abouti est redistribué à l'exécution suivante.
template<typename T>
class RequeueingIterator : public ResumableIterator<T> {
public:
    explicit RequeueingIterator(std::filesystem::path checkpoint_path,
                                std::unique_ptr<ItemSource<T>> fresh = nullptr,
                                IterationOptions options = IterationOptions())
        : ResumableIterator<T>(std::move(checkpoint_path), std::move(fresh), options) {
        // EN: A `current` key read from disk is never auxiliary state.
        // FR: Une clé `current` lue depuis le disque n'est jamais un état auxiliaire.
        this->state_.erase(kCurrentKey);
    }

    ~RequeueingIterator() override {
        this->closeQuietly(CompletionStatus::Interrupted);
    }

    // EN: Item currently being processed, if any
    // FR: Élément en cours de traitement, s'il y en a un
    const std::optional<T>& current() const { return current_; }

protected:
    std::optional<T> pull() override {
        clearCurrent();
        std::optional<T> item = ResumableIterator<T>::pull();
        if (item) {
            current_ = *item;
            this->state_.set(kCurrentKey, nlohmann::json(*item));
        }
        return item;
    }

    std::unique_ptr<JsonSource> takeRemaining() override {
        std::optional<T> head = std::move(current_);
        clearCurrent();
        auto rest = std::move(this->source_);
        return ResumableIterator<T>::encodeItems(
            std::make_unique<ChainSource<T>>(std::move(head), std::move(rest)));
    }

    void releaseSource() override {
        clearCurrent();
        ResumableIterator<T>::releaseSource();
    }

    CheckpointState persistedState() const override {
        CheckpointState persisted = ResumableIterator<T>::persistedState();
        persisted.erase(kCurrentKey);
        return persisted;
    }

    bool isReservedKey(const std::string& key) const override {
        return key == kCurrentKey || ResumableIterator<T>::isReservedKey(key);
    }

private:
    void clearCurrent() {
        current_.reset();
        this->state_.erase(kCurrentKey);
    }

    std::optional<T> current_;
};

} // namespace LSV
