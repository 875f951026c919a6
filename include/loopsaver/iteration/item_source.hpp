// EN: Pull-based lazy item sources used as the "remaining" sequence of resumable iterators
// FR: Sources d'éléments paresseuses en mode pull utilisées comme séquence "remaining" des itérateurs reprenables

#pragma once

#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace LSV {

// EN: A lazy sequence. next() returns std::nullopt once drained and keeps doing so.
//     close() releases any underlying resource early; it must be idempotent.
// FR: Une séquence paresseuse. next() retourne std::nullopt une fois épuisée et continue ainsi.
//     close() libère toute ressource sous-jacente par anticipation ; doit être idempotent.
template<typename T>
class ItemSource {
public:
    virtual ~ItemSource() = default;

    virtual std::optional<T> next() = 0;

    // EN: False for sources that may never end (they cannot be materialized)
    // FR: Faux pour les sources qui peuvent ne jamais finir (non matérialisables)
    virtual bool bounded() const { return true; }

    virtual void close() {}
};

// EN: Items held in memory
// FR: Éléments conservés en mémoire
template<typename T>
class VectorSource : public ItemSource<T> {
public:
    explicit VectorSource(std::vector<T> items) : items_(std::move(items)) {}

    std::optional<T> next() override {
        if (index_ >= items_.size()) {
            return std::nullopt;
        }
        return std::move(items_[index_++]);
    }

    void close() override {
        index_ = items_.size();
    }

    size_t remaining() const { return items_.size() - index_; }

private:
    std::vector<T> items_;
    size_t index_ = 0;
};

// EN: Items produced on demand by a callable. Unbounded unless declared otherwise.
// FR: Éléments produits à la demande par un callable. Non borné sauf déclaration contraire.
template<typename T>
class GeneratorSource : public ItemSource<T> {
public:
    using Generator = std::function<std::optional<T>()>;

    explicit GeneratorSource(Generator generator, bool bounded = false)
        : generator_(std::move(generator)), bounded_(bounded) {}

    std::optional<T> next() override {
        if (done_) {
            return std::nullopt;
        }
        auto item = generator_();
        if (!item) {
            done_ = true;
        }
        return item;
    }

    bool bounded() const override { return bounded_; }

    void close() override { done_ = true; }

private:
    Generator generator_;
    bool bounded_;
    bool done_ = false;
};

// EN: One optional head item followed by a tail source
// FR: Un élément de tête optionnel suivi d'une source de queue
template<typename T>
class ChainSource : public ItemSource<T> {
public:
    ChainSource(std::optional<T> head, std::unique_ptr<ItemSource<T>> tail)
        : head_(std::move(head)), tail_(std::move(tail)) {}

    std::optional<T> next() override {
        if (head_) {
            std::optional<T> item = std::move(head_);
            head_.reset();
            return item;
        }
        return tail_ ? tail_->next() : std::nullopt;
    }

    bool bounded() const override { return !tail_ || tail_->bounded(); }

    void close() override {
        head_.reset();
        if (tail_) {
            tail_->close();
        }
    }

private:
    std::optional<T> head_;
    std::unique_ptr<ItemSource<T>> tail_;
};

// EN: Maps every item of an inner source through a conversion
// FR: Transforme chaque élément d'une source interne par une conversion
template<typename From, typename To>
class TransformSource : public ItemSource<To> {
public:
    using Transform = std::function<To(From&&)>;

    TransformSource(std::unique_ptr<ItemSource<From>> inner, Transform transform)
        : inner_(std::move(inner)), transform_(std::move(transform)) {}

    std::optional<To> next() override {
        auto item = inner_->next();
        if (!item) {
            return std::nullopt;
        }
        return transform_(std::move(*item));
    }

    bool bounded() const override { return inner_->bounded(); }

    void close() override { inner_->close(); }

private:
    std::unique_ptr<ItemSource<From>> inner_;
    Transform transform_;
};

template<typename T>
std::unique_ptr<ItemSource<T>> makeVectorSource(std::vector<T> items) {
    return std::make_unique<VectorSource<T>>(std::move(items));
}

template<typename Range>
auto makeRangeSource(const Range& range) {
    using T = std::decay_t<decltype(*std::begin(range))>;
    return makeVectorSource(std::vector<T>(std::begin(range), std::end(range)));
}

template<typename T>
std::unique_ptr<ItemSource<T>> makeGeneratorSource(std::function<std::optional<T>()> generator,
                                                   bool bounded = false) {
    return std::make_unique<GeneratorSource<T>>(std::move(generator), bounded);
}

} // namespace LSV
