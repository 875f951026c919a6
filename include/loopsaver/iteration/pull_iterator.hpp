// EN: Loop drivers for pull-based checkpointed owners - range-for adapter and forEach
// FR: Pilotes de boucle pour les propriétaires pull à checkpoint - adaptateur range-for et forEach

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "loopsaver/state/checkpoint_scope.hpp"

namespace LSV {

// EN: Owner must expose std::optional<T> next(). Single pass.
// FR: Owner doit exposer std::optional<T> next(). Une seule passe.
template<typename Owner, typename T>
class PullIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using reference = T&;

    PullIterator() = default;
    explicit PullIterator(Owner* owner) : owner_(owner) { advance(); }

    reference operator*() { return *current_; }
    pointer operator->() { return &*current_; }

    PullIterator& operator++() {
        advance();
        return *this;
    }

    void operator++(int) { advance(); }

    bool operator==(const PullIterator& other) const { return owner_ == other.owner_; }
    bool operator!=(const PullIterator& other) const { return !(*this == other); }

private:
    void advance() {
        current_ = owner_->next();
        if (!current_) {
            owner_ = nullptr;
        }
    }

    Owner* owner_ = nullptr;
    std::optional<T> current_;
};

// EN: Pull every item of owner through fn, finalizing owner exactly once.
//     fn returns LoopControl, or void to always continue. An exception from fn finalizes as Interrupted.
// FR: Fait passer chaque élément de owner par fn, en finalisant owner exactement une fois.
//     fn retourne LoopControl, ou void pour toujours continuer. Une exception de fn finalise en Interrupted.
template<typename Owner, typename Fn>
CompletionStatus driveLoop(Owner& owner, Fn&& fn) {
    CheckpointScope scope(owner);
    while (auto item = owner.next()) {
        using Result = std::invoke_result_t<Fn&, decltype(*item)&>;
        if constexpr (std::is_void_v<Result>) {
            fn(*item);
        } else {
            if (fn(*item) == LoopControl::Stop) {
                scope.finish(CompletionStatus::Interrupted);
                return CompletionStatus::Interrupted;
            }
        }
    }
    scope.finish(CompletionStatus::Completed);
    return CompletionStatus::Completed;
}

} // namespace LSV
