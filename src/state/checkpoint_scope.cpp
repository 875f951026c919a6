// EN: Checkpointed and CheckpointScope implementation
// FR: Implémentation de Checkpointed et CheckpointScope

#include "loopsaver/state/checkpoint_scope.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace LSV {

std::string completionStatusToString(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::Completed: return "completed";
        case CompletionStatus::Interrupted: return "interrupted";
        default: return "unknown";
    }
}

Checkpointed::Checkpointed(CheckpointStore store) : store_(std::move(store)) {}

void Checkpointed::set(const std::string& key, nlohmann::json value) {
    if (isReservedKey(key)) {
        throw std::invalid_argument("Key '" + key + "' is reserved and cannot be set directly");
    }
    state_.set(key, std::move(value));
}

bool Checkpointed::erase(const std::string& key) {
    if (isReservedKey(key)) {
        throw std::invalid_argument("Key '" + key + "' is reserved and cannot be erased directly");
    }
    return state_.erase(key);
}

bool Checkpointed::isReservedKey(const std::string&) const {
    return false;
}

void Checkpointed::close(CompletionStatus status) {
    if (closed_) {
        return;
    }
    // EN: Marked first so a failed finalization is never retried from a destructor.
    // FR: Marqué d'abord pour qu'une finalisation échouée ne soit jamais retentée depuis un destructeur.
    closed_ = true;
    onClose(status);
}

void Checkpointed::closeQuietly(CompletionStatus status) noexcept {
    try {
        close(status);
    } catch (const std::exception& e) {
        try {
            LSV_LOG_ERROR_META("checkpoint", "Failed to finalize checkpoint",
                               {{"path", store_.path().string()},
                                {"status", completionStatusToString(status)},
                                {"error", e.what()}});
        } catch (const std::exception&) {
            // EN: Logging itself failed while finalizing; nothing left to report to.
            // FR: La journalisation a elle-même échoué pendant la finalisation ; plus rien à notifier.
        }
    }
}

CheckpointScope::~CheckpointScope() {
    if (!finished_) {
        target_.closeQuietly(CompletionStatus::Interrupted);
    }
}

void CheckpointScope::finish(CompletionStatus status) {
    finished_ = true;
    target_.close(status);
}

} // namespace LSV
