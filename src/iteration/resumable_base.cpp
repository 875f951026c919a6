// EN: ResumableBase implementation
// FR: Implémentation de ResumableBase

#include "loopsaver/iteration/resumable_base.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

namespace LSV {

ResumableBase::ResumableBase(std::filesystem::path checkpoint_path, IterationOptions options)
    : Checkpointed(CheckpointStore(std::move(checkpoint_path))),
      options_(options),
      codec_(options.makeCodec()) {}

std::unique_ptr<JsonSource> ResumableBase::resumeFromCheckpoint(bool has_fresh_source) {
    if (!store_.exists()) {
        LSV_LOG_INFO_META("resumable", "No checkpoint found, starting fresh",
                          {{"path", store_.path().string()}, {"fresh_source", has_fresh_source ? "true" : "false"}});
        return nullptr;
    }

    LoadedCheckpoint loaded = codec_->load(store_);
    state_ = std::move(loaded.state);

    if (options_.cache_first || !has_fresh_source) {
        resumed_ = loaded.remaining != nullptr;
        LSV_LOG_INFO_META("resumable", "Resuming from checkpoint",
                          {{"path", store_.path().string()}, {"codec", codec_->name()},
                           {"auxiliary_keys", std::to_string(state_.size())},
                           {"cache_first", options_.cache_first ? "true" : "false"}});
        return std::move(loaded.remaining);
    }

    // EN: The fresh source wins. A lazily read checkpoint is released right away.
    // FR: La source fraîche l'emporte. Un checkpoint lu paresseusement est libéré immédiatement.
    if (loaded.remaining) {
        loaded.remaining->close();
    }
    LSV_LOG_INFO_META("resumable", "Fresh source preferred over checkpoint, auxiliary state kept",
                      {{"path", store_.path().string()}, {"auxiliary_keys", std::to_string(state_.size())}});
    return nullptr;
}

CheckpointState ResumableBase::persistedState() const {
    return state_.withoutRemaining();
}

void ResumableBase::onClose(CompletionStatus status) {
    if (status == CompletionStatus::Completed) {
        releaseSource();
        store_.erase();
        state_.clear();
        LSV_LOG_INFO_META("resumable", "Iteration completed, checkpoint cleared", {{"path", store_.path().string()}});
        return;
    }

    std::unique_ptr<JsonSource> remaining = takeRemaining();
    codec_->dump(store_, persistedState(), *remaining);
    remaining->close();
    LSV_LOG_INFO_META("resumable", "Iteration interrupted, checkpoint persisted",
                      {{"path", store_.path().string()}, {"codec", codec_->name()}});
}

void ResumableBase::abandonCorruptCheckpoint(const CorruptCheckpointError& error) {
    markClosed();
    releaseSource();
    LSV_LOG_ERROR_META("resumable", "Corrupt pending item, checkpoint left as is",
                       {{"path", store_.path().string()}, {"error", error.what()}});
}

bool ResumableBase::isReservedKey(const std::string& key) const {
    return key == kRemainingKey;
}

} // namespace LSV
