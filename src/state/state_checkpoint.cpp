// EN: StateCheckpoint implementation
// FR: Implémentation de StateCheckpoint

#include "loopsaver/state/state_checkpoint.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <exception>
#include <stdexcept>

namespace LSV {

StateCheckpoint::StateCheckpoint(std::filesystem::path path, bool erase_on_success,
                                 std::shared_ptr<IStateBackend> backend)
    : Checkpointed(CheckpointStore(std::move(path), std::move(backend))),
      erase_on_success_(erase_on_success),
      uncaught_on_entry_(std::uncaught_exceptions()) {
    state_ = store_.load();
}

StateCheckpoint::~StateCheckpoint() {
    const bool unwinding = std::uncaught_exceptions() > uncaught_on_entry_;
    closeQuietly(unwinding ? CompletionStatus::Interrupted : CompletionStatus::Completed);
}

void StateCheckpoint::save() {
    if (closed()) {
        throw std::logic_error("StateCheckpoint is already closed");
    }
    store_.save(state_);
}

void StateCheckpoint::onClose(CompletionStatus status) {
    if (status == CompletionStatus::Completed && erase_on_success_) {
        store_.erase();
        return;
    }
    store_.save(state_);
    LSV_LOG_DEBUG("state_checkpoint", "Closed as " + completionStatusToString(status) + ", state kept at " +
                  store_.path().string());
}

} // namespace LSV
