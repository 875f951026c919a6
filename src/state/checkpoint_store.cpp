// EN: CheckpointStore implementation
// FR: Implémentation de CheckpointStore

#include "loopsaver/state/checkpoint_store.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace LSV {

CheckpointStore::CheckpointStore(std::filesystem::path path, std::shared_ptr<IStateBackend> backend)
    : path_(std::move(path)), backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("CheckpointStore requires a state backend");
    }
    if (path_.empty()) {
        throw std::invalid_argument("CheckpointStore requires a non-empty path");
    }
}

bool CheckpointStore::exists() const {
    std::error_code ec;
    bool present = std::filesystem::exists(path_, ec);
    if (ec) {
        throw IOFailure(path_, "stat", ec);
    }
    return present;
}

CheckpointState CheckpointStore::load() const {
    if (!exists()) {
        LSV_LOG_DEBUG("checkpoint_store", "No checkpoint at " + path_.string() + ", starting empty");
        return CheckpointState{};
    }
    return backend_->load(path_);
}

void CheckpointStore::save(const CheckpointState& state) const {
    backend_->save(path_, state);
    LSV_LOG_INFO_META("checkpoint_store", "Checkpoint saved",
                      {{"path", path_.string()}, {"keys", std::to_string(state.size())}, {"backend", backend_->name()}});
}

bool CheckpointStore::erase() const {
    bool removed = backend_->erase(path_);
    if (removed) {
        LSV_LOG_INFO_META("checkpoint_store", "Checkpoint erased", {{"path", path_.string()}});
    }
    return removed;
}

std::unique_ptr<AtomicFileWriter> CheckpointStore::beginWrite() const {
    return std::make_unique<AtomicFileWriter>(path_);
}

} // namespace LSV
