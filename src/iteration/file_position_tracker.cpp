// EN: FilePositionTracker and backward line-start rewind implementation
// FR: Implémentation de FilePositionTracker et du retour arrière au début de ligne

#include "loopsaver/iteration/file_position_tracker.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace LSV {

namespace {

const std::filesystem::path kInputStreamName = "<input stream>";

IOFailure streamFailure(const std::string& operation) {
    return IOFailure(kInputStreamName, operation, std::error_code(EIO, std::generic_category()));
}

} // namespace

std::streamoff rewindToLineStart(std::istream& stream, std::streamoff pos, size_t window_step) {
    if (window_step == 0) {
        throw std::invalid_argument("rewindToLineStart requires a positive window step");
    }

    std::streamoff result = 0;
    if (pos > 0) {
        // EN: Look for the last '\n' strictly before byte pos - 1.
        // FR: Cherche le dernier '\n' strictement avant l'octet pos - 1.
        const std::streamoff last = pos - 1;
        std::vector<char> window;

        for (size_t k = 1;; ++k) {
            const auto span = static_cast<std::streamoff>(window_step * k);
            const std::streamoff start = last > span ? last - span : 0;

            window.resize(static_cast<size_t>(last - start));
            stream.clear();
            stream.seekg(start);
            stream.read(window.data(), static_cast<std::streamsize>(window.size()));
            if (stream.bad()) {
                throw streamFailure("rewind");
            }

            bool found = false;
            for (std::streamsize i = stream.gcount(); i > 0; --i) {
                if (window[static_cast<size_t>(i - 1)] == '\n') {
                    result = start + i;
                    found = true;
                    break;
                }
            }

            if (found || start == 0) {
                break;
            }
        }
    }

    stream.clear();
    stream.seekg(result);
    if (stream.fail()) {
        throw streamFailure("seek");
    }
    return result;
}

FilePositionTracker::FilePositionTracker(std::unique_ptr<std::istream> stream,
                                         std::filesystem::path checkpoint_path,
                                         IterationOptions options)
    : Checkpointed(CheckpointStore(std::move(checkpoint_path))),
      stream_(std::move(stream)),
      options_(options) {
    if (!stream_) {
        throw std::invalid_argument("FilePositionTracker requires an open stream");
    }
    if (options_.rewind_window == 0) {
        throw std::invalid_argument("rewind_window must be positive");
    }

    state_ = store_.load();

    std::streamoff saved = 0;
    if (auto value = state_.tryGet(kPositionKey)) {
        if (!value->is_number_integer() || value->get<int64_t>() < 0) {
            throw CorruptCheckpointError(store_.path(), "'pos' must be a non-negative integer");
        }
        saved = static_cast<std::streamoff>(value->get<int64_t>());
    }

    start_offset_ = resolveStartOffset(saved);
    offset_ = start_offset_;

    LSV_LOG_INFO_META("file_tracker", "Reading stream",
                      {{"checkpoint", store_.path().string()},
                       {"saved_offset", std::to_string(saved)},
                       {"start_offset", std::to_string(start_offset_)},
                       {"realigned", realigned_ ? "true" : "false"}});
}

FilePositionTracker::~FilePositionTracker() {
    closeQuietly(CompletionStatus::Interrupted);
}

std::unique_ptr<FilePositionTracker> FilePositionTracker::openFile(const std::filesystem::path& data_path,
                                                                   std::filesystem::path checkpoint_path,
                                                                   IterationOptions options) {
    auto stream = std::make_unique<std::ifstream>(data_path, std::ios::binary);
    if (!stream->is_open()) {
        int err = errno;
        throw IOFailure(data_path, "open for reading", std::error_code(err ? err : ENOENT, std::generic_category()));
    }
    return std::make_unique<FilePositionTracker>(std::move(stream), std::move(checkpoint_path), options);
}

std::optional<std::string> FilePositionTracker::nextLine() {
    if (closed() || !stream_) {
        return std::nullopt;
    }

    std::string line;
    const std::streamoff line_start = offset_;
    if (!std::getline(*stream_, line)) {
        if (stream_->bad()) {
            throwReadFailure("read");
        }
        close(CompletionStatus::Completed);
        return std::nullopt;
    }

    // EN: A final line without '\n' sets eofbit and consumes no terminator.
    // FR: Une dernière ligne sans '\n' positionne eofbit et ne consomme aucun terminateur.
    offset_ += static_cast<std::streamoff>(line.size()) + (stream_->eof() ? 0 : 1);
    last_line_start_ = line_start;
    return line;
}

void FilePositionTracker::onClose(CompletionStatus status) {
    stream_.reset();

    if (status == CompletionStatus::Completed) {
        store_.erase();
        LSV_LOG_INFO_META("file_tracker", "Stream exhausted, checkpoint cleared",
                          {{"checkpoint", store_.path().string()}, {"end_offset", std::to_string(offset_)}});
        return;
    }

    std::streamoff saved = offset_;
    if (options_.replay_in_flight && last_line_start_) {
        saved = *last_line_start_;
    }
    state_.set(kPositionKey, static_cast<int64_t>(saved));
    store_.save(state_);

    LSV_LOG_INFO_META("file_tracker", "Reading interrupted, offset saved",
                      {{"checkpoint", store_.path().string()}, {"offset", std::to_string(saved)},
                       {"replay_in_flight", options_.replay_in_flight ? "true" : "false"}});
}

bool FilePositionTracker::isReservedKey(const std::string& key) const {
    return key == kPositionKey;
}

std::streamoff FilePositionTracker::resolveStartOffset(std::streamoff saved) {
    if (saved > 0 && options_.rewind_on_resume) {
        stream_->clear();
        stream_->seekg(saved - 1);
        char previous = 0;
        const bool on_boundary = stream_->get(previous) && previous == '\n';
        if (!on_boundary) {
            realigned_ = true;
            std::streamoff aligned = rewindToLineStart(*stream_, saved, options_.rewind_window);
            LSV_LOG_WARN_META("file_tracker", "Saved offset is not on a line boundary, rewound to line start",
                              {{"saved_offset", std::to_string(saved)}, {"aligned_offset", std::to_string(aligned)}});
            return aligned;
        }
    }

    stream_->clear();
    stream_->seekg(saved);
    if (stream_->fail()) {
        throwReadFailure("seek");
    }
    return saved;
}

void FilePositionTracker::throwReadFailure(const std::string& operation) const {
    throw streamFailure(operation);
}

} // namespace LSV
