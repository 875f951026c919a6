// EN: AtomicFileWriter implementation
// FR: Implémentation de AtomicFileWriter

#include "loopsaver/state/atomic_file_writer.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"
#include "loopsaver/infrastructure/system/errors.hpp"

#include <cerrno>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace LSV {

namespace {

// EN: fsync a path opened read-only. Directories are synced best-effort.
// FR: fsync d'un chemin ouvert en lecture seule. Les répertoires sont synchronisés au mieux.
std::error_code syncPath(const std::filesystem::path& path, bool directory) {
#ifndef _WIN32
    int flags = O_RDONLY;
    if (directory) {
        flags |= O_DIRECTORY;
    }
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        return std::error_code(errno, std::generic_category());
    }
    std::error_code ec;
    if (::fsync(fd) != 0) {
        ec = std::error_code(errno, std::generic_category());
    }
    ::close(fd);
    return ec;
#else
    (void)path;
    (void)directory;
    return {};
#endif
}

} // namespace

std::filesystem::path AtomicFileWriter::tempPathFor(const std::filesystem::path& target) {
    std::filesystem::path temp = target;
    temp += ".tmp";
    return temp;
}

AtomicFileWriter::AtomicFileWriter(std::filesystem::path target, bool durable)
    : target_(std::move(target)), temp_(tempPathFor(target_)), durable_(durable) {
    out_.open(temp_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        int err = errno;
        throw IOFailure(temp_, "open for writing", std::error_code(err ? err : EIO, std::generic_category()));
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) {
        discard();
    }
}

void AtomicFileWriter::write(std::string_view data) {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    checkStream("write");
}

void AtomicFileWriter::writeLine(std::string_view line) {
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    checkStream("write");
}

void AtomicFileWriter::checkStream(const char* operation) {
    if (!out_) {
        throw IOFailure(temp_, operation, std::make_error_code(std::errc::io_error));
    }
}

void AtomicFileWriter::commit() {
    if (committed_ || discarded_) {
        throw IOFailure(target_, "commit", std::make_error_code(std::errc::operation_not_permitted));
    }

    out_.flush();
    checkStream("flush");
    out_.close();
    if (out_.fail()) {
        throw IOFailure(temp_, "close", std::make_error_code(std::errc::io_error));
    }

    if (durable_) {
        if (auto ec = syncPath(temp_, false)) {
            throw IOFailure(temp_, "fsync", ec);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_, target_, ec);
    if (ec) {
        throw IOFailure(target_, "rename", ec);
    }
    committed_ = true;

    if (durable_) {
        auto parent = target_.parent_path();
        if (parent.empty()) {
            parent = ".";
        }
        if (auto dir_ec = syncPath(parent, true)) {
            LSV_LOG_WARN("atomic_writer", "Directory sync failed for " + parent.string() + ": " + dir_ec.message());
        }
    }

    LSV_LOG_DEBUG("atomic_writer", "Replaced " + target_.string());
}

void AtomicFileWriter::discard() noexcept {
    if (committed_ || discarded_) {
        return;
    }
    discarded_ = true;
    if (out_.is_open()) {
        out_.close();
    }
    std::error_code ec;
    std::filesystem::remove(temp_, ec);
}

} // namespace LSV
