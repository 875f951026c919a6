// EN: JSON lines and MessagePack blob codecs implementation
// FR: Implémentation des codecs lignes JSON et blob MessagePack

#include "loopsaver/state/state_codec.hpp"
#include "loopsaver/state/json_record.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace LSV {

namespace {

std::unique_ptr<std::ifstream> openForReading(const std::filesystem::path& path) {
    auto reader = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!reader->is_open()) {
        int err = errno;
        throw IOFailure(path, "open for reading", std::error_code(err ? err : ENOENT, std::generic_category()));
    }
    return reader;
}

} // namespace

// ---------------------------------------------------------------------------
// EN: JsonLinesSource
// FR: JsonLinesSource
// ---------------------------------------------------------------------------

JsonLinesSource::JsonLinesSource(std::unique_ptr<std::ifstream> reader, std::filesystem::path origin,
                                 size_t first_line)
    : reader_(std::move(reader)), origin_(std::move(origin)), line_number_(first_line) {}

JsonLinesSource::~JsonLinesSource() {
    release();
}

std::optional<nlohmann::json> JsonLinesSource::next() {
    std::string line;
    while (reader_) {
        if (!std::getline(*reader_, line)) {
            if (reader_->bad()) {
                release();
                throw IOFailure(origin_, "read", std::error_code(EIO, std::generic_category()));
            }
            LSV_LOG_DEBUG("state_codec", "Drained " + std::to_string(records_read_) + " pending items from " +
                          origin_.string());
            release();
            return std::nullopt;
        }

        size_t current_line = line_number_++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        ++records_read_;
        return JsonRecord::decode(line, origin_, current_line);
    }
    return std::nullopt;
}

void JsonLinesSource::close() {
    release();
}

void JsonLinesSource::release() {
    if (reader_) {
        reader_->close();
        reader_.reset();
    }
}

// ---------------------------------------------------------------------------
// EN: JsonLinesCodec
// FR: JsonLinesCodec
// ---------------------------------------------------------------------------

LoadedCheckpoint JsonLinesCodec::load(const CheckpointStore& store) const {
    const auto& path = store.path();
    auto reader = openForReading(path);

    std::string header;
    if (!std::getline(*reader, header)) {
        if (reader->bad()) {
            throw IOFailure(path, "read", std::error_code(EIO, std::generic_category()));
        }
        throw CorruptCheckpointError(path, "missing auxiliary state header line");
    }
    if (!header.empty() && header.back() == '\r') {
        header.pop_back();
    }

    LoadedCheckpoint loaded;
    loaded.state = CheckpointState::fromJson(JsonRecord::decode(header, path, 1), path.string());
    if (loaded.state.contains(kRemainingKey)) {
        throw CorruptCheckpointError(path, "auxiliary state header must not contain the reserved key 'remaining'");
    }

    // EN: The source takes ownership of the reader and streams the rest of the file on demand.
    // FR: La source prend possession du lecteur et lit le reste du fichier à la demande.
    loaded.remaining = std::make_unique<JsonLinesSource>(std::move(reader), path, 2);

    LSV_LOG_DEBUG("state_codec", "Opened JSON lines checkpoint " + path.string() + " with " +
                  std::to_string(loaded.state.size()) + " auxiliary keys");
    return loaded;
}

void JsonLinesCodec::dump(const CheckpointStore& store, const CheckpointState& state, JsonSource& remaining) const {
    auto writer = store.beginWrite();
    writer->writeLine(JsonRecord::encode(state.withoutRemaining().toJson(), "auxiliary state"));

    size_t count = 0;
    while (auto item = remaining.next()) {
        writer->writeLine(JsonRecord::encode(*item, "remaining[" + std::to_string(count) + "]"));
        ++count;
    }
    writer->commit();

    LSV_LOG_INFO_META("state_codec", "Iteration checkpoint written",
                      {{"path", store.path().string()}, {"codec", name()}, {"pending_items", std::to_string(count)}});
}

// ---------------------------------------------------------------------------
// EN: MsgpackBlobCodec
// FR: MsgpackBlobCodec
// ---------------------------------------------------------------------------

MsgpackBlobCodec::MsgpackBlobCodec(bool compress, int compression_level, size_t max_items)
    : compress_(compress), compression_level_(compression_level), max_items_(max_items) {
    if (compression_level_ < Z_DEFAULT_COMPRESSION || compression_level_ > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("Invalid zlib compression level: " + std::to_string(compression_level_));
    }
}

LoadedCheckpoint MsgpackBlobCodec::load(const CheckpointStore& store) const {
    const auto& path = store.path();
    auto reader = openForReading(path);

    std::string blob((std::istreambuf_iterator<char>(*reader)), std::istreambuf_iterator<char>());
    if (reader->bad()) {
        throw IOFailure(path, "read", std::error_code(EIO, std::generic_category()));
    }
    reader->close();

    const size_t magic_size = std::strlen(kCompressedMagic);
    if (blob.compare(0, magic_size, kCompressedMagic) == 0) {
        blob = decompressBlob(blob.substr(magic_size), path);
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::from_msgpack(blob);
    } catch (const nlohmann::json::exception& e) {
        throw CorruptCheckpointError(path, e.what());
    }

    LoadedCheckpoint loaded;
    loaded.state = CheckpointState::fromJson(root, path.string());

    auto pending = loaded.state.pop(kRemainingKey);
    if (pending) {
        if (!pending->is_array()) {
            throw CorruptCheckpointError(path, std::string("'remaining' must be an array, found ") +
                                         pending->type_name());
        }
        std::vector<nlohmann::json> items;
        items.reserve(pending->size());
        for (auto& item : *pending) {
            items.push_back(std::move(item));
        }
        loaded.remaining = makeVectorSource(std::move(items));
    }

    LSV_LOG_DEBUG("state_codec", "Loaded MessagePack checkpoint " + path.string() + " (" +
                  std::to_string(blob.size()) + " bytes)");
    return loaded;
}

void MsgpackBlobCodec::dump(const CheckpointStore& store, const CheckpointState& state, JsonSource& remaining) const {
    if (!remaining.bounded()) {
        throw SerializationError("Cannot materialize an unbounded sequence into a MessagePack checkpoint");
    }

    nlohmann::json pending = nlohmann::json::array();
    while (auto item = remaining.next()) {
        if (max_items_ != 0 && pending.size() >= max_items_) {
            throw SerializationError("Remaining items exceed the materialization limit of " +
                                     std::to_string(max_items_));
        }
        pending.push_back(std::move(*item));
    }

    nlohmann::json root = state.withoutRemaining().toJson();
    const size_t pending_count = pending.size();
    root[kRemainingKey] = std::move(pending);

    std::vector<uint8_t> packed = nlohmann::json::to_msgpack(root);
    std::string blob(packed.begin(), packed.end());
    if (compress_) {
        blob = std::string(kCompressedMagic) + compressBlob(blob, compression_level_);
    }

    auto writer = store.beginWrite();
    writer->write(blob);
    writer->commit();

    LSV_LOG_INFO_META("state_codec", "Iteration checkpoint written",
                      {{"path", store.path().string()}, {"codec", name()},
                       {"pending_items", std::to_string(pending_count)},
                       {"bytes", std::to_string(blob.size())}, {"compressed", compress_ ? "true" : "false"}});
}

std::string MsgpackBlobCodec::compressBlob(const std::string& data, int level) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, level) != Z_OK) {
        throw SerializationError("Failed to initialize zlib compression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[32768];
    std::string compressed;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
        zs.avail_out = sizeof(outbuffer);

        ret = deflate(&zs, Z_FINISH);

        if (compressed.size() < zs.total_out) {
            compressed.append(outbuffer, zs.total_out - compressed.size());
        }
    } while (ret == Z_OK);

    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw SerializationError("Failed to compress checkpoint blob");
    }
    return compressed;
}

std::string MsgpackBlobCodec::decompressBlob(const std::string& data, const std::filesystem::path& origin) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (inflateInit(&zs) != Z_OK) {
        throw CorruptCheckpointError(origin, "failed to initialize zlib decompression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string decompressed;
    char buffer[32768];
    int ret;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_NEED_DICT || ret == Z_MEM_ERROR) {
            inflateEnd(&zs);
            throw CorruptCheckpointError(origin, "invalid compressed blob (zlib error " + std::to_string(ret) + ")");
        }

        decompressed.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret != Z_STREAM_END && (zs.avail_in > 0 || zs.avail_out == 0));

    inflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw CorruptCheckpointError(origin, "truncated compressed blob");
    }
    return decompressed;
}

} // namespace LSV
