#pragma once
// Index snapshots: versioned binary file, written atomically
//
// Layout (host byte order):
//   u32 magic "RSNX"   u16 format major   u16 format minor
//   u64 bits           u64 words per vector
//   u64 projection fingerprint
//   u64 entity count
//   count × { u32 id length, id bytes, words × u64 }
//   u32 crc32 of everything above
//
// A snapshot only loads under the projection that wrote it: the stored bits
// are meaningless under different hyperplanes.

#include "index.hpp"
#include "log.hpp"
#include "projection.hpp"
#include "types.hpp"
#include "version.hpp"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace resonance {

constexpr uint32_t SNAPSHOT_MAGIC = 0x584E5352;  // "RSNX"

inline std::vector<uint8_t> serialize_index(const IndexView& view) {
    std::vector<uint8_t> data;
    data.reserve(48 + view.size() * (16 + view.words_per_vector() * sizeof(uint64_t)));

    auto write = [&data](const void* ptr, size_t size) {
        const uint8_t* bytes = static_cast<const uint8_t*>(ptr);
        data.insert(data.end(), bytes, bytes + size);
    };

    uint32_t magic = SNAPSHOT_MAGIC;
    uint16_t major = RESONANCE_SNAPSHOT_FORMAT_MAJOR;
    uint16_t minor = RESONANCE_SNAPSHOT_FORMAT_MINOR;
    uint64_t bits = view.bits();
    uint64_t words = view.words_per_vector();
    uint64_t fingerprint = view.fingerprint();
    uint64_t count = view.size();
    write(&magic, sizeof(magic));
    write(&major, sizeof(major));
    write(&minor, sizeof(minor));
    write(&bits, sizeof(bits));
    write(&words, sizeof(words));
    write(&fingerprint, sizeof(fingerprint));
    write(&count, sizeof(count));

    view.for_each(0, view.size(), [&](const EntityId& id, WordSpan span) {
        uint32_t len = static_cast<uint32_t>(id.size());
        write(&len, sizeof(len));
        write(id.data(), id.size());
        write(span.data, span.size * sizeof(uint64_t));
    });

    uint32_t crc = crc32(data.data(), data.size());
    write(&crc, sizeof(crc));
    return data;
}

// Rebuild an index from snapshot bytes. The projection must be the one the
// snapshot was written under (ProjectionMismatch / DimensionMismatch).
inline std::unique_ptr<ResonanceIndex> deserialize_index(
    const std::vector<uint8_t>& data, const ProjectionMatrix& projection,
    IndexConfig config = {})
{
    size_t pos = 0;
    const size_t body_end = data.size() >= sizeof(uint32_t) ? data.size() - sizeof(uint32_t) : 0;

    auto read = [&data, &pos, body_end](void* ptr, size_t size) {
        if (pos + size > body_end) {
            char error_buf[160];
            snprintf(error_buf, sizeof(error_buf),
                     "unexpected end at offset %zu, need %zu bytes, have %zu",
                     pos, size, body_end > pos ? body_end - pos : size_t(0));
            throw SnapshotFormatError(error_buf);
        }
        std::memcpy(ptr, data.data() + pos, size);
        pos += size;
    };

    uint32_t magic = 0;
    uint16_t major = 0, minor = 0;
    read(&magic, sizeof(magic));
    if (magic != SNAPSHOT_MAGIC) throw SnapshotFormatError("invalid magic");
    read(&major, sizeof(major));
    read(&minor, sizeof(minor));
    if (!version::snapshot_compatible(major, minor)) {
        throw SnapshotFormatError("unsupported format " + std::to_string(major) + "." +
                                  std::to_string(minor));
    }

    uint32_t stored_crc = 0;
    std::memcpy(&stored_crc, data.data() + body_end, sizeof(stored_crc));
    if (crc32(data.data(), body_end) != stored_crc) {
        throw SnapshotFormatError("checksum mismatch");
    }

    uint64_t bits = 0, words = 0, fingerprint = 0, count = 0;
    read(&bits, sizeof(bits));
    read(&words, sizeof(words));
    read(&fingerprint, sizeof(fingerprint));
    read(&count, sizeof(count));

    if (bits != projection.bits()) {
        throw DimensionMismatch("snapshot bits", projection.bits(), static_cast<size_t>(bits));
    }
    if (words != Hypervector::words_for(bits)) {
        throw SnapshotFormatError("word count " + std::to_string(words) +
                                  " does not fit " + std::to_string(bits) + " bits");
    }
    if (fingerprint != projection.fingerprint()) {
        throw ProjectionMismatch("snapshot was written under a different seed or dimension");
    }

    auto index = std::make_unique<ResonanceIndex>(bits, fingerprint, config);

    WriteBatch batch;
    for (uint64_t i = 0; i < count; ++i) {
        uint32_t len = 0;
        read(&len, sizeof(len));
        std::string id(len, '\0');
        read(&id[0], len);

        std::vector<uint64_t> packed(words);
        read(packed.data(), words * sizeof(uint64_t));
        batch.insert(std::move(id), Hypervector::from_words(bits, fingerprint, std::move(packed)));
    }
    if (pos != body_end) {
        throw SnapshotFormatError(std::to_string(body_end - pos) + " trailing bytes");
    }

    try {
        index->apply(batch);
    } catch (const DuplicateEntity& e) {
        throw SnapshotFormatError("duplicate entity " + e.entity_id());
    }
    return index;
}

// Throws SnapshotFormatError if the file cannot be written
inline void save_index(const IndexView& view, const std::string& path) {
    auto data = serialize_index(view);
    bool ok = safe_save(path, [&data](FILE* f) {
        return ::fwrite(data.data(), 1, data.size(), f) == data.size();
    });
    if (!ok) {
        throw SnapshotFormatError("cannot write " + path);
    }
    log::info("snapshot", "saved %zu entities to %s (%zu bytes)",
              view.size(), path.c_str(), data.size());
}

inline std::unique_ptr<ResonanceIndex> load_index(const std::string& path,
                                                  const ProjectionMatrix& projection,
                                                  IndexConfig config = {})
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SnapshotFormatError("cannot open " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw SnapshotFormatError("read error on " + path);
    }

    auto index = deserialize_index(data, projection, config);
    log::debug("snapshot", "loaded %zu entities from %s", index->size(), path.c_str());
    return index;
}

} // namespace resonance
