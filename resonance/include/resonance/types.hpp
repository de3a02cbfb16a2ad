#pragma once
// Core types: fragments, dense vectors, match results
//
// A profile is a handful of tagged fragments. Each fragment becomes a dense
// vector, then a hypervector. Dense vectors never outlive encoding.

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace resonance {

// Hypervector width used when nothing else is configured
constexpr size_t DEFAULT_D_BITS = 10000;

// Dense dimension of the default embedding (all-MiniLM-L6-v2 compatible)
constexpr size_t DEFAULT_EMBED_DIM = 384;

// Seed the projection hyperplanes are drawn from
constexpr uint64_t DEFAULT_PROJECTION_SEED = 42;

// Entity identifiers are opaque, stable strings (agent ids)
using EntityId = std::string;

// FNV-1a 64 - deterministic across platforms (unlike std::hash)
inline uint64_t fnv1a64(const void* data, size_t length, uint64_t hash = 0xcbf29ce484222325ULL) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < length; ++i) {
        hash ^= bytes[i];
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

inline uint64_t fnv1a64(const std::string& s) {
    return fnv1a64(s.data(), s.size());
}

// One semantic facet of a profile or query ("skills", "bio", ...)
struct SemanticFragment {
    std::string field_tag;
    std::string text;

    SemanticFragment() = default;
    SemanticFragment(std::string tag, std::string t)
        : field_tag(std::move(tag)), text(std::move(t)) {}
};

// Dense embedding. Length is whatever the provider produces; callers check it
// against the projection instead of padding or truncating.
class DenseVector {
public:
    std::vector<float> data;

    DenseVector() = default;
    explicit DenseVector(std::vector<float> v) : data(std::move(v)) {}

    static DenseVector zeros(size_t dim) {
        return DenseVector(std::vector<float>(dim, 0.0f));
    }

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    float& operator[](size_t i) { return data[i]; }
    const float& operator[](size_t i) const { return data[i]; }

    float dot(const DenseVector& other) const {
        if (other.size() != size()) {
            throw DimensionMismatch("dense dot product", size(), other.size());
        }
        float sum = 0.0f;
        for (size_t i = 0; i < data.size(); ++i) {
            sum += data[i] * other.data[i];
        }
        return sum;
    }

    // Cosine similarity (single pass)
    float cosine(const DenseVector& other) const {
        if (other.size() != size()) {
            throw DimensionMismatch("dense cosine", size(), other.size());
        }
        float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
        for (size_t i = 0; i < data.size(); ++i) {
            float ai = data[i];
            float bi = other.data[i];
            dot += ai * bi;
            norm_a += ai * ai;
            norm_b += bi * bi;
        }
        float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
        return denom > 0.0f ? dot / denom : 0.0f;
    }

    float norm_sq() const {
        float sum = 0.0f;
        for (float x : data) sum += x * x;
        return sum;
    }

    // Normalize to unit length; a zero vector stays zero
    void normalize() {
        float norm = std::sqrt(norm_sq());
        if (norm > 0.0f) {
            for (float& x : data) x /= norm;
        }
    }
};

// Dense output for one fragment (or one chunk of a long fragment)
struct EncodedFragment {
    std::string field_tag;
    DenseVector vector;
};

// A ranked hit. distance is the raw Hamming distance the similarity came from.
struct MatchResult {
    EntityId entity_id;
    float similarity = 0.0f;
    uint32_t distance = 0;

    MatchResult() = default;
    MatchResult(EntityId id, float sim, uint32_t dist)
        : entity_id(std::move(id)), similarity(sim), distance(dist) {}
};

// Result order: similarity descending, then entity_id ascending.
// Distances are compared instead of floats so equal scores tie exactly.
inline bool ranks_before(const MatchResult& a, const MatchResult& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.entity_id < b.entity_id;
}

// ═══════════════════════════════════════════════════════════════════════════
// Utility functions
// ═══════════════════════════════════════════════════════════════════════════

// CRC32 implementation (simple, no external deps)
inline uint32_t crc32(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    ok = ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace resonance
