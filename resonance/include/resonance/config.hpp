#pragma once
// Engine configuration: struct defaults, optional JSON file, env overrides
//
// Precedence: defaults < config file < environment.
//
//   {
//     "d_bits": 10000, "seed": 42, "embed_dim": 384,
//     "scan_threads": 4, "retain_fragments": true,
//     "max_fragment_chars": 256, "encode_timeout_ms": 5000,
//     "provider_workers": 4,
//     "write_timeout_ms": 1000, "block_slots": 1024,
//     "match": {"mode": "thresholded", "k": 10, "threshold": 0.55}
//   }

#include "encoder.hpp"
#include "errors.hpp"
#include "index.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

namespace resonance {

using json = nlohmann::json;

struct EngineConfig {
    size_t d_bits = DEFAULT_D_BITS;           // Hypervector width
    uint64_t seed = DEFAULT_PROJECTION_SEED;  // Projection hyperplane seed
    size_t embed_dim = DEFAULT_EMBED_DIM;     // Dense length the projection accepts
    size_t scan_threads = 1;                  // Match scan workers
    bool retain_fragments = true;             // Keep per-field hypervectors (update_fragment, explain)

    EncoderConfig encoder;
    IndexConfig index;
    MatchPolicy default_policy;

    void validate() const {
        if (d_bits == 0) throw ConfigError("d_bits must be > 0");
        if (embed_dim == 0) throw ConfigError("embed_dim must be > 0");
        if (scan_threads == 0) throw ConfigError("scan_threads must be > 0");
        if (encoder.timeout.count() <= 0) throw ConfigError("encode_timeout_ms must be > 0");
        if (encoder.provider_workers == 0) throw ConfigError("provider_workers must be > 0");
        if (index.write_timeout.count() <= 0) throw ConfigError("write_timeout_ms must be > 0");
        if (index.block_slots == 0) throw ConfigError("block_slots must be > 0");
        default_policy.validate();
    }
};

namespace detail {

template <typename T>
T read_unsigned(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    const json& v = j[key];
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw ConfigError(std::string(key) + " must be a non-negative integer");
    }
    return static_cast<T>(v.get<uint64_t>());
}

inline std::chrono::milliseconds read_millis(const json& j, const char* key,
                                             std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    const json& v = j[key];
    if (!v.is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer (milliseconds)");
    }
    return std::chrono::milliseconds(v.get<int64_t>());
}

inline MatchMode parse_match_mode(const std::string& name) {
    if (name == "ranked") return MatchMode::Ranked;
    if (name == "thresholded") return MatchMode::Thresholded;
    throw ConfigError("unknown match mode '" + name + "' (ranked|thresholded)");
}

inline bool env_unsigned(const char* name, uint64_t& out) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return false;
    char* end = nullptr;
    unsigned long long v = std::strtoull(raw, &end, 10);
    if (*end != '\0' || raw[0] == '-') {
        throw ConfigError(std::string(name) + "='" + raw + "' is not a non-negative integer");
    }
    out = static_cast<uint64_t>(v);
    return true;
}

} // namespace detail

// Fields absent from j keep the values already in base
inline EngineConfig config_from_json(const json& j, EngineConfig base = {}) {
    if (!j.is_object()) throw ConfigError("config root must be an object");

    static const char* known[] = {
        "d_bits", "seed", "embed_dim", "scan_threads", "retain_fragments",
        "max_fragment_chars", "encode_timeout_ms", "provider_workers",
        "write_timeout_ms", "block_slots", "match",
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) { found = true; break; }
        }
        if (!found) log::warn("config", "ignoring unknown key '%s'", it.key().c_str());
    }

    EngineConfig c = base;
    try {
        c.d_bits = detail::read_unsigned<size_t>(j, "d_bits", c.d_bits);
        c.seed = detail::read_unsigned<uint64_t>(j, "seed", c.seed);
        c.embed_dim = detail::read_unsigned<size_t>(j, "embed_dim", c.embed_dim);
        c.scan_threads = detail::read_unsigned<size_t>(j, "scan_threads", c.scan_threads);
        c.retain_fragments = j.value("retain_fragments", c.retain_fragments);
        c.encoder.max_fragment_chars =
            detail::read_unsigned<size_t>(j, "max_fragment_chars", c.encoder.max_fragment_chars);
        c.encoder.timeout = detail::read_millis(j, "encode_timeout_ms", c.encoder.timeout);
        c.encoder.provider_workers =
            detail::read_unsigned<size_t>(j, "provider_workers", c.encoder.provider_workers);
        c.index.write_timeout = detail::read_millis(j, "write_timeout_ms", c.index.write_timeout);
        c.index.block_slots = detail::read_unsigned<size_t>(j, "block_slots", c.index.block_slots);

        if (j.contains("match")) {
            const json& m = j["match"];
            if (!m.is_object()) throw ConfigError("match must be an object");
            if (m.contains("mode")) {
                c.default_policy.mode = detail::parse_match_mode(m["mode"].get<std::string>());
            }
            c.default_policy.k = detail::read_unsigned<size_t>(m, "k", c.default_policy.k);
            c.default_policy.threshold = m.value("threshold", c.default_policy.threshold);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad value: ") + e.what());
    }

    c.validate();
    return c;
}

inline EngineConfig load_config(const std::string& path, EngineConfig base = {}) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open " + path);

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    log::debug("config", "loaded %s", path.c_str());
    return config_from_json(j, base);
}

// RESONANCE_D_BITS, RESONANCE_SEED, RESONANCE_EMBED_DIM,
// RESONANCE_SCAN_THREADS, RESONANCE_TIMEOUT_MS
inline void apply_env_overrides(EngineConfig& c) {
    uint64_t v = 0;
    if (detail::env_unsigned("RESONANCE_D_BITS", v)) c.d_bits = static_cast<size_t>(v);
    if (detail::env_unsigned("RESONANCE_SEED", v)) c.seed = v;
    if (detail::env_unsigned("RESONANCE_EMBED_DIM", v)) c.embed_dim = static_cast<size_t>(v);
    if (detail::env_unsigned("RESONANCE_SCAN_THREADS", v)) c.scan_threads = static_cast<size_t>(v);
    if (detail::env_unsigned("RESONANCE_TIMEOUT_MS", v)) {
        c.encoder.timeout = std::chrono::milliseconds(static_cast<int64_t>(v));
    }
    c.validate();
}

// Command-line --k/--threshold on top of the configured policy. A given
// threshold always switches to thresholded mode and is validated as given,
// so a negative or NaN value is rejected rather than ignored.
inline MatchPolicy policy_with_overrides(MatchPolicy policy, bool k_set, size_t k,
                                         bool threshold_set, float threshold) {
    if (k_set) policy.k = k;
    if (threshold_set) {
        policy.mode = MatchMode::Thresholded;
        policy.threshold = threshold;
    }
    policy.validate();
    return policy;
}

inline json config_to_json(const EngineConfig& c) {
    return {
        {"d_bits", c.d_bits},
        {"seed", c.seed},
        {"embed_dim", c.embed_dim},
        {"scan_threads", c.scan_threads},
        {"retain_fragments", c.retain_fragments},
        {"max_fragment_chars", c.encoder.max_fragment_chars},
        {"encode_timeout_ms", c.encoder.timeout.count()},
        {"provider_workers", c.encoder.provider_workers},
        {"write_timeout_ms", c.index.write_timeout.count()},
        {"block_slots", c.index.block_slots},
        {"match", {
            {"mode", match_mode_name(c.default_policy.mode)},
            {"k", c.default_policy.k},
            {"threshold", c.default_policy.threshold},
        }},
    };
}

} // namespace resonance
