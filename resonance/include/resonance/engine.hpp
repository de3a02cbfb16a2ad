#pragma once
// ResonanceEngine: provider + encoder + projection + index + detector
//
// There is exactly one text → hypervector path, used for profiles and queries
// alike:
//
//   fragments → ChunkedEncoder → dense vectors → binarize → bundle
//
// Profiles are stored; queries never are. Encoding runs outside every lock
// (it may wait on the provider); only the index write and the retained
// per-field hypervectors are committed under the engine's writer lock, so a
// failed encode leaves no trace.

#include "bundle.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "encoder.hpp"
#include "hypervector.hpp"
#include "index.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "profile.hpp"
#include "projection.hpp"
#include "snapshot.hpp"
#include "types.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace resonance {

// Similarity of one retained field against a query
struct FieldResonance {
    std::string field_tag;
    float similarity = 0.0f;
    uint32_t distance = 0;
};

struct EngineStats {
    size_t entities = 0;
    size_t bits = 0;
    size_t words_per_vector = 0;
    size_t memory_bytes = 0;
    uint64_t index_version = 0;
    uint64_t seed = 0;
    size_t dense_dim = 0;
    std::string model_id;
    size_t encodes_in_flight = 0;  // provider calls still running, abandoned ones included
};

class ResonanceEngine {
public:
    // Per-field hypervectors of one entity (a long field may have several chunks)
    using FieldVectors = std::map<std::string, std::vector<Hypervector>>;

    ResonanceEngine(std::shared_ptr<EmbeddingProvider> provider, EngineConfig config = {})
        : ResonanceEngine(provider, make_projection(config), config) {}

    // Share one projection between engines (it is read-only)
    ResonanceEngine(std::shared_ptr<EmbeddingProvider> provider,
                    std::shared_ptr<const ProjectionMatrix> projection,
                    EngineConfig config)
        : config_(adopt(config, projection)),
          provider_(std::move(provider)),
          projection_(std::move(projection)),
          encoder_(provider_, config_.encoder),
          index_(projection_->bits(), projection_->fingerprint(), config_.index),
          detector_(config_.scan_threads)
    {
        if (provider_->dimension() != projection_->dense_dim()) {
            throw DimensionMismatch("provider " + provider_->model_id() + " dimension",
                                    projection_->dense_dim(), provider_->dimension());
        }
        log::debug("engine", "projection D=%zu dense=%zu seed=%llu, provider %s",
                   projection_->bits(), projection_->dense_dim(),
                   static_cast<unsigned long long>(projection_->seed()),
                   provider_->model_id().c_str());
    }

    ResonanceEngine(const ResonanceEngine&) = delete;
    ResonanceEngine& operator=(const ResonanceEngine&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Encoding
    // ═══════════════════════════════════════════════════════════════════════

    // Hypervectors per field tag, one per chunk
    FieldVectors encode_fields(const std::vector<SemanticFragment>& fragments,
                               const CancelToken& cancel = CancelToken()) const
    {
        FieldVectors fields;
        for (const auto& enc : encoder_.encode_entity(fragments, cancel)) {
            fields[enc.field_tag].push_back(projection_->binarize(enc.vector));
        }
        return fields;
    }

    // Throws EmptyBundleInput when there are no fragments
    Hypervector encode(const std::vector<SemanticFragment>& fragments,
                       const CancelToken& cancel = CancelToken()) const
    {
        return bundle_fields(encode_fields(fragments, cancel));
    }

    Hypervector encode_text(const std::string& text,
                            const CancelToken& cancel = CancelToken()) const
    {
        return encode({SemanticFragment("text", text)}, cancel);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Entity lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Throws DuplicateEntity if id is already registered
    void register_entity(const EntityId& id, const std::vector<SemanticFragment>& fragments,
                         const CancelToken& cancel = CancelToken())
    {
        FieldVectors fields = encode_fields(fragments, cancel);
        Hypervector hv = bundle_fields(fields);

        const size_t field_count = fields.size();
        auto lock = lock_writer();
        index_.insert(id, hv);
        retain(id, std::move(fields));
        log::debug("engine", "registered %s (%zu fields)", id.c_str(), field_count);
    }

    // Encode every profile first, then publish them in one index write.
    // Any failure registers none of them.
    void register_profiles(const std::vector<Profile>& profiles,
                           const CancelToken& cancel = CancelToken())
    {
        std::vector<std::pair<EntityId, FieldVectors>> encoded;
        encoded.reserve(profiles.size());
        WriteBatch batch;
        for (const auto& p : profiles) {
            FieldVectors fields = encode_fields(p.fragments, cancel);
            batch.insert(p.id, bundle_fields(fields));
            encoded.emplace_back(p.id, std::move(fields));
        }

        auto lock = lock_writer();
        index_.apply(batch);
        for (auto& e : encoded) {
            retain(e.first, std::move(e.second));
        }
        log::info("engine", "registered %zu profiles (%zu total)", profiles.size(), index_.size());
    }

    // Re-encode every fragment; throws EntityNotFound if id is unknown
    void replace_entity(const EntityId& id, const std::vector<SemanticFragment>& fragments,
                        const CancelToken& cancel = CancelToken())
    {
        FieldVectors fields = encode_fields(fragments, cancel);
        Hypervector hv = bundle_fields(fields);

        auto lock = lock_writer();
        index_.update(id, hv);
        retain(id, std::move(fields));
        log::debug("engine", "replaced %s", id.c_str());
    }

    // Re-encode one field, re-bundle with the entity's other retained fields
    // and replace the stored hypervector atomically. Every existing fragment
    // with the same field tag is replaced.
    void update_fragment(const EntityId& id, const SemanticFragment& fragment,
                         const CancelToken& cancel = CancelToken())
    {
        if (!config_.retain_fragments) {
            throw ConfigError("update_fragment needs retain_fragments enabled");
        }
        FieldVectors fresh = encode_fields({fragment}, cancel);

        auto lock = lock_writer();
        auto it = fields_.find(id);
        if (it == fields_.end()) throw EntityNotFound(id);

        FieldVectors merged = it->second;
        merged[fragment.field_tag] = std::move(fresh[fragment.field_tag]);
        Hypervector hv = bundle_fields(merged);

        index_.update(id, hv);
        it->second = std::move(merged);
        log::debug("engine", "updated %s.%s", id.c_str(), fragment.field_tag.c_str());
    }

    // Throws EntityNotFound if id is unknown
    void remove_entity(const EntityId& id) {
        auto lock = lock_writer();
        index_.remove(id);
        fields_.erase(id);
        log::debug("engine", "removed %s", id.c_str());
    }

    bool contains(const EntityId& id) const { return index_.contains(id); }
    size_t size() const { return index_.size(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Matching
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<MatchResult> match(const Hypervector& query, const MatchPolicy& policy) const {
        IndexSnapshot view = index_.snapshot();
        return detector_.match(query, *view, policy);
    }

    std::vector<MatchResult> match(const Hypervector& query) const {
        return match(query, config_.default_policy);
    }

    std::vector<MatchResult> match(const std::string& query_text, const MatchPolicy& policy,
                                   const CancelToken& cancel = CancelToken()) const {
        return match(encode_text(query_text, cancel), policy);
    }

    std::vector<MatchResult> match(const std::string& query_text) const {
        return match(query_text, config_.default_policy);
    }

    std::vector<MatchResult> match(const std::vector<SemanticFragment>& query,
                                   const MatchPolicy& policy,
                                   const CancelToken& cancel = CancelToken()) const {
        return match(encode(query, cancel), policy);
    }

    // Which retained fields of `id` resonate with the query, best first
    std::vector<FieldResonance> explain(const EntityId& id, const std::string& query_text,
                                        const CancelToken& cancel = CancelToken()) const
    {
        if (!config_.retain_fragments) {
            throw ConfigError("explain needs retain_fragments enabled");
        }
        Hypervector query = encode_text(query_text, cancel);

        FieldVectors fields;
        {
            std::lock_guard<std::timed_mutex> lock(writer_mutex_);
            auto it = fields_.find(id);
            if (it == fields_.end()) throw EntityNotFound(id);
            fields = it->second;
        }

        std::vector<FieldResonance> out;
        for (const auto& entry : fields) {
            Hypervector field_hv = bundle(entry.second);
            uint32_t distance = query.popcount_xor(field_hv);
            out.push_back({entry.first,
                           Hypervector::similarity_from_distance(distance, query.bits()),
                           distance});
        }
        std::sort(out.begin(), out.end(), [](const FieldResonance& a, const FieldResonance& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.field_tag < b.field_tag;
        });
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════

    void save(const std::string& path) const {
        save_index(*index_.snapshot(), path);
    }

    // Replace the whole index with a snapshot's contents in one write.
    // Retained fields are dropped (snapshots hold combined vectors only).
    void load(const std::string& path) {
        auto loaded = load_index(path, *projection_, config_.index);
        IndexSnapshot incoming = loaded->snapshot();

        WriteBatch batch;
        auto lock = lock_writer();
        for (const auto& id : index_.snapshot()->ids()) {
            batch.remove(id);
        }
        incoming->for_each(0, incoming->size(), [&](const EntityId& id, WordSpan words) {
            batch.insert(id, Hypervector::from_words(
                incoming->bits(), incoming->fingerprint(),
                std::vector<uint64_t>(words.data, words.data + words.size)));
        });
        index_.apply(batch);
        fields_.clear();
        log::info("engine", "loaded %zu entities from %s", index_.size(), path.c_str());
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════════

    EngineStats stats() const {
        IndexSnapshot view = index_.snapshot();
        EngineStats s;
        s.entities = view->size();
        s.bits = view->bits();
        s.words_per_vector = view->words_per_vector();
        s.memory_bytes = view->memory_bytes();
        s.index_version = view->version();
        s.seed = projection_->seed();
        s.dense_dim = projection_->dense_dim();
        s.model_id = provider_->model_id();
        s.encodes_in_flight = encoder_.calls_in_flight();
        return s;
    }

    IndexSnapshot snapshot() const { return index_.snapshot(); }
    const EngineConfig& config() const { return config_; }
    const std::shared_ptr<const ProjectionMatrix>& projection() const { return projection_; }
    const std::shared_ptr<EmbeddingProvider>& provider() const { return provider_; }

private:
    static std::shared_ptr<const ProjectionMatrix> make_projection(const EngineConfig& config) {
        config.validate();
        return ProjectionMatrix::create(config.d_bits, config.embed_dim, config.seed);
    }

    // The projection decides width, dense length and seed
    static EngineConfig adopt(EngineConfig config,
                              const std::shared_ptr<const ProjectionMatrix>& projection) {
        if (!projection) throw ConfigError("engine needs a projection");
        config.d_bits = projection->bits();
        config.embed_dim = projection->dense_dim();
        config.seed = projection->seed();
        config.validate();
        return config;
    }

    static Hypervector bundle_fields(const FieldVectors& fields) {
        std::vector<Hypervector> all;
        for (const auto& entry : fields) {
            all.insert(all.end(), entry.second.begin(), entry.second.end());
        }
        return bundle(all);
    }

    std::unique_lock<std::timed_mutex> lock_writer() {
        std::unique_lock<std::timed_mutex> lock(writer_mutex_, std::defer_lock);
        if (!lock.try_lock_for(config_.index.write_timeout)) {
            throw IndexWriteConflict("engine writer lock not acquired within " +
                                     std::to_string(config_.index.write_timeout.count()) + " ms");
        }
        return lock;
    }

    // Caller holds writer_mutex_
    void retain(const EntityId& id, FieldVectors fields) {
        if (config_.retain_fragments) {
            fields_[id] = std::move(fields);
        }
    }

    EngineConfig config_;
    std::shared_ptr<EmbeddingProvider> provider_;
    std::shared_ptr<const ProjectionMatrix> projection_;
    ChunkedEncoder encoder_;
    ResonanceIndex index_;
    ResonanceDetector detector_;

    mutable std::timed_mutex writer_mutex_;
    std::unordered_map<EntityId, FieldVectors> fields_;
};

} // namespace resonance
