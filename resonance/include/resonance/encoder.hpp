#pragma once
// Chunked semantic encoder: fragments → one dense vector per fragment
//
// Each fragment is embedded on its own. Texts are never concatenated: a flat
// concatenation lets frequent terms swamp a rare but distinctive one (a niche
// skill buried in a long bio). Independent facets meet only at bundling.
//
// Long fragments are split into sentence chunks first; every chunk keeps the
// fragment's field tag.

#include "chunker.hpp"
#include "embedding.hpp"
#include "log.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace resonance {

struct EncoderConfig {
    size_t max_fragment_chars = 256;               // 0 = never chunk
    std::chrono::milliseconds timeout{5000};       // per provider call
    size_t provider_workers = 4;                   // provider calls in flight at once
};

class ChunkedEncoder {
public:
    ChunkedEncoder(std::shared_ptr<EmbeddingProvider> provider, EncoderConfig config = {})
        : provider_(std::move(provider)), config_(config) {
        if (!provider_) throw ConfigError("encoder needs an embedding provider");
        workers_ = std::make_shared<ProviderWorkers>(config_.provider_workers);
    }

    // One (field_tag, vector) per fragment chunk, in fragment order.
    // Throws EncodingUnavailable if the provider fails, times out or the call
    // is cancelled, or when every provider worker is still busy (a hung
    // provider); nothing is returned for a partially encoded entity.
    std::vector<EncodedFragment> encode_entity(
        const std::vector<SemanticFragment>& fragments,
        const CancelToken& cancel = CancelToken()) const
    {
        std::vector<EncodedFragment> encoded;
        if (fragments.empty()) return encoded;

        std::vector<std::string> texts;
        std::vector<const std::string*> tags;
        for (const auto& fragment : fragments) {
            auto chunks = split_chunks(fragment.text, config_.max_fragment_chars);
            if (chunks.empty()) {
                // Empty text is still a fragment; the provider decides its vector
                chunks.push_back(trim(fragment.text));
            }
            for (auto& chunk : chunks) {
                texts.push_back(std::move(chunk));
                tags.push_back(&fragment.field_tag);
            }
        }

        auto provider = provider_;
        auto vectors = bounded_call<std::vector<DenseVector>>(
            *workers_, [provider, texts]() { return provider->batch_encode(texts); },
            config_.timeout, cancel, "embedding " + provider_->model_id());

        if (vectors.size() != texts.size()) {
            throw EncodingUnavailable("provider returned " + std::to_string(vectors.size()) +
                                      " vectors for " + std::to_string(texts.size()) + " texts");
        }

        const size_t dim = provider_->dimension();
        encoded.reserve(vectors.size());
        for (size_t i = 0; i < vectors.size(); ++i) {
            if (vectors[i].size() != dim) {
                throw DimensionMismatch("embedding for field '" + *tags[i] + "'",
                                        dim, vectors[i].size());
            }
            encoded.push_back({*tags[i], std::move(vectors[i])});
        }

        log::debug("encoder", "encoded %zu fragments as %zu chunks",
                   fragments.size(), encoded.size());
        return encoded;
    }

    size_t dimension() const { return provider_->dimension(); }
    const EncoderConfig& config() const { return config_; }
    size_t calls_in_flight() const { return workers_->in_flight(); }
    const ProviderWorkers& workers() const { return *workers_; }
    const std::shared_ptr<EmbeddingProvider>& provider() const { return provider_; }

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    EncoderConfig config_;
    std::shared_ptr<ProviderWorkers> workers_;
};

} // namespace resonance
