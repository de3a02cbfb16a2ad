#pragma once
// Resonance detector: Hamming nearest-neighbour scan over an index snapshot
//
// distance   = popcount(query XOR entity), word by word
// similarity = 1 - distance / D
//
// Policies:
//   Ranked       k best entities, whatever their score
//   Thresholded  at most k entities with similarity >= threshold, never padded
//
// Order: similarity descending, entity_id ascending. Large indexes are split
// into contiguous slot ranges scanned on worker threads; each keeps its own
// bounded top-k and the partials are merged with the same comparator, so the
// result never depends on the thread count.

#include "hypervector.hpp"
#include "index.hpp"
#include "types.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace resonance {

enum class MatchMode { Ranked, Thresholded };

inline const char* match_mode_name(MatchMode mode) {
    return mode == MatchMode::Ranked ? "ranked" : "thresholded";
}

struct MatchPolicy {
    MatchMode mode = MatchMode::Ranked;
    size_t k = 10;
    float threshold = 0.0f;   // Thresholded only

    static MatchPolicy ranked(size_t k) {
        MatchPolicy p;
        p.mode = MatchMode::Ranked;
        p.k = k;
        return p;
    }

    static MatchPolicy thresholded(size_t k, float threshold) {
        MatchPolicy p;
        p.mode = MatchMode::Thresholded;
        p.k = k;
        p.threshold = threshold;
        return p;
    }

    void validate() const {
        if (mode == MatchMode::Thresholded && !(threshold >= 0.0f && threshold <= 1.0f)) {
            throw ConfigError("match threshold must be in [0, 1], got " +
                              std::to_string(threshold));
        }
    }
};

class ResonanceDetector {
public:
    // Below min_slots_per_thread entities per worker the scan stays on the
    // calling thread
    explicit ResonanceDetector(size_t scan_threads = 1, size_t min_slots_per_thread = 4096)
        : scan_threads_(scan_threads == 0 ? 1 : scan_threads),
          min_slots_per_thread_(min_slots_per_thread == 0 ? 1 : min_slots_per_thread) {}

    std::vector<MatchResult> match(const Hypervector& query, const IndexView& index,
                                   const MatchPolicy& policy) const
    {
        policy.validate();
        query.check_compatible(index.bits(), index.fingerprint());

        if (policy.k == 0 || index.empty()) return {};

        const size_t n = index.size();
        size_t workers = std::min(scan_threads_, n / min_slots_per_thread_);
        if (workers <= 1) {
            auto results = scan(query, index, policy, 0, n);
            std::sort(results.begin(), results.end(), ranks_before);
            return results;
        }

        std::vector<std::vector<MatchResult>> partials(workers);
        std::vector<std::exception_ptr> errors(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers - 1);

        const size_t stride = (n + workers - 1) / workers;
        auto run = [&](size_t w) {
            try {
                size_t begin = w * stride;
                size_t end = std::min(n, begin + stride);
                partials[w] = scan(query, index, policy, begin, end);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        };

        for (size_t w = 1; w < workers; ++w) {
            threads.emplace_back(run, w);
        }
        run(0);
        for (auto& t : threads) t.join();

        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }

        std::vector<MatchResult> merged;
        for (auto& part : partials) {
            merged.insert(merged.end(), std::make_move_iterator(part.begin()),
                          std::make_move_iterator(part.end()));
        }
        std::sort(merged.begin(), merged.end(), ranks_before);
        if (merged.size() > policy.k) merged.resize(policy.k);
        return merged;
    }

    size_t scan_threads() const { return scan_threads_; }

private:
    // Bounded top-k over slots [begin, end); heap top is the worst kept result
    static std::vector<MatchResult> scan(const Hypervector& query, const IndexView& index,
                                         const MatchPolicy& policy, size_t begin, size_t end)
    {
        std::priority_queue<MatchResult, std::vector<MatchResult>,
                            bool (*)(const MatchResult&, const MatchResult&)>
            heap(ranks_before);
        const size_t bits = index.bits();
        const bool thresholded = policy.mode == MatchMode::Thresholded;

        index.for_each(begin, end, [&](const EntityId& id, WordSpan words) {
            uint32_t distance = query.popcount_xor(words);
            float sim = Hypervector::similarity_from_distance(distance, bits);
            if (thresholded && sim < policy.threshold) return;

            if (heap.size() < policy.k) {
                heap.emplace(id, sim, distance);
                return;
            }
            const MatchResult& worst = heap.top();
            if (distance > worst.distance) return;
            if (distance == worst.distance && !(id < worst.entity_id)) return;
            heap.pop();
            heap.emplace(id, sim, distance);
        });

        std::vector<MatchResult> out;
        out.reserve(heap.size());
        while (!heap.empty()) {
            out.push_back(heap.top());
            heap.pop();
        }
        return out;
    }

    size_t scan_threads_;
    size_t min_slots_per_thread_;
};

// Free-function form: one-shot scan on the calling thread
inline std::vector<MatchResult> match(const Hypervector& query, const IndexView& index,
                                      size_t k, float threshold,
                                      MatchMode mode = MatchMode::Thresholded)
{
    MatchPolicy policy = mode == MatchMode::Ranked ? MatchPolicy::ranked(k)
                                                   : MatchPolicy::thresholded(k, threshold);
    return ResonanceDetector().match(query, index, policy);
}

} // namespace resonance
