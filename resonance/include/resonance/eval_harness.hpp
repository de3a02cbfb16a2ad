#pragma once
// Recall harness: golden queries with labelled relevant entities
//
// Each case names its difficulty tier:
//   direct         query uses the profile's own words
//   paraphrase     same meaning, different words
//   complementary  query describes what the profile offers from the other side
//   cross-domain   need stated in another field's vocabulary
//
// compare() runs every case twice over the same search function: once with
// the raw query and once with the query passed through a transform (e.g. a
// rewriting step). Matching quality regressions show up as recall deltas.

#include "types.hpp"

#include <functional>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace resonance {

enum class Tier { Direct, Paraphrase, Complementary, CrossDomain };

inline const char* tier_name(Tier tier) {
    switch (tier) {
        case Tier::Direct:        return "direct";
        case Tier::Paraphrase:    return "paraphrase";
        case Tier::Complementary: return "complementary";
        case Tier::CrossDomain:   return "cross-domain";
    }
    return "unknown";
}

struct GoldenCase {
    std::string name;
    Tier tier = Tier::Direct;
    std::string query;
    std::vector<EntityId> relevant;
    size_t k = 3;
};

struct CaseResult {
    std::string name;
    Tier tier = Tier::Direct;
    float recall = 0.0f;      // relevant found / relevant
    float precision = 0.0f;   // relevant found / returned
    float mrr = 0.0f;         // 1 / rank of first relevant hit
    std::vector<EntityId> retrieved;
};

struct HarnessStats {
    size_t cases = 0;
    float avg_recall = 0.0f;
    float avg_precision = 0.0f;
    float avg_mrr = 0.0f;
    std::map<Tier, float> tier_recall;
};

struct Comparison {
    HarnessStats raw;
    HarnessStats transformed;
    std::vector<CaseResult> raw_cases;
    std::vector<CaseResult> transformed_cases;

    float recall_delta() const { return raw.avg_recall - transformed.avg_recall; }
};

using SearchFn = std::function<std::vector<MatchResult>(const std::string& query, size_t k)>;
using QueryTransform = std::function<std::string(const std::string& query)>;

class RecallHarness {
public:
    void add_case(GoldenCase c) { cases_.push_back(std::move(c)); }

    const std::vector<GoldenCase>& cases() const { return cases_; }
    size_t size() const { return cases_.size(); }

    static CaseResult evaluate_case(const GoldenCase& c, const std::string& query,
                                    const SearchFn& search)
    {
        CaseResult result;
        result.name = c.name;
        result.tier = c.tier;

        auto hits = search(query, c.k);
        if (hits.size() > c.k) hits.resize(c.k);

        std::unordered_set<EntityId> relevant(c.relevant.begin(), c.relevant.end());
        size_t found = 0;
        for (size_t i = 0; i < hits.size(); ++i) {
            result.retrieved.push_back(hits[i].entity_id);
            if (relevant.count(hits[i].entity_id)) {
                if (found == 0) result.mrr = 1.0f / static_cast<float>(i + 1);
                found++;
            }
        }

        result.recall = relevant.empty() ? 1.0f
            : static_cast<float>(found) / static_cast<float>(relevant.size());
        result.precision = hits.empty() ? 0.0f
            : static_cast<float>(found) / static_cast<float>(hits.size());
        return result;
    }

    std::vector<CaseResult> evaluate(const SearchFn& search,
                                     const QueryTransform& transform = nullptr) const
    {
        std::vector<CaseResult> results;
        results.reserve(cases_.size());
        for (const auto& c : cases_) {
            std::string query = transform ? transform(c.query) : c.query;
            results.push_back(evaluate_case(c, query, search));
        }
        return results;
    }

    static HarnessStats summarize(const std::vector<CaseResult>& results) {
        HarnessStats stats;
        stats.cases = results.size();
        if (results.empty()) return stats;

        std::map<Tier, std::pair<float, size_t>> per_tier;
        for (const auto& r : results) {
            stats.avg_recall += r.recall;
            stats.avg_precision += r.precision;
            stats.avg_mrr += r.mrr;
            auto& t = per_tier[r.tier];
            t.first += r.recall;
            t.second++;
        }
        const float n = static_cast<float>(results.size());
        stats.avg_recall /= n;
        stats.avg_precision /= n;
        stats.avg_mrr /= n;
        for (const auto& entry : per_tier) {
            stats.tier_recall[entry.first] =
                entry.second.first / static_cast<float>(entry.second.second);
        }
        return stats;
    }

    Comparison compare(const SearchFn& search, const QueryTransform& transform) const {
        Comparison cmp;
        cmp.raw_cases = evaluate(search);
        cmp.transformed_cases = evaluate(search, transform);
        cmp.raw = summarize(cmp.raw_cases);
        cmp.transformed = summarize(cmp.transformed_cases);
        return cmp;
    }

private:
    std::vector<GoldenCase> cases_;
};

} // namespace resonance
