#pragma once
// Bundling: bitwise majority-vote superposition
//
// For each bit position, count the inputs holding a 1:
//   count * 2 >  n  → 1
//   count * 2 == n  → BUNDLE_TIE_BIT (ties round up to 1)
//   otherwise       → 0
//
// Counting is order-independent, so bundle() is commutative and associative
// over its input list.

#include "hypervector.hpp"

#include <vector>

namespace resonance {

constexpr bool BUNDLE_TIE_BIT = true;

inline Hypervector bundle(const std::vector<Hypervector>& inputs) {
    if (inputs.empty()) {
        throw EmptyBundleInput();
    }

    const Hypervector& first = inputs.front();
    for (const auto& hv : inputs) {
        first.check_compatible(hv);
    }

    if (inputs.size() == 1) {
        return first;
    }

    const size_t bits = first.bits();
    std::vector<uint32_t> counts(bits, 0);

    // Walk set bits only
    for (const auto& hv : inputs) {
        const auto& words = hv.words();
        for (size_t w = 0; w < words.size(); ++w) {
            uint64_t word = words[w];
            while (word != 0) {
                size_t bit = static_cast<size_t>(__builtin_ctzll(word));
                counts[w * Hypervector::WORD_BITS + bit]++;
                word &= word - 1;
            }
        }
    }

    const size_t n = inputs.size();
    Hypervector out(bits, first.fingerprint());
    for (size_t i = 0; i < bits; ++i) {
        size_t twice = static_cast<size_t>(counts[i]) * 2;
        if (twice > n || (twice == n && BUNDLE_TIE_BIT)) {
            out.set_bit(i, true);
        }
    }
    return out;
}

} // namespace resonance
