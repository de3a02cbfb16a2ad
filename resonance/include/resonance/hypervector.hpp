#pragma once
// Hypervector: fixed-width packed bit array
//
// D bits packed into 64-bit words. Every hypervector carries the fingerprint
// of the projection that produced it; comparing two hypervectors checks both
// the bit length and the fingerprint before any popcount.
//
// Similarity: 1 - hamming / D, range [0, 1] where 1 = identical

#include "errors.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace resonance {

// Read-only view over packed words owned elsewhere (an index block slot)
struct WordSpan {
    const uint64_t* data = nullptr;
    size_t size = 0;
};

class Hypervector {
public:
    static constexpr size_t WORD_BITS = 64;

    static size_t words_for(size_t bits) { return (bits + WORD_BITS - 1) / WORD_BITS; }

    Hypervector() = default;

    // All-zero hypervector of the given width
    Hypervector(size_t bits, uint64_t fingerprint)
        : bits_(bits), fingerprint_(fingerprint), words_(words_for(bits), 0) {}

    // Adopt packed words (snapshot load, index lookup)
    static Hypervector from_words(size_t bits, uint64_t fingerprint,
                                  std::vector<uint64_t> words) {
        if (words.size() != words_for(bits)) {
            throw DimensionMismatch("packed word count", words_for(bits), words.size());
        }
        // Padding bits past D must stay clear or popcounts drift
        size_t tail = bits % WORD_BITS;
        if (tail != 0 && !words.empty() && (words.back() >> tail) != 0) {
            throw DimensionMismatch("hypervector has bits set beyond width " +
                                    std::to_string(bits));
        }
        Hypervector hv;
        hv.bits_ = bits;
        hv.fingerprint_ = fingerprint;
        hv.words_ = std::move(words);
        return hv;
    }

    size_t bits() const { return bits_; }
    size_t word_count() const { return words_.size(); }
    uint64_t fingerprint() const { return fingerprint_; }
    bool empty() const { return bits_ == 0; }

    const std::vector<uint64_t>& words() const { return words_; }
    WordSpan span() const { return {words_.data(), words_.size()}; }

    bool get_bit(size_t i) const {
        check_index(i);
        return (words_[i / WORD_BITS] >> (i % WORD_BITS)) & 1ULL;
    }

    void set_bit(size_t i, bool value) {
        check_index(i);
        uint64_t mask = 1ULL << (i % WORD_BITS);
        if (value) {
            words_[i / WORD_BITS] |= mask;
        } else {
            words_[i / WORD_BITS] &= ~mask;
        }
    }

    size_t popcount() const {
        size_t count = 0;
        for (uint64_t w : words_) count += __builtin_popcountll(w);
        return count;
    }

    // Hamming distance (number of differing bits)
    uint32_t popcount_xor(const Hypervector& other) const {
        check_compatible(other);
        return popcount_xor_words(other.words_.data());
    }

    // Hamming distance against words stored in an index slot
    uint32_t popcount_xor(WordSpan other) const {
        if (other.size != words_.size()) {
            throw DimensionMismatch("hypervector words", words_.size(), other.size);
        }
        return popcount_xor_words(other.data);
    }

    float similarity(const Hypervector& other) const {
        return similarity_from_distance(popcount_xor(other), bits_);
    }

    static float similarity_from_distance(uint32_t distance, size_t bits) {
        return 1.0f - static_cast<float>(distance) / static_cast<float>(bits);
    }

    // Throws unless other was built at the same width by the same projection
    void check_compatible(const Hypervector& other) const {
        check_compatible(other.bits_, other.fingerprint_);
    }

    void check_compatible(size_t bits, uint64_t fingerprint) const {
        if (bits != bits_) {
            throw DimensionMismatch("hypervector bits", bits_, bits);
        }
        if (fingerprint != fingerprint_) {
            throw ProjectionMismatch("fingerprints differ (hypervectors come from different seeds)");
        }
    }

    bool operator==(const Hypervector& other) const {
        return bits_ == other.bits_ && fingerprint_ == other.fingerprint_ &&
               words_ == other.words_;
    }

    bool operator!=(const Hypervector& other) const { return !(*this == other); }

private:
    void check_index(size_t i) const {
        if (i >= bits_) {
            throw std::out_of_range("hypervector bit " + std::to_string(i) +
                                    " out of range (width " + std::to_string(bits_) + ")");
        }
    }

    uint32_t popcount_xor_words(const uint64_t* other) const {
        uint32_t dist = 0;
        for (size_t i = 0; i < words_.size(); ++i) {
            dist += static_cast<uint32_t>(__builtin_popcountll(words_[i] ^ other[i]));
        }
        return dist;
    }

    size_t bits_ = 0;
    uint64_t fingerprint_ = 0;
    std::vector<uint64_t> words_;
};

} // namespace resonance
