#pragma once
// SimHash projection: dense vector → binary hypervector
//
// D random hyperplanes, drawn once from a seed. Bit i is the side of
// hyperplane i the vector falls on:
//
//   bit_i = dot(v, P[i]) >= 0 ? 1 : 0
//
// An exact zero dot product maps to 1. Vectors with high cosine similarity
// land on the same side of most hyperplanes, so Hamming similarity tracks
// angular similarity (1 - theta/pi in expectation).
//
// The matrix is immutable after construction and shared read-only by every
// encoder. A different seed produces a different fingerprint; hypervectors
// from different seeds refuse to compare.

#include "hypervector.hpp"
#include "types.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace resonance {

// Fingerprint identifying (width, dense dim, seed)
inline uint64_t projection_fingerprint(size_t bits, size_t dense_dim, uint64_t seed) {
    uint64_t fields[3] = {static_cast<uint64_t>(bits), static_cast<uint64_t>(dense_dim), seed};
    return fnv1a64(fields, sizeof(fields));
}

// Standard normal samples from mt19937_64 via Box-Muller.
// std::normal_distribution is implementation-defined; this uses the same
// generator on every platform. log/sin/cos come from libm and may differ in
// the last bit, which can only flip a bit whose dot product is near zero.
class GaussianStream {
public:
    explicit GaussianStream(uint64_t seed) : rng_(seed) {}

    double next() {
        if (has_spare_) {
            has_spare_ = false;
            return spare_;
        }
        constexpr double two_pi = 6.283185307179586476925286766559;
        // u1 in (0, 1], u2 in [0, 1)
        double u1 = static_cast<double>((rng_() >> 11) + 1) * 0x1.0p-53;
        double u2 = static_cast<double>(rng_() >> 11) * 0x1.0p-53;
        double r = std::sqrt(-2.0 * std::log(u1));
        spare_ = r * std::sin(two_pi * u2);
        has_spare_ = true;
        return r * std::cos(two_pi * u2);
    }

private:
    std::mt19937_64 rng_;
    bool has_spare_ = false;
    double spare_ = 0.0;
};

class ProjectionMatrix {
public:
    static std::shared_ptr<const ProjectionMatrix> create(
        size_t bits, size_t dense_dim, uint64_t seed = DEFAULT_PROJECTION_SEED)
    {
        if (bits == 0) throw ConfigError("projection width must be > 0");
        if (dense_dim == 0) throw ConfigError("projection dense dimension must be > 0");
        return std::shared_ptr<const ProjectionMatrix>(
            new ProjectionMatrix(bits, dense_dim, seed));
    }

    ProjectionMatrix(const ProjectionMatrix&) = delete;
    ProjectionMatrix& operator=(const ProjectionMatrix&) = delete;

    size_t bits() const { return bits_; }
    size_t dense_dim() const { return dense_dim_; }
    uint64_t seed() const { return seed_; }
    uint64_t fingerprint() const { return fingerprint_; }

    // Zero hypervector stamped with this projection
    Hypervector blank() const { return Hypervector(bits_, fingerprint_); }

    // dot(v, P[row])
    float row_dot(size_t row, const DenseVector& v) const {
        const float* plane = planes_.data() + row * dense_dim_;
        float sum = 0.0f;
        for (size_t d = 0; d < dense_dim_; ++d) {
            sum += plane[d] * v.data[d];
        }
        return sum;
    }

    // SimHash a dense vector into a hypervector
    Hypervector binarize(const DenseVector& v) const {
        if (v.size() != dense_dim_) {
            throw DimensionMismatch("dense vector length", dense_dim_, v.size());
        }
        Hypervector hv = blank();
        for (size_t i = 0; i < bits_; ++i) {
            if (row_dot(i, v) >= 0.0f) {
                hv.set_bit(i, true);
            }
        }
        return hv;
    }

    std::vector<Hypervector> binarize_batch(const std::vector<DenseVector>& vs) const {
        std::vector<Hypervector> out;
        out.reserve(vs.size());
        for (const auto& v : vs) {
            out.push_back(binarize(v));
        }
        return out;
    }

    // Fail unless hv was produced by this projection
    void check(const Hypervector& hv) const {
        if (hv.bits() != bits_) {
            throw DimensionMismatch("hypervector bits", bits_, hv.bits());
        }
        if (hv.fingerprint() != fingerprint_) {
            throw ProjectionMismatch("hypervector was not produced by seed " +
                                     std::to_string(seed_));
        }
    }

private:
    ProjectionMatrix(size_t bits, size_t dense_dim, uint64_t seed)
        : bits_(bits), dense_dim_(dense_dim), seed_(seed),
          fingerprint_(projection_fingerprint(bits, dense_dim, seed)),
          planes_(bits * dense_dim)
    {
        GaussianStream gauss(seed);
        for (float& x : planes_) {
            x = static_cast<float>(gauss.next());
        }
    }

    size_t bits_;
    size_t dense_dim_;
    uint64_t seed_;
    uint64_t fingerprint_;
    std::vector<float> planes_;  // bits x dense_dim, row-major
};

// Free-function form used by the encoding pipeline
inline Hypervector binarize(const DenseVector& v, const ProjectionMatrix& projection) {
    return projection.binarize(v);
}

} // namespace resonance
