#include <resonance/resonance.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <thread>
#include <chrono>
#include <atomic>
#include <unistd.h>

using namespace resonance;

// One projection for every engine test (10000 x 384 planes)
std::shared_ptr<const ProjectionMatrix> default_projection() {
    static auto projection = ProjectionMatrix::create(DEFAULT_D_BITS, DEFAULT_EMBED_DIM,
                                                      DEFAULT_PROJECTION_SEED);
    return projection;
}

std::shared_ptr<EmbeddingProvider> hashing() {
    return std::make_shared<HashingEmbeddingProvider>();
}

std::unique_ptr<ResonanceEngine> make_engine(
    std::shared_ptr<EmbeddingProvider> provider = hashing(), EngineConfig config = {}) {
    return std::make_unique<ResonanceEngine>(provider, default_projection(), config);
}

Hypervector random_hv(std::mt19937_64& rng, size_t bits, uint64_t fingerprint) {
    Hypervector hv(bits, fingerprint);
    for (size_t i = 0; i < bits; ++i) {
        if (rng() & 1) hv.set_bit(i, true);
    }
    return hv;
}

std::string temp_path(const char* name) {
    return "/tmp/resonance_test_" + std::to_string(::getpid()) + "_" + name;
}

// Providers with controlled failure modes

class SlowProvider : public EmbeddingProvider {
public:
    explicit SlowProvider(std::chrono::milliseconds delay) : delay_(delay) {}
    DenseVector encode(const std::string& text) override {
        std::this_thread::sleep_for(delay_);
        return inner_.encode(text);
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "slow"; }
private:
    std::chrono::milliseconds delay_;
    HashingEmbeddingProvider inner_;
};

// Blocks every call until the test releases it
class HungProvider : public EmbeddingProvider {
public:
    explicit HungProvider(std::shared_ptr<std::atomic<bool>> release)
        : release_(std::move(release)) {}
    DenseVector encode(const std::string& text) override {
        size_t now = ++running_;
        size_t seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        while (!release_->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        --running_;
        return inner_.encode(text);
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "hung"; }
    size_t peak() const { return peak_.load(); }
private:
    std::shared_ptr<std::atomic<bool>> release_;
    std::atomic<size_t> running_{0};
    std::atomic<size_t> peak_{0};
    HashingEmbeddingProvider inner_;
};

class FailingProvider : public EmbeddingProvider {
public:
    DenseVector encode(const std::string&) override {
        throw std::runtime_error("model server down");
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "failing"; }
};

class WrongSizeProvider : public EmbeddingProvider {
public:
    DenseVector encode(const std::string&) override {
        return DenseVector(std::vector<float>(10, 0.5f));
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "wrong-size"; }
};

class CountingProvider : public EmbeddingProvider {
public:
    DenseVector encode(const std::string& text) override {
        calls++;
        return inner_.encode(text);
    }
    size_t dimension() const override { return inner_.dimension(); }
    std::string model_id() const override { return inner_.model_id(); }
    std::atomic<int> calls{0};
private:
    HashingEmbeddingProvider inner_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Bit-level primitives
// ═══════════════════════════════════════════════════════════════════════════

void test_hypervector_bits() {
    std::cout << "Testing Hypervector bits..." << std::endl;

    Hypervector hv(130, 99);
    assert(hv.bits() == 130);
    assert(hv.word_count() == 3);
    assert(hv.popcount() == 0);

    hv.set_bit(0, true);
    hv.set_bit(64, true);
    hv.set_bit(129, true);
    assert(hv.get_bit(0) && hv.get_bit(64) && hv.get_bit(129));
    assert(!hv.get_bit(1));
    assert(hv.popcount() == 3);
    hv.set_bit(64, false);
    assert(hv.popcount() == 2);

    bool threw = false;
    try { hv.get_bit(130); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);

    threw = false;
    try { hv.set_bit(1000, true); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);

    // Padding past the width must be clear
    threw = false;
    try {
        Hypervector::from_words(130, 99, {0, 0, ~0ULL});
    } catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    auto ok = Hypervector::from_words(130, 99, {1, 0, 3});
    assert(ok.popcount() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_similarity_properties() {
    std::cout << "Testing similarity properties..." << std::endl;

    std::mt19937_64 rng(7);
    for (int i = 0; i < 20; ++i) {
        Hypervector a = random_hv(rng, 10000, 1);
        Hypervector b = random_hv(rng, 10000, 1);
        assert(a.similarity(a) == 1.0f);
        assert(a.similarity(b) == b.similarity(a));
        assert(a.popcount_xor(b) == b.popcount_xor(a));
        float s = a.similarity(b);
        assert(s >= 0.0f && s <= 1.0f);
    }

    Hypervector zeros(64, 1);
    Hypervector ones(64, 1);
    for (size_t i = 0; i < 64; ++i) ones.set_bit(i, true);
    assert(zeros.similarity(ones) == 0.0f);
    assert(zeros.popcount_xor(ones) == 64);

    std::cout << "  PASS" << std::endl;
}

void test_compatibility_checks() {
    std::cout << "Testing width and projection checks..." << std::endl;

    Hypervector a(128, 1);
    Hypervector wider(256, 1);
    Hypervector other_seed(128, 2);

    bool threw = false;
    try { a.similarity(wider); }
    catch (const ProjectionMismatch&) { assert(false); }
    catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    threw = false;
    try { a.similarity(other_seed); } catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_gaussian_stream() {
    std::cout << "Testing GaussianStream..." << std::endl;

    GaussianStream a(42), b(42), c(43);
    bool differs = false;
    for (int i = 0; i < 100; ++i) {
        double x = a.next();
        assert(x == b.next());
        if (x != c.next()) differs = true;
    }
    assert(differs);

    GaussianStream g(1);
    const int n = 20000;
    double sum = 0.0, sum_sq = 0.0;
    for (int i = 0; i < n; ++i) {
        double x = g.next();
        sum += x;
        sum_sq += x * x;
    }
    double mean = sum / n;
    double var = sum_sq / n - mean * mean;
    assert(std::fabs(mean) < 0.05);
    assert(std::fabs(var - 1.0) < 0.05);

    std::cout << "  PASS" << std::endl;
}

void test_projection() {
    std::cout << "Testing ProjectionMatrix..." << std::endl;

    auto p1 = ProjectionMatrix::create(256, 16, 42);
    auto p2 = ProjectionMatrix::create(256, 16, 42);
    auto p3 = ProjectionMatrix::create(256, 16, 43);
    assert(p1->fingerprint() == p2->fingerprint());
    assert(p1->fingerprint() != p3->fingerprint());
    assert(p1->fingerprint() != ProjectionMatrix::create(256, 17, 42)->fingerprint());

    DenseVector v(std::vector<float>(16, 0.0f));
    for (size_t i = 0; i < 16; ++i) v[i] = std::sin(static_cast<float>(i) + 0.5f);

    Hypervector h1 = binarize(v, *p1);
    Hypervector h2 = p2->binarize(v);
    assert(h1 == h2);
    assert(h1.bits() == 256);
    assert(h1.fingerprint() == p1->fingerprint());

    // Scaling does not move a vector across any hyperplane
    DenseVector scaled = v;
    for (float& x : scaled.data) x *= 3.0f;
    assert(p1->binarize(scaled).similarity(h1) > 0.99f);

    // Exact zero dot product maps to 1
    Hypervector zero = p1->binarize(DenseVector::zeros(16));
    assert(zero.popcount() == 256);

    bool threw = false;
    try { p1->binarize(DenseVector::zeros(15)); } catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    threw = false;
    try { ProjectionMatrix::create(0, 16, 42); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    threw = false;
    try { p1->check(p3->blank()); } catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_projection_golden_values() {
    std::cout << "Testing projection golden values (seed 42)..." << std::endl;

    // Fingerprint is integer-only: fnv1a64 over {bits, dim, seed}
    assert(projection_fingerprint(DEFAULT_D_BITS, DEFAULT_EMBED_DIM, DEFAULT_PROJECTION_SEED) ==
           0xf7e619e6d4881ed9ULL);
    assert(default_projection()->fingerprint() == 0xf7e619e6d4881ed9ULL);

    GaussianStream g(42);
    assert(std::fabs(g.next() - (-0.4812176998018449)) < 1e-12);
    assert(std::fabs(g.next() - (-0.5745368738983057)) < 1e-12);

    // Every dot product here is at least 1e-3 from zero, so libm rounding
    // cannot move a bit
    auto p = ProjectionMatrix::create(128, 8, 42);
    assert(p->fingerprint() == 0xb45e009eae5514a7ULL);
    DenseVector v(std::vector<float>{1.0f, -0.5f, 0.25f, 2.0f, -1.0f, 0.75f, -2.0f, 0.5f});
    Hypervector hv = p->binarize(v);
    assert(hv.words().size() == 2);
    assert(hv.words()[0] == 0x676eadc5223c28e9ULL);
    assert(hv.words()[1] == 0x38722af5f2d335c2ULL);
    assert(hv.popcount() == 65);

    std::cout << "  PASS" << std::endl;
}

void test_bundle() {
    std::cout << "Testing bundle majority vote..." << std::endl;

    std::mt19937_64 rng(11);
    Hypervector a = random_hv(rng, 1000, 5);
    Hypervector b = random_hv(rng, 1000, 5);
    Hypervector c = random_hv(rng, 1000, 5);

    // Three inputs never tie
    Hypervector abc = bundle({a, b, c});
    assert(abc == bundle({b, c, a}));
    assert(abc == bundle({c, a, b}));
    assert(abc == bundle({b, a, c}));
    assert(abc.bits() == 1000);

    // Majority per bit
    for (size_t i = 0; i < 1000; ++i) {
        int count = a.get_bit(i) + b.get_bit(i) + c.get_bit(i);
        assert(abc.get_bit(i) == (count >= 2));
    }

    // The bundle resembles each input more than chance
    assert(abc.similarity(a) > 0.6f);
    assert(abc.similarity(b) > 0.6f);

    // Single input passes through
    assert(bundle({a}) == a);

    // Ties round up to 1
    Hypervector x(64, 5), y(64, 5);
    x.set_bit(0, true);
    y.set_bit(1, true);
    x.set_bit(2, true);
    y.set_bit(2, true);
    Hypervector xy = bundle({x, y});
    assert(xy.get_bit(0));
    assert(xy.get_bit(1));
    assert(xy.get_bit(2));
    assert(!xy.get_bit(3));
    assert(xy.popcount() == 3);

    bool threw = false;
    try { bundle({}); } catch (const EmptyBundleInput&) { threw = true; }
    assert(threw);

    threw = false;
    try { bundle({a, Hypervector(1000, 6)}); } catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);

    threw = false;
    try { bundle({a, Hypervector(999, 5)}); } catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text → dense
// ═══════════════════════════════════════════════════════════════════════════

void test_chunker() {
    std::cout << "Testing chunker..." << std::endl;

    assert(split_chunks("", 256).empty());
    assert(split_chunks("   \n ", 256).empty());

    auto whole = split_chunks("  short text  ", 256);
    assert(whole.size() == 1 && whole[0] == "short text");

    auto unlimited = split_chunks("One. Two. Three.", 0);
    assert(unlimited.size() == 1);

    auto merged = split_chunks("One. Two. Three.", 9);
    assert(merged.size() == 2);
    assert(merged[0] == "One. Two.");
    assert(merged[1] == "Three.");

    // Full-width terminators; a sentence longer than the limit stays whole
    auto cjk = split_chunks("\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82\xE4\xB8\x96\xE7\x95\x8C\xEF\xBC\x81", 2);
    assert(cjk.size() == 2);
    assert(utf8_length(cjk[0]) == 3);
    assert(utf8_length(cjk[1]) == 3);

    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "Sentence number " + std::to_string(i) + " talks about matching. ";
    }
    auto chunks = split_chunks(text, 256);
    assert(chunks.size() > 10);
    for (const auto& c : chunks) {
        assert(utf8_length(c) <= 256);
        assert(c.back() == '.');
    }

    std::cout << "  PASS" << std::endl;
}

void test_hashing_provider() {
    std::cout << "Testing HashingEmbeddingProvider..." << std::endl;

    HashingEmbeddingProvider provider;
    assert(provider.dimension() == DEFAULT_EMBED_DIM);
    assert(provider.model_id() == "hashing-v1/384");

    auto tokens = HashingEmbeddingProvider::tokenize("Python, C++ and RUST-lang!");
    assert(tokens.size() == 5);
    assert(tokens[0] == "python");
    assert(tokens[1] == "c");
    assert(tokens[2] == "and");
    assert(tokens[3] == "rust");
    assert(tokens[4] == "lang");

    auto a = provider.encode("Python backend engineer");
    auto b = provider.encode("python   BACKEND engineer!");
    assert(a.size() == DEFAULT_EMBED_DIM);
    assert(a.data == b.data);
    assert(std::fabs(a.norm_sq() - 1.0f) < 1e-5f);

    // Stop words carry nothing
    auto stop = provider.encode("the and of with");
    assert(stop.norm_sq() == 0.0f);

    auto batch = provider.batch_encode({"Python backend engineer", "frontend design"});
    assert(batch.size() == 2);
    assert(batch[0].data == a.data);

    bool threw = false;
    try { HashingConfig c; c.dimension = 0; HashingEmbeddingProvider bad(c); }
    catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_caching_provider() {
    std::cout << "Testing CachingEmbeddingProvider..." << std::endl;

    auto counting = std::make_shared<CountingProvider>();
    CachingEmbeddingProvider cache(counting, 2);

    auto first = cache.encode("alpha");
    auto again = cache.encode("alpha");
    assert(first.data == again.data);
    assert(counting->calls == 1);
    assert(cache.hits() == 1);

    cache.encode("beta");
    cache.encode("gamma");   // evicts alpha
    assert(cache.size() == 2);
    cache.encode("alpha");
    assert(counting->calls == 4);

    auto batch = cache.batch_encode({"alpha", "delta", "alpha"});
    assert(batch.size() == 3);
    assert(batch[0].data == first.data);
    assert(batch[2].data == first.data);

    // Failures are never cached
    CachingEmbeddingProvider failing(std::make_shared<FailingProvider>(), 4);
    bool threw = false;
    try { failing.encode("x"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    assert(failing.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_encoder() {
    std::cout << "Testing ChunkedEncoder..." << std::endl;

    auto counting = std::make_shared<CountingProvider>();
    EncoderConfig config;
    config.max_fragment_chars = 40;
    ChunkedEncoder encoder(counting, config);

    std::vector<SemanticFragment> fragments = {
        SemanticFragment("bio", "Builds compilers. Loves type systems. Mentors juniors."),
        SemanticFragment("skills", "rust, llvm"),
        SemanticFragment("quirks", ""),
    };
    auto encoded = encoder.encode_entity(fragments);

    // bio splits into two chunks; empty text still yields one vector
    assert(encoded.size() == 4);
    assert(encoded[0].field_tag == "bio");
    assert(encoded[1].field_tag == "bio");
    assert(encoded[2].field_tag == "skills");
    assert(encoded[3].field_tag == "quirks");
    for (const auto& e : encoded) assert(e.vector.size() == DEFAULT_EMBED_DIM);
    assert(counting->calls == 4);

    // Fragments are embedded separately, never concatenated
    HashingEmbeddingProvider plain;
    assert(encoded[2].vector.data == plain.encode("rust, llvm").data);

    assert(encoder.encode_entity({}).empty());

    ChunkedEncoder wrong(std::make_shared<WrongSizeProvider>());
    bool threw = false;
    try { wrong.encode_entity({SemanticFragment("bio", "x")}); }
    catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Index and detector
// ═══════════════════════════════════════════════════════════════════════════

void test_index_operations() {
    std::cout << "Testing ResonanceIndex operations..." << std::endl;

    const uint64_t fp = 1234;
    IndexConfig config;
    config.block_slots = 2;
    ResonanceIndex index(100, fp, config);
    std::mt19937_64 rng(3);

    std::map<std::string, Hypervector> stored;
    for (const char* id : {"a", "b", "c", "d", "e"}) {
        stored[id] = random_hv(rng, 100, fp);
        index.insert(id, stored[id]);
    }
    assert(index.size() == 5);
    IndexSnapshot before = index.snapshot();

    bool threw = false;
    try { index.insert("c", stored["a"]); } catch (const DuplicateEntity& e) {
        threw = true;
        assert(e.entity_id() == "c");
    }
    assert(threw);

    // Remove moves the last slot into the hole
    index.remove("b");
    IndexSnapshot after = index.snapshot();
    auto ids = after->ids();
    assert(ids.size() == 4);
    assert(ids[0] == "a" && ids[1] == "e" && ids[2] == "c" && ids[3] == "d");
    assert(after->get("e") == stored["e"]);
    assert(!after->contains("b"));

    // Old snapshots never change
    assert(before->size() == 5);
    assert(before->get("b") == stored["b"]);
    assert(before->ids()[1] == "b");

    Hypervector replacement = random_hv(rng, 100, fp);
    index.update("a", replacement);
    assert(index.snapshot()->get("a") == replacement);
    assert(after->get("a") == stored["a"]);

    assert(!index.upsert("a", stored["a"]));
    assert(index.upsert("f", replacement));
    assert(index.size() == 5);

    threw = false;
    try { index.update("zzz", replacement); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);
    threw = false;
    try { index.remove("zzz"); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);
    threw = false;
    try { index.snapshot()->get("zzz"); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);

    // Wrong projection or width is rejected before any write
    threw = false;
    try { index.insert("g", Hypervector(100, fp + 1)); } catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);
    threw = false;
    try { index.insert("g", Hypervector(64, fp)); } catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    // Drain to empty; blocks are released
    for (const auto& id : index.snapshot()->ids()) index.remove(id);
    assert(index.size() == 0);
    assert(index.snapshot()->empty());
    index.insert("z", replacement);
    assert(index.snapshot()->ids().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_index_batch() {
    std::cout << "Testing WriteBatch..." << std::endl;

    const uint64_t fp = 77;
    ResonanceIndex index(64, fp);
    std::mt19937_64 rng(5);

    WriteBatch batch;
    batch.insert("a", random_hv(rng, 64, fp))
         .insert("b", random_hv(rng, 64, fp))
         .insert("c", random_hv(rng, 64, fp));
    index.apply(batch);
    assert(index.size() == 3);
    uint64_t version = index.snapshot()->version();

    // A failing entry discards the whole batch
    WriteBatch bad;
    bad.remove("a").insert("d", random_hv(rng, 64, fp)).remove("missing");
    bool threw = false;
    try { index.apply(bad); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);
    assert(index.size() == 3);
    assert(index.contains("a"));
    assert(!index.contains("d"));
    assert(index.snapshot()->version() == version);

    WriteBatch good;
    good.remove("a").upsert("b", random_hv(rng, 64, fp)).insert("d", random_hv(rng, 64, fp));
    index.apply(good);
    assert(index.size() == 3);
    assert(!index.contains("a"));
    assert(index.snapshot()->version() == version + 1);

    std::cout << "  PASS" << std::endl;
}

void test_index_write_conflict() {
    std::cout << "Testing IndexWriteConflict..." << std::endl;

    const uint64_t fp = 9;
    IndexConfig config;
    config.write_timeout = std::chrono::milliseconds(20);
    ResonanceIndex index(64, fp, config);

    std::atomic<bool> holding{false};
    std::thread holder([&]() {
        index.transact([&](IndexDraft& draft) {
            holding = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            draft.insert("held", Hypervector(64, fp));
        });
    });
    while (!holding) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    bool threw = false;
    try { index.insert("late", Hypervector(64, fp)); } catch (const IndexWriteConflict&) { threw = true; }
    assert(threw);
    holder.join();

    // Retrying the write succeeds
    index.insert("late", Hypervector(64, fp));
    assert(index.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_match_policies() {
    std::cout << "Testing ranked and thresholded top-k..." << std::endl;

    const uint64_t fp = 21;
    ResonanceIndex index(512, fp);
    std::mt19937_64 rng(8);
    Hypervector query = random_hv(rng, 512, fp);

    // Identical vectors tie; ids break the tie
    Hypervector twin = random_hv(rng, 512, fp);
    index.insert("e3", twin);
    index.insert("e1", twin);
    index.insert("e2", twin);
    index.insert("self", query);
    for (int i = 0; i < 30; ++i) {
        index.insert("r" + std::to_string(i), random_hv(rng, 512, fp));
    }

    IndexSnapshot view = index.snapshot();
    ResonanceDetector detector;

    auto ranked = detector.match(query, *view, MatchPolicy::ranked(5));
    assert(ranked.size() == 5);
    assert(ranked[0].entity_id == "self");
    assert(ranked[0].similarity == 1.0f);
    for (size_t i = 1; i < ranked.size(); ++i) {
        assert(ranked[i - 1].similarity >= ranked[i].similarity);
    }

    auto twins = detector.match(twin, *view, MatchPolicy::ranked(3));
    assert(twins.size() == 3);
    assert(twins[0].entity_id == "e1");
    assert(twins[1].entity_id == "e2");
    assert(twins[2].entity_id == "e3");

    // Identical ordering on every call
    for (int i = 0; i < 5; ++i) {
        auto again = detector.match(query, *view, MatchPolicy::ranked(5));
        for (size_t j = 0; j < again.size(); ++j) {
            assert(again[j].entity_id == ranked[j].entity_id);
            assert(again[j].distance == ranked[j].distance);
        }
    }

    // Never more than k, never below threshold, never padded
    auto strict = detector.match(query, *view, MatchPolicy::thresholded(5, 0.9f));
    assert(strict.size() == 1);
    assert(strict[0].entity_id == "self");
    for (const auto& r : detector.match(query, *view, MatchPolicy::thresholded(5, 0.4f))) {
        assert(r.similarity >= 0.4f);
    }
    assert(detector.match(query, *view, MatchPolicy::thresholded(5, 0.4f)).size() <= 5);
    assert(match(query, *view, 5, 0.9f).size() == 1);

    assert(detector.match(query, *view, MatchPolicy::ranked(0)).empty());
    assert(detector.match(query, *view, MatchPolicy::ranked(1000)).size() == view->size());

    ResonanceIndex empty(512, fp);
    assert(detector.match(query, *empty.snapshot(), MatchPolicy::ranked(5)).empty());

    bool threw = false;
    try { detector.match(query, *view, MatchPolicy::thresholded(5, 1.5f)); }
    catch (const ConfigError&) { threw = true; }
    assert(threw);

    threw = false;
    try { detector.match(Hypervector(512, fp + 1), *view, MatchPolicy::ranked(5)); }
    catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_parallel_scan() {
    std::cout << "Testing parallel scan merge..." << std::endl;

    const uint64_t fp = 31;
    IndexConfig config;
    config.block_slots = 16;
    ResonanceIndex index(256, fp, config);
    std::mt19937_64 rng(13);

    WriteBatch batch;
    Hypervector shared = random_hv(rng, 256, fp);
    for (int i = 0; i < 300; ++i) {
        // Every tenth entity is a duplicate to force ties across partitions
        batch.insert("n" + std::to_string(i), i % 10 == 0 ? shared : random_hv(rng, 256, fp));
    }
    index.apply(batch);
    IndexSnapshot view = index.snapshot();

    ResonanceDetector single(1);
    ResonanceDetector parallel(4, 10);
    for (const auto& query : {shared, random_hv(rng, 256, fp)}) {
        for (const auto& policy : {MatchPolicy::ranked(25), MatchPolicy::thresholded(50, 0.5f)}) {
            auto a = single.match(query, *view, policy);
            auto b = parallel.match(query, *view, policy);
            assert(a.size() == b.size());
            for (size_t i = 0; i < a.size(); ++i) {
                assert(a[i].entity_id == b[i].entity_id);
                assert(a[i].distance == b[i].distance);
            }
        }
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════════════

void test_encoding_invariants() {
    std::cout << "Testing encoding invariants..." << std::endl;

    auto engine = make_engine();
    const size_t words = Hypervector::words_for(DEFAULT_D_BITS);

    std::string sentences;
    while (sentences.size() < 10000) sentences += "Distributed systems need careful design. ";
    sentences.resize(10000);

    for (const std::string& text : {std::string(""), std::string("x"),
                                    std::string(10000, 'y'), sentences}) {
        Hypervector hv = engine->encode_text(text);
        assert(hv.bits() == DEFAULT_D_BITS);
        assert(hv.word_count() == words);
        assert((hv.words().back() >> (DEFAULT_D_BITS % 64)) == 0);
    }

    // Determinism: same text, same projection, same bits
    Hypervector a = engine->encode_text("Python backend, distributed systems");
    Hypervector b = engine->encode_text("Python backend, distributed systems");
    assert(a == b);
    assert(a.similarity(b) == 1.0f);

    // A second engine built from the same seed agrees bit for bit
    EngineConfig config;
    ResonanceEngine fresh(hashing(), config);
    assert(fresh.encode_text("Python backend, distributed systems") == a);

    Hypervector c = engine->encode_text("frontend React, UI design");
    assert(a.similarity(c) == c.similarity(a));

    bool threw = false;
    try { engine->encode({}); } catch (const EmptyBundleInput&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_python_backend_scenario() {
    std::cout << "Testing backend engineer scenario..." << std::endl;

    auto engine = make_engine();
    engine->register_entity("A", {SemanticFragment("bio", "Python backend, distributed systems")});
    engine->register_entity("B", {SemanticFragment("bio", "frontend React, UI design")});
    engine->register_entity("C", {SemanticFragment("bio", "Python data pipelines, ETL")});

    auto results = engine->match("need a backend engineer with Python", MatchPolicy::ranked(3));
    assert(results.size() == 3);
    assert(results[0].entity_id == "A");
    assert(results[1].entity_id == "C");
    assert(results[2].entity_id == "B");

    // A at ~0.67 and C at ~0.58 clear 0.55; B sits at chance
    auto thresholded = engine->match("need a backend engineer with Python",
                                     MatchPolicy::thresholded(5, 0.55f));
    assert(thresholded.size() == 2);
    for (const auto& r : thresholded) assert(r.entity_id != "B");

    // A profile's own text is an exact match and the only one above 0.9
    auto exact = engine->match(engine->encode_text("Python backend, distributed systems"),
                               MatchPolicy::thresholded(5, 0.9f));
    assert(exact.size() == 1);
    assert(exact[0].entity_id == "A");
    assert(exact[0].similarity == 1.0f);

    std::cout << "  PASS" << std::endl;
}

void test_entity_lifecycle() {
    std::cout << "Testing entity lifecycle..." << std::endl;

    auto engine = make_engine();
    std::vector<SemanticFragment> alice = {
        SemanticFragment("bio", "Machine learning researcher training neural networks for medical imaging"),
        SemanticFragment("skills", "pytorch, cuda, segmentation, radiology datasets"),
        SemanticFragment("looking_for", "clinicians sharing annotated scans"),
    };
    engine->register_entity("alice", alice);
    assert(engine->contains("alice"));
    assert(engine->snapshot()->get("alice") == engine->encode(alice));

    bool threw = false;
    try { engine->register_entity("alice", alice); } catch (const DuplicateEntity&) { threw = true; }
    assert(threw);

    // Which facet resonated
    auto fields = engine->explain("alice", "pytorch and cuda for segmentation");
    assert(fields.size() == 3);
    assert(fields[0].field_tag == "skills");
    assert(fields[0].similarity > fields[1].similarity);

    // One field changes; the stored vector is re-bundled from all fields
    engine->update_fragment("alice", SemanticFragment("skills", "baking, fermentation, lamination"));
    std::vector<SemanticFragment> updated = alice;
    updated[1].text = "baking, fermentation, lamination";
    assert(engine->snapshot()->get("alice") == engine->encode(updated));

    engine->replace_entity("alice", {SemanticFragment("bio", "Jazz pianist")});
    assert(engine->snapshot()->get("alice") == engine->encode_text("Jazz pianist"));
    assert(engine->explain("alice", "piano").size() == 1);

    threw = false;
    try { engine->update_fragment("bob", SemanticFragment("bio", "x")); }
    catch (const EntityNotFound&) { threw = true; }
    assert(threw);
    threw = false;
    try { engine->replace_entity("bob", alice); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);

    engine->remove_entity("alice");
    assert(!engine->contains("alice"));
    threw = false;
    try { engine->remove_entity("alice"); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);
    threw = false;
    try { engine->explain("alice", "x"); } catch (const EntityNotFound&) { threw = true; }
    assert(threw);

    // Without retained fields there is nothing to re-bundle or explain
    EngineConfig lean;
    lean.retain_fragments = false;
    auto lean_engine = make_engine(hashing(), lean);
    lean_engine->register_entity("alice", alice);
    threw = false;
    try { lean_engine->update_fragment("alice", alice[0]); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    threw = false;
    try { lean_engine->explain("alice", "pytorch"); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_remove_under_concurrent_insert() {
    std::cout << "Testing remove during concurrent inserts..." << std::endl;

    auto engine = make_engine();
    for (int i = 0; i < 10; ++i) {
        engine->register_entity("base" + std::to_string(i),
            {SemanticFragment("bio", "profile " + std::to_string(i) + " works on topic " +
                                     std::to_string(i * 7))});
    }
    const std::string target_text = "rust compiler engineer";
    engine->register_entity("target", {SemanticFragment("bio", target_text)});
    Hypervector target = engine->encode_text(target_text);

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 30; ++i) {
            engine->register_entity("new" + std::to_string(i),
                {SemanticFragment("bio", "rust compiler engineer number " + std::to_string(i))});
        }
        done = true;
    });

    engine->remove_entity("target");
    size_t checks = 0;
    do {
        for (const auto& r : engine->match(target, MatchPolicy::ranked(100))) {
            assert(r.entity_id != "target");
        }
        checks++;
    } while (!done);
    writer.join();

    auto final_results = engine->match(target, MatchPolicy::ranked(100));
    assert(final_results.size() == 40);
    for (const auto& r : final_results) assert(r.entity_id != "target");
    assert(checks > 0);

    std::cout << "  PASS" << std::endl;
}

void test_encoding_failures() {
    std::cout << "Testing encoding timeout, cancellation and failure..." << std::endl;
    using clock = std::chrono::steady_clock;

    // Timeout
    EngineConfig config;
    config.encoder.timeout = std::chrono::milliseconds(30);
    auto slow = make_engine(std::make_shared<SlowProvider>(std::chrono::milliseconds(400)), config);
    auto start = clock::now();
    bool threw = false;
    try { slow->register_entity("x", {SemanticFragment("bio", "slow text")}); }
    catch (const EncodingUnavailable& e) {
        threw = true;
        assert(std::strstr(e.what(), "timed out") != nullptr);
    }
    assert(threw);
    assert(clock::now() - start < std::chrono::milliseconds(300));
    assert(slow->size() == 0);

    // Caller cancellation
    EngineConfig patient;
    patient.encoder.timeout = std::chrono::milliseconds(5000);
    auto cancellable = make_engine(std::make_shared<SlowProvider>(std::chrono::milliseconds(400)),
                                   patient);
    CancelToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    start = clock::now();
    threw = false;
    try { cancellable->encode_text("never finishes in time", token); }
    catch (const EncodingUnavailable& e) {
        threw = true;
        assert(std::strstr(e.what(), "cancelled") != nullptr);
    }
    canceller.join();
    assert(threw);
    assert(clock::now() - start < std::chrono::milliseconds(300));

    threw = false;
    try { cancellable->encode_text("already cancelled", token); }
    catch (const EncodingUnavailable&) { threw = true; }
    assert(threw);

    // Provider error surfaces as EncodingUnavailable; nothing is indexed
    auto failing = make_engine(std::make_shared<FailingProvider>());
    threw = false;
    try { failing->register_entity("x", {SemanticFragment("bio", "text")}); }
    catch (const EncodingUnavailable& e) {
        threw = true;
        assert(std::strstr(e.what(), "model server down") != nullptr);
    }
    assert(threw);
    assert(failing->size() == 0);

    // Batch registration is all or nothing
    std::vector<Profile> profiles(2);
    profiles[0].id = "p0";
    profiles[0].fragments = {SemanticFragment("bio", "ok")};
    profiles[1].id = "p1";
    profiles[1].fragments = {SemanticFragment("bio", "ok too")};
    threw = false;
    try { failing->register_profiles(profiles); } catch (const EncodingUnavailable&) { threw = true; }
    assert(threw);
    assert(failing->size() == 0);

    // Wrong dense length is a configuration error, not a zero vector
    auto wrong = make_engine(std::make_shared<WrongSizeProvider>());
    threw = false;
    try { wrong->encode_text("x"); } catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    // Provider and projection must agree on the dense length
    HashingConfig small;
    small.dimension = 128;
    threw = false;
    try { make_engine(std::make_shared<HashingEmbeddingProvider>(small)); }
    catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Persistence, profiles, config
// ═══════════════════════════════════════════════════════════════════════════

void test_provider_saturation() {
    std::cout << "Testing hung provider stays within the worker cap..." << std::endl;
    using clock = std::chrono::steady_clock;

    auto release = std::make_shared<std::atomic<bool>>(false);
    auto hung = std::make_shared<HungProvider>(release);

    EncoderConfig enc_config;
    enc_config.provider_workers = 2;
    ChunkedEncoder encoder(hung, enc_config);
    assert(encoder.workers().thread_count() == 2);
    assert(encoder.workers().capacity() == 2);

    EngineConfig config;
    config.encoder.timeout = std::chrono::milliseconds(50);
    config.encoder.provider_workers = 3;
    auto engine = make_engine(hung, config);

    size_t timed_out = 0, saturated = 0;
    auto start = clock::now();
    for (int i = 0; i < 50; ++i) {
        try {
            (void)engine->encode_text("stuck " + std::to_string(i));
            assert(false);
        } catch (const EncodingUnavailable& e) {
            if (std::strstr(e.what(), "provider saturated") != nullptr) ++saturated;
            else if (std::strstr(e.what(), "timed out") != nullptr) ++timed_out;
        }
        assert(engine->stats().encodes_in_flight <= 3);
    }
    // Each slot is held by a call stuck in the provider; a call skipped
    // before it started frees its slot early, so only bounds are fixed
    assert(timed_out >= 3);
    assert(saturated > 0);
    assert(timed_out + saturated == 50);
    assert(hung->peak() <= 3);
    // Saturated calls fail without waiting out the timeout
    assert(clock::now() - start < std::chrono::milliseconds(2000));

    // Released calls drain and the engine encodes again
    release->store(true);
    auto deadline = clock::now() + std::chrono::seconds(5);
    while (engine->stats().encodes_in_flight > 0 && clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    assert(engine->stats().encodes_in_flight == 0);
    Hypervector hv = engine->encode_text("unstuck");
    assert(hv.bits() == DEFAULT_D_BITS);

    std::cout << "  PASS" << std::endl;
}

void test_policy_overrides() {
    std::cout << "Testing command-line policy overrides..." << std::endl;

    MatchPolicy base = MatchPolicy::ranked(10);

    MatchPolicy same = policy_with_overrides(base, false, 0, false, 0.0f);
    assert(same.mode == MatchMode::Ranked);
    assert(same.k == 10);

    MatchPolicy t = policy_with_overrides(base, true, 3, true, 0.7f);
    assert(t.mode == MatchMode::Thresholded);
    assert(t.k == 3);
    assert(std::fabs(t.threshold - 0.7f) < 1e-6f);

    // Zero is a real threshold, not "unset"
    MatchPolicy zero = policy_with_overrides(base, false, 0, true, 0.0f);
    assert(zero.mode == MatchMode::Thresholded);

    const float rejected[] = {-0.5f, 1.5f, std::nanf("")};
    for (float value : rejected) {
        bool threw = false;
        try { policy_with_overrides(base, false, 0, true, value); }
        catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_roundtrip() {
    std::cout << "Testing snapshot save/load..." << std::endl;

    auto engine = make_engine();
    engine->register_entity("A", {SemanticFragment("bio", "Python backend, distributed systems")});
    engine->register_entity("B", {SemanticFragment("bio", "frontend React, UI design")});
    engine->register_entity("C", {SemanticFragment("bio", "Python data pipelines, ETL")});

    std::string path = temp_path("roundtrip.rsnx");
    engine->save(path);

    auto restored = make_engine();
    restored->register_entity("stale", {SemanticFragment("bio", "replaced by load")});
    restored->load(path);
    assert(restored->size() == 3);
    assert(!restored->contains("stale"));
    for (const char* id : {"A", "B", "C"}) {
        assert(restored->snapshot()->get(id) == engine->snapshot()->get(id));
    }

    auto before = engine->match("need a backend engineer with Python", MatchPolicy::ranked(3));
    auto after = restored->match("need a backend engineer with Python", MatchPolicy::ranked(3));
    for (size_t i = 0; i < before.size(); ++i) {
        assert(before[i].entity_id == after[i].entity_id);
        assert(before[i].distance == after[i].distance);
    }

    // Bits are meaningless under another seed
    bool threw = false;
    try { load_index(path, *ProjectionMatrix::create(DEFAULT_D_BITS, 8, 7)); }
    catch (const ProjectionMismatch&) { threw = true; }
    assert(threw);

    threw = false;
    try { load_index(path, *ProjectionMatrix::create(512, 8, 42)); }
    catch (const ProjectionMismatch&) { assert(false); }
    catch (const DimensionMismatch&) { threw = true; }
    assert(threw);

    // Corruption
    std::vector<uint8_t> bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::vector<uint8_t> flipped = bytes;
    flipped[flipped.size() / 2] ^= 0x5A;
    threw = false;
    try { deserialize_index(flipped, *default_projection()); }
    catch (const SnapshotFormatError& e) {
        threw = true;
        assert(std::strstr(e.what(), "checksum") != nullptr);
    }
    assert(threw);

    std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + 20);
    threw = false;
    try { deserialize_index(truncated, *default_projection()); }
    catch (const SnapshotFormatError&) { threw = true; }
    assert(threw);

    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] ^= 0xFF;
    threw = false;
    try { deserialize_index(bad_magic, *default_projection()); }
    catch (const SnapshotFormatError&) { threw = true; }
    assert(threw);

    threw = false;
    try { load_index(temp_path("missing.rsnx"), *default_projection()); }
    catch (const SnapshotFormatError&) { threw = true; }
    assert(threw);

    // Empty index round trip
    ResonanceIndex empty(DEFAULT_D_BITS, default_projection()->fingerprint());
    auto reloaded = deserialize_index(serialize_index(*empty.snapshot()), *default_projection());
    assert(reloaded->size() == 0);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_profiles() {
    std::cout << "Testing profile loading..." << std::endl;

    json doc = json::parse(R"([
        {"id": "a1", "name": "Ada", "bio": "Builds compilers", "skills": ["C++", "LLVM", " "],
         "age": 30, "quirks": ""},
        {"agent_id": "b2", "role": "Designer", "interests": [], "values": ["craft", "clarity"]},
        {"id": "c3", "favourite_colour": "green"}
    ])");
    auto profiles = parse_profiles(doc);
    assert(profiles.size() == 2);
    assert(profiles[0].id == "a1");
    assert(profiles[0].fragments.size() == 3);
    assert(profiles[0].fragments[0].field_tag == "name");
    assert(profiles[0].fragments[1].field_tag == "bio");
    assert(profiles[0].fragments[2].field_tag == "skills");
    assert(profiles[0].fragments[2].text == "C++, LLVM");
    assert(profiles[1].id == "b2");
    assert(profiles[1].fragments.size() == 2);
    assert(profiles[1].fragments[1].text == "craft, clarity");

    json keyed = json::parse(R"({"chef": {"occupation": "Pastry chef"},
                                 "guide": {"id": "g-1", "bio": "Mountain guide"}})");
    auto by_key = parse_profiles(keyed);
    assert(by_key.size() == 2);
    assert(by_key[0].id == "chef");
    assert(by_key[1].id == "g-1");

    bool threw = false;
    try { parse_profiles(json::parse(R"([{"bio": "no id"}])")); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_profiles(json::parse("42")); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::string path = temp_path("profiles.json");
    {
        std::ofstream out(path);
        out << keyed.dump();
    }
    auto loaded = load_profiles(path);
    assert(loaded.size() == 2);
    std::remove(path.c_str());

    threw = false;
    try { load_profiles(temp_path("absent.json")); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    json j = {
        {"d_bits", 2048},
        {"seed", 7},
        {"scan_threads", 2},
        {"encode_timeout_ms", 250},
        {"match", {{"mode", "thresholded"}, {"k", 5}, {"threshold", 0.8}}},
    };
    EngineConfig c = config_from_json(j);
    assert(c.d_bits == 2048);
    assert(c.seed == 7);
    assert(c.embed_dim == DEFAULT_EMBED_DIM);
    assert(c.scan_threads == 2);
    assert(c.encoder.timeout == std::chrono::milliseconds(250));
    assert(c.default_policy.mode == MatchMode::Thresholded);
    assert(c.default_policy.k == 5);
    assert(c.default_policy.threshold == 0.8f);

    EngineConfig back = config_from_json(config_to_json(c));
    assert(back.d_bits == c.d_bits && back.seed == c.seed);
    assert(back.default_policy.threshold == c.default_policy.threshold);

    auto rejects = [](const json& bad) {
        try { config_from_json(bad); } catch (const ConfigError&) { return true; }
        return false;
    };
    assert(rejects({{"d_bits", 0}}));
    assert(rejects({{"d_bits", -5}}));
    assert(rejects({{"d_bits", "big"}}));
    assert(rejects({{"embed_dim", 0}}));
    assert(rejects({{"encode_timeout_ms", 0}}));
    assert(rejects({{"match", {{"mode", "thresholded"}, {"threshold", 1.5}}}}));
    assert(rejects({{"match", {{"mode", "fuzzy"}}}}));
    assert(rejects(json::array()));

    ::setenv("RESONANCE_SEED", "99", 1);
    ::setenv("RESONANCE_TIMEOUT_MS", "1500", 1);
    apply_env_overrides(c);
    assert(c.seed == 99);
    assert(c.encoder.timeout == std::chrono::milliseconds(1500));
    ::unsetenv("RESONANCE_SEED");
    ::unsetenv("RESONANCE_TIMEOUT_MS");

    ::setenv("RESONANCE_D_BITS", "lots", 1);
    bool threw = false;
    try { apply_env_overrides(c); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    ::unsetenv("RESONANCE_D_BITS");

    std::string path = temp_path("config.json");
    {
        std::ofstream out(path);
        out << R"({"block_slots": 64, "retain_fragments": false})";
    }
    EngineConfig from_file = load_config(path);
    assert(from_file.index.block_slots == 64);
    assert(!from_file.retain_fragments);
    std::remove(path.c_str());

    {
        std::ofstream out(path);
        out << "{not json";
    }
    threw = false;
    try { load_config(path); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_error_taxonomy() {
    std::cout << "Testing error taxonomy..." << std::endl;

    auto is_resonance_error = [](const std::exception& e) {
        return dynamic_cast<const ResonanceError*>(&e) != nullptr;
    };
    assert(is_resonance_error(EncodingUnavailable("x")));
    assert(is_resonance_error(DimensionMismatch("x", 1, 2)));
    assert(is_resonance_error(EmptyBundleInput()));
    assert(is_resonance_error(IndexWriteConflict("x")));
    assert(is_resonance_error(EntityNotFound("x")));
    assert(is_resonance_error(DuplicateEntity("x")));
    assert(is_resonance_error(ConfigError("x")));
    assert(is_resonance_error(SnapshotFormatError("x")));

    ProjectionMismatch pm("seed");
    assert(dynamic_cast<const DimensionMismatch*>(&pm) != nullptr);

    DimensionMismatch dm("dense vector length", 384, 10);
    assert(std::strstr(dm.what(), "expected 384, got 10") != nullptr);

    assert(EntityNotFound("agent-7").entity_id() == "agent-7");

    assert(version::snapshot_compatible(RESONANCE_SNAPSHOT_FORMAT_MAJOR, 0));
    assert(!version::snapshot_compatible(RESONANCE_SNAPSHOT_FORMAT_MAJOR + 1, 0));
    assert(!version::snapshot_compatible(RESONANCE_SNAPSHOT_FORMAT_MAJOR,
                                         RESONANCE_SNAPSHOT_FORMAT_MINOR + 1));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Recall regression: raw query vs rewritten query
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Profile> recall_corpus() {
    auto profile = [](const char* id, const char* bio, const char* skills, const char* looking_for) {
        Profile p;
        p.id = id;
        p.fragments = {SemanticFragment("bio", bio), SemanticFragment("skills", skills),
                       SemanticFragment("looking_for", looking_for)};
        return p;
    };
    return {
        profile("alice", "Machine learning researcher training neural networks for medical imaging",
                "pytorch, cuda, segmentation, radiology datasets",
                "clinicians sharing annotated scans"),
        profile("bob", "Pastry chef running a bakery with sourdough and croissants",
                "baking, fermentation, lamination, menu costing",
                "farmers supplying heirloom flour"),
        profile("carol", "Jazz pianist composing film scores and teaching harmony",
                "piano, orchestration, improvisation, ableton",
                "directors wanting original soundtrack"),
        profile("dave", "Patent attorney protecting hardware inventions and licensing deals",
                "litigation, trademarks, contracts, negotiation",
                "founders filing intellectual property claims"),
        profile("erin", "Urban farmer growing hydroponic greens on rooftops",
                "irrigation, composting, seedlings, beekeeping",
                "restaurants buying fresh microgreens"),
        profile("frank", "Mountain guide leading alpine expeditions and avalanche courses",
                "rescue, rope, navigation, first aid",
                "trekkers seeking glacier adventures"),
    };
}

void test_harness_metrics() {
    std::cout << "Testing RecallHarness metrics..." << std::endl;

    GoldenCase c;
    c.name = "two-relevant";
    c.tier = Tier::Paraphrase;
    c.relevant = {"x", "y"};
    c.k = 3;

    SearchFn search = [](const std::string&, size_t) {
        return std::vector<MatchResult>{MatchResult("z", 0.9f, 1), MatchResult("x", 0.8f, 2),
                                        MatchResult("w", 0.7f, 3)};
    };
    CaseResult r = RecallHarness::evaluate_case(c, "q", search);
    assert(std::fabs(r.recall - 0.5f) < 1e-6f);
    assert(std::fabs(r.precision - 1.0f / 3.0f) < 1e-6f);
    assert(std::fabs(r.mrr - 0.5f) < 1e-6f);
    assert(r.retrieved.size() == 3);

    HarnessStats stats = RecallHarness::summarize({r});
    assert(stats.cases == 1);
    assert(stats.tier_recall.at(Tier::Paraphrase) == r.recall);
    assert(std::string(tier_name(Tier::CrossDomain)) == "cross-domain");

    std::cout << "  PASS" << std::endl;
}

void test_raw_query_beats_rewritten_query() {
    std::cout << "Testing raw query recall vs rewritten query..." << std::endl;

    auto engine = make_engine();
    engine->register_profiles(recall_corpus());
    assert(engine->size() == 6);

    RecallHarness harness;
    auto add = [&harness](const char* name, Tier tier, const char* query, const char* relevant) {
        GoldenCase c;
        c.name = name;
        c.tier = tier;
        c.query = query;
        c.relevant = {relevant};
        c.k = 1;
        harness.add_case(c);
    };
    add("direct-ml", Tier::Direct, "pytorch segmentation for radiology", "alice");
    add("direct-music", Tier::Direct, "piano improvisation and orchestration", "carol");
    add("paraphrase-bakery", Tier::Paraphrase, "someone who bakes sourdough croissants", "bob");
    add("paraphrase-patent", Tier::Paraphrase, "patent licensing for my hardware", "dave");
    add("complementary-greens", Tier::Complementary, "buying fresh microgreens for my restaurants", "erin");
    add("complementary-trek", Tier::Complementary, "trekkers seeking glacier adventures with a guide", "frank");
    add("cross-film", Tier::CrossDomain, "film directors wanting an original soundtrack", "carol");
    add("cross-farm", Tier::CrossDomain, "hydroponic greens grown by an urban farmer", "erin");

    // Keyword "sharpening" of each query into specialist jargon. The first
    // rewrite keeps a profile term, so it still finds its match.
    const std::map<std::string, std::string> rewrites = {
        {"pytorch segmentation for radiology", "pytorch engineer, CNN, CT MRI"},
        {"piano improvisation and orchestration", "keyboardist arranger, music production, DAW"},
        {"someone who bakes sourdough croissants", "artisan viennoiserie specialist, levain"},
        {"patent licensing for my hardware", "IP counsel, USPTO prosecution, royalties"},
        {"buying fresh microgreens for my restaurants", "B2B produce vendor, farm-to-table sourcing"},
        {"trekkers seeking glacier adventures with a guide", "certified IFMGA mountaineering outfitter"},
        {"film directors wanting an original soundtrack", "cinema composer, OST, scoring stage"},
        {"hydroponic greens grown by an urban farmer", "vertical agriculture, CEA grower, NFT channels"},
    };
    QueryTransform rewrite = [&rewrites](const std::string& q) { return rewrites.at(q); };

    SearchFn search = [&engine](const std::string& q, size_t k) {
        return engine->match(q, MatchPolicy::ranked(k));
    };

    Comparison cmp = harness.compare(search, rewrite);
    assert(cmp.raw_cases.size() == 8);
    for (size_t i = 0; i < cmp.raw_cases.size(); ++i) {
        assert(cmp.raw_cases[i].recall == 1.0f);
        assert(cmp.raw_cases[i].recall >= cmp.transformed_cases[i].recall);
    }
    // Raw recall is never worse, and equal when the rewrite keeps the term
    assert(cmp.transformed_cases[0].recall == 1.0f);
    assert(cmp.transformed_cases[0].recall == cmp.raw_cases[0].recall);
    assert(cmp.raw.avg_recall == 1.0f);
    assert(cmp.raw.avg_mrr == 1.0f);
    assert(cmp.raw.avg_recall > cmp.transformed.avg_recall);
    assert(cmp.recall_delta() > 0.0f);
    assert(cmp.raw.tier_recall.size() == 4);
    for (const auto& entry : cmp.raw.tier_recall) assert(entry.second == 1.0f);

    std::cout << "  raw recall@1 " << cmp.raw.avg_recall
              << ", rewritten recall@1 " << cmp.transformed.avg_recall << std::endl;
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Resonance C++ Tests ===" << std::endl;
    std::cout << "D_BITS = " << DEFAULT_D_BITS << ", EMBED_DIM = " << DEFAULT_EMBED_DIM << std::endl;
    std::cout << std::endl;

    test_hypervector_bits();
    test_similarity_properties();
    test_compatibility_checks();
    test_gaussian_stream();
    test_projection();
    test_projection_golden_values();
    test_bundle();

    std::cout << std::endl;
    std::cout << "=== Encoding ===" << std::endl;
    test_chunker();
    test_hashing_provider();
    test_caching_provider();
    test_encoder();

    std::cout << std::endl;
    std::cout << "=== Index and Matching ===" << std::endl;
    test_index_operations();
    test_index_batch();
    test_index_write_conflict();
    test_match_policies();
    test_parallel_scan();

    std::cout << std::endl;
    std::cout << "=== Engine ===" << std::endl;
    test_encoding_invariants();
    test_python_backend_scenario();
    test_entity_lifecycle();
    test_remove_under_concurrent_insert();
    test_encoding_failures();
    test_provider_saturation();

    std::cout << std::endl;
    std::cout << "=== Persistence and Config ===" << std::endl;
    test_snapshot_roundtrip();
    test_profiles();
    test_config();
    test_policy_overrides();
    test_error_taxonomy();

    std::cout << std::endl;
    std::cout << "=== Recall Regression ===" << std::endl;
    test_harness_metrics();
    test_raw_query_beats_rewritten_query();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
