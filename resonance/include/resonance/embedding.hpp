#pragma once
// Embedding providers: text → dense vector
//
// The provider is the only I/O-bound step of the pipeline. Everything
// downstream of it is pure arithmetic. Contract for implementations:
//   - deterministic for identical text and model version
//   - fixed output length (dimension())
//   - failure is EncodingUnavailable, never a zero or partial vector

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace resonance {

// Abstract embedder interface
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual DenseVector encode(const std::string& text) = 0;

    // One vector per input, same order
    virtual std::vector<DenseVector> batch_encode(const std::vector<std::string>& texts) {
        std::vector<DenseVector> results;
        results.reserve(texts.size());
        for (const auto& text : texts) {
            results.push_back(encode(text));
        }
        return results;
    }

    virtual size_t dimension() const = 0;

    // Model name + version; vectors from different ids are not comparable
    virtual std::string model_id() const = 0;
};

// Caller-owned cancellation flag. Copies share the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Fixed set of threads for provider calls. At most capacity() calls are in
// flight at once, counting calls whose caller already gave up; past that,
// try_submit() refuses instead of starting another thread. Workers share the
// queue state, so a hung provider call never blocks the owner's destructor.
class ProviderWorkers {
public:
    explicit ProviderWorkers(size_t workers) : state_(std::make_shared<State>()) {
        if (workers == 0) throw ConfigError("provider_workers must be > 0");
        state_->capacity = workers;
        threads_.reserve(workers);
        try {
            for (size_t i = 0; i < workers; ++i) {
                threads_.emplace_back([state = state_]() { run(state); });
            }
        } catch (const std::system_error& e) {
            shutdown();
            throw EncodingUnavailable(std::string("cannot start provider workers: ") + e.what());
        }
    }

    ProviderWorkers(const ProviderWorkers&) = delete;
    ProviderWorkers& operator=(const ProviderWorkers&) = delete;

    ~ProviderWorkers() { shutdown(); }

    // Queue a task; false when every slot is taken. Tasks must not throw.
    bool try_submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->stopping || state_->in_flight >= state_->capacity) return false;
            ++state_->in_flight;
            state_->queue.push_back(std::move(task));
        }
        state_->cv.notify_one();
        return true;
    }

    // Queued plus running tasks
    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->in_flight;
    }

    size_t capacity() const { return state_->capacity; }
    size_t thread_count() const { return threads_.size(); }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> queue;
        size_t capacity = 0;
        size_t in_flight = 0;
        bool stopping = false;
    };

    static void run(std::shared_ptr<State> state) {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                state->cv.wait(lock, [&] { return state->stopping || !state->queue.empty(); });
                if (state->queue.empty()) return;
                task = std::move(state->queue.front());
                state->queue.pop_front();
            }
            task();
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->in_flight;
        }
    }

    // Idle workers are joined. Busy ones (a hung provider) are detached and
    // exit once their call returns.
    void shutdown() {
        bool busy;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->stopping = true;
            busy = state_->in_flight > 0;
        }
        state_->cv.notify_all();
        for (auto& t : threads_) {
            if (!t.joinable()) continue;
            if (busy) t.detach();
            else t.join();
        }
        if (busy) {
            log::warn("embedding", "detached provider workers with calls still in flight");
        }
    }

    std::shared_ptr<State> state_;
    std::vector<std::thread> threads_;
};

// Run fn on one of `workers` and wait at most `timeout`, polling `cancel`.
// On timeout or cancellation the call is abandoned: a queued call is skipped,
// a running one finishes on its own and its result is dropped. Either way
// EncodingUnavailable is thrown, as it is when no worker slot is free.
template <typename T, typename Fn>
T bounded_call(ProviderWorkers& workers, Fn fn, std::chrono::milliseconds timeout,
               const CancelToken& cancel, const std::string& what)
{
    using clock = std::chrono::steady_clock;

    if (timeout.count() <= 0) {
        throw ConfigError("encode timeout must be > 0 ms");
    }
    if (cancel.cancelled()) {
        throw EncodingUnavailable(what + ": cancelled");
    }

    auto promise = std::make_shared<std::promise<T>>();
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    std::future<T> future = promise->get_future();

    bool queued = workers.try_submit([promise, abandoned, fn = std::move(fn)]() mutable {
        if (abandoned->load()) return;
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        throw EncodingUnavailable(what + ": provider saturated (" +
                                  std::to_string(workers.capacity()) + " calls in flight)");
    }

    const auto deadline = clock::now() + timeout;
    const auto poll = std::chrono::milliseconds(5);
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        if (remaining.count() <= 0) {
            abandoned->store(true);
            throw EncodingUnavailable(what + ": timed out after " +
                                      std::to_string(timeout.count()) + " ms");
        }
        if (future.wait_for(std::min(remaining, poll)) == std::future_status::ready) {
            break;
        }
        if (cancel.cancelled()) {
            abandoned->store(true);
            throw EncodingUnavailable(what + ": cancelled");
        }
    }

    try {
        return future.get();
    } catch (const EncodingUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw EncodingUnavailable(what + ": " + e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// HashingEmbeddingProvider: signed feature hashing, no model files
// ═══════════════════════════════════════════════════════════════════════════

struct HashingConfig {
    size_t dimension = DEFAULT_EMBED_DIM;
    bool skip_stop_words = true;
};

// Tokens: lowercase ASCII alphanumeric runs; every non-ASCII code point is its
// own token (CJK text has no spaces). Each token adds ±1 at a hashed slot,
// sign taken from the hash's top bit, so collisions cancel in expectation.
// Output is L2-normalized. Text with no tokens encodes to the zero vector.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(HashingConfig config = {}) : config_(config) {
        if (config_.dimension == 0) {
            throw ConfigError("hashing provider dimension must be > 0");
        }
    }

    DenseVector encode(const std::string& text) override {
        std::vector<float> vec(config_.dimension, 0.0f);
        for (const auto& token : tokenize(text)) {
            if (config_.skip_stop_words && is_stop_word(token)) continue;
            uint64_t h = fnv1a64(token);
            size_t slot = static_cast<size_t>(h % config_.dimension);
            vec[slot] += (h >> 63) ? -1.0f : 1.0f;
        }
        DenseVector out(std::move(vec));
        out.normalize();
        return out;
    }

    size_t dimension() const override { return config_.dimension; }

    std::string model_id() const override {
        return "hashing-v1/" + std::to_string(config_.dimension);
    }

    static std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> tokens;
        std::string current;

        for (size_t i = 0; i < text.size();) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                if (std::isalnum(c)) {
                    current += static_cast<char>(std::tolower(c));
                } else if (!current.empty()) {
                    tokens.push_back(std::move(current));
                    current.clear();
                }
                i++;
            } else {
                // UTF-8 multi-byte: one token per code point
                size_t len = 1;
                if ((c & 0xE0) == 0xC0) len = 2;
                else if ((c & 0xF0) == 0xE0) len = 3;
                else if ((c & 0xF8) == 0xF0) len = 4;
                if (i + len > text.size()) len = text.size() - i;

                if (!current.empty()) {
                    tokens.push_back(std::move(current));
                    current.clear();
                }
                tokens.push_back(text.substr(i, len));
                i += len;
            }
        }
        if (!current.empty()) tokens.push_back(std::move(current));
        return tokens;
    }

    static bool is_stop_word(const std::string& token) {
        static const std::unordered_set<std::string> stop_words = {
            "a", "an", "and", "are", "as", "at", "be", "but", "by", "for",
            "from", "has", "have", "i", "in", "is", "it", "its", "me", "my",
            "of", "on", "or", "our", "so", "that", "the", "their", "this",
            "to", "we", "who", "with", "you", "your",
        };
        return stop_words.count(token) > 0;
    }

private:
    HashingConfig config_;
};

// ═══════════════════════════════════════════════════════════════════════════
// CachingEmbeddingProvider: LRU over successful encodings
// ═══════════════════════════════════════════════════════════════════════════

// Wraps any provider. Only successful results are remembered; a failure
// propagates and leaves the cache untouched.
class CachingEmbeddingProvider : public EmbeddingProvider {
public:
    CachingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner, size_t capacity = 10000)
        : inner_(std::move(inner)), capacity_(capacity) {
        if (!inner_) throw ConfigError("caching provider needs an inner provider");
        if (capacity_ == 0) throw ConfigError("cache capacity must be > 0");
    }

    DenseVector encode(const std::string& text) override {
        DenseVector cached;
        if (recall(text, cached)) {
            return cached;
        }
        DenseVector v = inner_->encode(text);
        remember(text, v);
        return v;
    }

    std::vector<DenseVector> batch_encode(const std::vector<std::string>& texts) override {
        std::vector<DenseVector> results(texts.size());
        std::vector<std::string> to_compute;
        std::vector<size_t> compute_indices;

        for (size_t i = 0; i < texts.size(); ++i) {
            if (!recall(texts[i], results[i])) {
                to_compute.push_back(texts[i]);
                compute_indices.push_back(i);
            }
        }

        if (!to_compute.empty()) {
            auto computed = inner_->batch_encode(to_compute);
            if (computed.size() != to_compute.size()) {
                throw EncodingUnavailable("provider returned " + std::to_string(computed.size()) +
                                          " vectors for " + std::to_string(to_compute.size()) +
                                          " texts");
            }
            for (size_t i = 0; i < computed.size(); ++i) {
                remember(to_compute[i], computed[i]);
                results[compute_indices[i]] = std::move(computed[i]);
            }
        }
        return results;
    }

    size_t dimension() const override { return inner_->dimension(); }
    std::string model_id() const override { return inner_->model_id(); }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    uint64_t hits() const { return hits_.load(); }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        order_.clear();
    }

private:
    struct Entry {
        DenseVector vector;
        std::list<std::string>::iterator position;
    };

    bool recall(const std::string& text, DenseVector& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(text);
        if (it == entries_.end()) return false;
        order_.splice(order_.begin(), order_, it->second.position);
        out = it->second.vector;
        hits_++;
        return true;
    }

    void remember(const std::string& text, const DenseVector& v) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(text);
        if (it != entries_.end()) {
            order_.splice(order_.begin(), order_, it->second.position);
            it->second.vector = v;
            return;
        }
        // Evict least recently used
        if (entries_.size() >= capacity_ && !order_.empty()) {
            entries_.erase(order_.back());
            order_.pop_back();
        }
        order_.push_front(text);
        entries_.emplace(text, Entry{v, order_.begin()});
    }

    std::shared_ptr<EmbeddingProvider> inner_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::list<std::string> order_;  // front = most recent
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<uint64_t> hits_{0};
};

} // namespace resonance
