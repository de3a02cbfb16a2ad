#pragma once
// OnnxEmbeddingProvider: sentence-transformer inference through ONNX Runtime
//
// Pipeline per batch:
// - whitespace/control normalization
// - WordPiece tokenization ([CLS] ... [SEP], truncated to max_seq_length)
// - padding to the longest sequence in the batch
// - mean pooling weighted by the attention mask (or [CLS] pooling)
// - L2 normalization
//
// The output length is the model's hidden size, reported by dimension(). It is
// never truncated or padded; the engine rejects a model whose hidden size does
// not match the projection.
//
// Only compiled with RESONANCE_WITH_ONNX.

#ifdef RESONANCE_WITH_ONNX

#include "embedding.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"

#include <onnxruntime/core/session/onnxruntime_cxx_api.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace resonance {

enum class PoolingStrategy {
    Mean,   // Mean of token embeddings, weighted by attention mask
    CLS,    // First token
};

// Strip control characters, collapse whitespace, trim
inline std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool last_space = true;
    for (unsigned char c : text) {
        if (c < 0x80 && (std::isspace(c) || c < 0x20)) {
            if (!last_space) {
                out += ' ';
                last_space = true;
            }
            continue;
        }
        out += static_cast<char>(c);
        last_space = false;
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

class WordPieceTokenizer {
public:
    struct Encoding {
        std::vector<int64_t> input_ids;   // unpadded, with [CLS]/[SEP]
    };

    // Throws EncodingUnavailable on unreadable vocab or missing [UNK]
    void load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) throw EncodingUnavailable("cannot read vocabulary " + vocab_path);

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            // Ids are line numbers; blank lines still consume one
            if (!line.empty()) vocab_[line] = id;
            id++;
        }

        cls_id_ = get_id("[CLS]");
        sep_id_ = get_id("[SEP]");
        pad_id_ = std::max<int64_t>(get_id("[PAD]"), 0);
        unk_id_ = get_id("[UNK]");
        if (unk_id_ < 0) {
            throw EncodingUnavailable("vocabulary " + vocab_path + " has no [UNK] token");
        }
    }

    Encoding encode(const std::string& text, size_t max_length) const {
        Encoding enc;
        const size_t budget = max_length > 2 ? max_length - 2 : 0;
        std::vector<int64_t> body;
        for (const auto& word : split_words(text)) {
            for (int64_t tok : tokenize_word(word)) {
                if (body.size() >= budget) break;
                body.push_back(tok);
            }
            if (body.size() >= budget) break;
        }
        if (cls_id_ >= 0) enc.input_ids.push_back(cls_id_);
        enc.input_ids.insert(enc.input_ids.end(), body.begin(), body.end());
        if (sep_id_ >= 0) enc.input_ids.push_back(sep_id_);
        return enc;
    }

    int64_t get_id(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    int64_t pad_id() const { return pad_id_; }
    size_t vocab_size() const { return vocab_.size(); }

private:
    // Lowercased ASCII words, punctuation and each non-ASCII code point split off
    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        auto flush = [&]() {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        };

        for (size_t i = 0; i < text.size();) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                if (std::isspace(c)) {
                    flush();
                } else if (std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
                i++;
            } else {
                size_t len = 1;
                if ((c & 0xE0) == 0xC0) len = 2;
                else if ((c & 0xF0) == 0xE0) len = 3;
                else if ((c & 0xF8) == 0xF0) len = 4;
                if (i + len > text.size()) len = text.size() - i;
                flush();
                words.push_back(text.substr(i, len));
                i += len;
            }
        }
        flush();
        return words;
    }

    // Greedy longest-match-first
    std::vector<int64_t> tokenize_word(const std::string& word) const {
        std::vector<int64_t> tokens;
        if (word.empty()) return tokens;

        auto whole = vocab_.find(word);
        if (whole != vocab_.end()) {
            tokens.push_back(whole->second);
            return tokens;
        }

        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t cur_id = -1;
            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) piece = "##" + piece;
                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    cur_id = it->second;
                    break;
                }
                end--;
            }
            if (cur_id < 0) {
                // Whole word is unknown
                return {unk_id_};
            }
            tokens.push_back(cur_id);
            start = end;
        }
        return tokens;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

struct OnnxConfig {
    PoolingStrategy pooling = PoolingStrategy::Mean;
    size_t max_seq_length = 128;
    size_t batch_size = 32;
    int num_threads = 0;   // 0 = runtime default
};

class OnnxEmbeddingProvider : public EmbeddingProvider {
public:
    // Throws EncodingUnavailable if the model or vocabulary cannot be loaded
    OnnxEmbeddingProvider(const std::string& model_path, const std::string& vocab_path,
                          OnnxConfig config = {})
        : env_(ORT_LOGGING_LEVEL_WARNING, "resonance"), config_(config), model_path_(model_path)
    {
        if (config_.batch_size == 0) throw ConfigError("onnx batch_size must be > 0");
        if (config_.max_seq_length < 2) throw ConfigError("onnx max_seq_length must be >= 2");

        tokenizer_.load(vocab_path);
        try {
            Ort::SessionOptions opts;
            if (config_.num_threads > 0) opts.SetIntraOpNumThreads(config_.num_threads);
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);
            introspect();
        } catch (const Ort::Exception& e) {
            throw EncodingUnavailable("onnx model " + model_path + ": " + e.what());
        }
        log::info("onnx", "loaded %s (hidden %zu, vocab %zu)", model_path.c_str(),
                  hidden_dim_, tokenizer_.vocab_size());
    }

    DenseVector encode(const std::string& text) override {
        return batch_encode({text}).front();
    }

    std::vector<DenseVector> batch_encode(const std::vector<std::string>& texts) override {
        std::vector<DenseVector> results;
        results.reserve(texts.size());
        for (size_t begin = 0; begin < texts.size(); begin += config_.batch_size) {
            size_t end = std::min(texts.size(), begin + config_.batch_size);
            std::vector<std::string> chunk(texts.begin() + begin, texts.begin() + end);
            try {
                auto part = run(chunk);
                for (auto& v : part) results.push_back(std::move(v));
            } catch (const Ort::Exception& e) {
                throw EncodingUnavailable(std::string("onnx inference: ") + e.what());
            }
        }
        return results;
    }

    size_t dimension() const override { return hidden_dim_; }

    std::string model_id() const override {
        auto slash = model_path_.find_last_of('/');
        std::string name = slash == std::string::npos ? model_path_ : model_path_.substr(slash + 1);
        return "onnx:" + name + "/" + std::to_string(hidden_dim_);
    }

private:
    void introspect() {
        Ort::AllocatorWithDefaultOptions allocator;

        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            output_names_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
        }
        if (output_names_.empty()) {
            throw EncodingUnavailable("onnx model has no outputs");
        }

        auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() == 2) {
            pooled_output_ = true;
            if (shape[1] > 0) hidden_dim_ = static_cast<size_t>(shape[1]);
        } else if (shape.size() == 3) {
            if (shape[2] > 0) hidden_dim_ = static_cast<size_t>(shape[2]);
        }
        if (hidden_dim_ == 0) {
            throw EncodingUnavailable("onnx model output has no static hidden size");
        }

        for (const auto& n : input_names_) input_cstr_.push_back(n.c_str());
        for (const auto& n : output_names_) output_cstr_.push_back(n.c_str());
    }

    std::vector<DenseVector> run(const std::vector<std::string>& texts) {
        const size_t batch = texts.size();
        std::vector<WordPieceTokenizer::Encoding> encodings;
        encodings.reserve(batch);
        size_t seq_len = 1;
        for (const auto& t : texts) {
            encodings.push_back(tokenizer_.encode(normalize_text(t), config_.max_seq_length));
            seq_len = std::max(seq_len, encodings.back().input_ids.size());
        }

        std::vector<int64_t> ids(batch * seq_len, tokenizer_.pad_id());
        std::vector<int64_t> mask(batch * seq_len, 0);
        std::vector<int64_t> types(batch * seq_len, 0);
        for (size_t b = 0; b < batch; ++b) {
            const auto& in = encodings[b].input_ids;
            for (size_t t = 0; t < in.size(); ++t) {
                ids[b * seq_len + t] = in[t];
                mask[b * seq_len + t] = 1;
            }
        }

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};

        std::vector<Ort::Value> inputs;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") source = &ids;
            else if (name == "attention_mask") source = &mask;
            else if (name == "token_type_ids") source = &types;
            else throw EncodingUnavailable("onnx model expects unknown input '" + name + "'");
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, source->data(), source->size(), shape.data(), shape.size()));
        }

        std::vector<Ort::Value> outputs;
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            outputs = session_->Run(Ort::RunOptions{nullptr},
                                    input_cstr_.data(), inputs.data(), inputs.size(),
                                    output_cstr_.data(), output_cstr_.size());
        }

        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const size_t hidden = static_cast<size_t>(out_shape.back());
        if (hidden != hidden_dim_) {
            throw DimensionMismatch("onnx output hidden size", hidden_dim_, hidden);
        }

        std::vector<DenseVector> results;
        results.reserve(batch);
        for (size_t b = 0; b < batch; ++b) {
            std::vector<float> v(hidden, 0.0f);
            if (pooled_output_ || out_shape.size() == 2) {
                std::copy(data + b * hidden, data + (b + 1) * hidden, v.begin());
            } else {
                const size_t out_seq = static_cast<size_t>(out_shape[1]);
                const float* tokens = data + b * out_seq * hidden;
                if (config_.pooling == PoolingStrategy::CLS) {
                    std::copy(tokens, tokens + hidden, v.begin());
                } else {
                    float weight = 0.0f;
                    for (size_t t = 0; t < out_seq && t < seq_len; ++t) {
                        if (mask[b * seq_len + t] == 0) continue;
                        weight += 1.0f;
                        for (size_t d = 0; d < hidden; ++d) v[d] += tokens[t * hidden + d];
                    }
                    if (weight > 0.0f) {
                        for (float& x : v) x /= weight;
                    }
                }
            }
            DenseVector dv(std::move(v));
            dv.normalize();
            results.push_back(std::move(dv));
        }
        return results;
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    std::mutex run_mutex_;
    WordPieceTokenizer tokenizer_;
    OnnxConfig config_;
    std::string model_path_;
    size_t hidden_dim_ = 0;
    bool pooled_output_ = false;

    // Ort needs stable C strings
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_cstr_;
    std::vector<const char*> output_cstr_;
};

// ONNX provider behind an LRU cache
inline std::shared_ptr<EmbeddingProvider> create_onnx_provider(
    const std::string& model_path, const std::string& vocab_path,
    size_t cache_size = 10000, OnnxConfig config = {})
{
    auto inner = std::make_shared<OnnxEmbeddingProvider>(model_path, vocab_path, config);
    return std::make_shared<CachingEmbeddingProvider>(inner, cache_size);
}

} // namespace resonance

#endif // RESONANCE_WITH_ONNX
