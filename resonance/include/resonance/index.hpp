#pragma once
// Resonance index: entity id → packed hypervector, copy-on-write snapshots
//
// Storage is an arena of fixed-size slot blocks. Each block holds up to
// block_slots entities as contiguous words, so a scan is a linear walk over a
// few large buffers. An id → slot map gives O(1) lookup.
//
// Readers take a snapshot (an immutable IndexView) and never lock. Writers are
// serialized by one timed mutex; a write clones only the blocks it touches
// (and the id map when ids change), then publishes the new view with an atomic
// pointer swap. A reader holding an old view keeps seeing it unchanged.
//
// Removal moves the last slot into the hole so the arena stays dense.

#include "hypervector.hpp"
#include "log.hpp"
#include "types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace resonance {

struct IndexConfig {
    size_t block_slots = 1024;                       // entities per arena block
    std::chrono::milliseconds write_timeout{1000};   // writer lock wait
};

struct SlotBlock {
    std::vector<EntityId> ids;
    std::vector<uint64_t> words;   // ids.size() * words_per_vector
};

using SlotMap = std::unordered_map<EntityId, size_t>;

// ═══════════════════════════════════════════════════════════════════════════
// IndexView: one published, immutable state of the index
// ═══════════════════════════════════════════════════════════════════════════

class IndexView {
public:
    IndexView(size_t bits, uint64_t fingerprint, size_t block_slots)
        : bits_(bits), words_(Hypervector::words_for(bits)),
          fingerprint_(fingerprint), block_slots_(block_slots),
          slots_(std::make_shared<const SlotMap>()) {}

    size_t bits() const { return bits_; }
    size_t words_per_vector() const { return words_; }
    uint64_t fingerprint() const { return fingerprint_; }
    uint64_t version() const { return version_; }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    bool contains(const EntityId& id) const { return slots_->count(id) > 0; }

    // Copy of the stored hypervector; throws EntityNotFound
    Hypervector get(const EntityId& id) const {
        auto it = slots_->find(id);
        if (it == slots_->end()) throw EntityNotFound(id);
        WordSpan span = words_at(it->second);
        return Hypervector::from_words(
            bits_, fingerprint_, std::vector<uint64_t>(span.data, span.data + span.size));
    }

    // Ids in slot order
    std::vector<EntityId> ids() const {
        std::vector<EntityId> out;
        out.reserve(count_);
        for (const auto& block : blocks_) {
            out.insert(out.end(), block->ids.begin(), block->ids.end());
        }
        return out;
    }

    const EntityId& id_at(size_t slot) const {
        return blocks_[slot / block_slots_]->ids[slot % block_slots_];
    }

    WordSpan words_at(size_t slot) const {
        const SlotBlock& block = *blocks_[slot / block_slots_];
        return {block.words.data() + (slot % block_slots_) * words_, words_};
    }

    // fn(const EntityId&, WordSpan) for slots [begin, end)
    template <typename Fn>
    void for_each(size_t begin, size_t end, Fn&& fn) const {
        if (end > count_) end = count_;
        for (size_t slot = begin; slot < end;) {
            const SlotBlock& block = *blocks_[slot / block_slots_];
            size_t offset = slot % block_slots_;
            size_t stop = std::min(block.ids.size(), offset + (end - slot));
            for (size_t i = offset; i < stop; ++i, ++slot) {
                fn(block.ids[i], WordSpan{block.words.data() + i * words_, words_});
            }
        }
    }

    // Bytes held by packed words (ids and map excluded)
    size_t memory_bytes() const { return count_ * words_ * sizeof(uint64_t); }

private:
    friend class IndexDraft;

    size_t bits_;
    size_t words_;
    uint64_t fingerprint_;
    size_t block_slots_;
    uint64_t version_ = 0;
    size_t count_ = 0;
    std::vector<std::shared_ptr<const SlotBlock>> blocks_;
    std::shared_ptr<const SlotMap> slots_;
};

using IndexSnapshot = std::shared_ptr<const IndexView>;

// ═══════════════════════════════════════════════════════════════════════════
// WriteBatch: several writes published as one view
// ═══════════════════════════════════════════════════════════════════════════

class WriteBatch {
public:
    enum class Op { Insert, Update, Upsert, Remove };

    struct Entry {
        Op op;
        EntityId id;
        Hypervector hv;
    };

    WriteBatch& insert(EntityId id, Hypervector hv) {
        entries_.push_back({Op::Insert, std::move(id), std::move(hv)});
        return *this;
    }
    WriteBatch& update(EntityId id, Hypervector hv) {
        entries_.push_back({Op::Update, std::move(id), std::move(hv)});
        return *this;
    }
    WriteBatch& upsert(EntityId id, Hypervector hv) {
        entries_.push_back({Op::Upsert, std::move(id), std::move(hv)});
        return *this;
    }
    WriteBatch& remove(EntityId id) {
        entries_.push_back({Op::Remove, std::move(id), Hypervector()});
        return *this;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

// Private working copy of a view; published or discarded as a whole
class IndexDraft {
public:
    explicit IndexDraft(const IndexView& base)
        : base_(base), blocks_(base.blocks_), owned_(base.blocks_.size()),
          count_(base.count_) {}

    size_t size() const { return count_; }
    bool contains(const EntityId& id) const { return slots().count(id) > 0; }

    void insert(const EntityId& id, const Hypervector& hv) {
        check(hv);
        if (slots().count(id)) throw DuplicateEntity(id);
        append(id, hv);
    }

    void update(const EntityId& id, const Hypervector& hv) {
        check(hv);
        size_t slot = find(id);
        write_words(slot, hv);
    }

    bool upsert(const EntityId& id, const Hypervector& hv) {
        check(hv);
        auto it = slots().find(id);
        if (it == slots().end()) {
            append(id, hv);
            return true;
        }
        write_words(it->second, hv);
        return false;
    }

    void remove(const EntityId& id) {
        size_t slot = find(id);
        size_t last = count_ - 1;
        const size_t per = base_.block_slots_;
        const size_t words = base_.words_;

        if (slot != last) {
            // Move the last entity into the hole
            const SlotBlock& src = *blocks_[last / per];
            EntityId moved = src.ids[last % per];
            const uint64_t* from = src.words.data() + (last % per) * words;

            SlotBlock& dst = mutable_block(slot / per);
            std::copy(from, from + words, dst.words.begin() + (slot % per) * words);
            dst.ids[slot % per] = moved;
            mutable_slots()[moved] = slot;
        }

        SlotBlock& tail = mutable_block(last / per);
        tail.ids.pop_back();
        tail.words.resize(tail.words.size() - words);
        if (tail.ids.empty()) {
            blocks_.pop_back();
            owned_.pop_back();
        }
        mutable_slots().erase(id);
        count_--;
    }

    std::shared_ptr<const IndexView> publish() {
        auto view = std::make_shared<IndexView>(base_.bits_, base_.fingerprint_,
                                                base_.block_slots_);
        view->version_ = base_.version_ + 1;
        view->count_ = count_;
        view->blocks_ = std::move(blocks_);
        view->slots_ = map_ ? std::shared_ptr<const SlotMap>(std::move(map_)) : base_.slots_;
        return view;
    }

private:
    void check(const Hypervector& hv) const {
        hv.check_compatible(base_.bits_, base_.fingerprint_);
    }

    const SlotMap& slots() const { return map_ ? *map_ : *base_.slots_; }

    SlotMap& mutable_slots() {
        if (!map_) map_ = std::make_shared<SlotMap>(*base_.slots_);
        return *map_;
    }

    SlotBlock& mutable_block(size_t b) {
        if (!owned_[b]) {
            owned_[b] = std::make_shared<SlotBlock>(*blocks_[b]);
            blocks_[b] = owned_[b];
        }
        return *owned_[b];
    }

    size_t find(const EntityId& id) const {
        auto it = slots().find(id);
        if (it == slots().end()) throw EntityNotFound(id);
        return it->second;
    }

    void append(const EntityId& id, const Hypervector& hv) {
        const size_t per = base_.block_slots_;
        size_t slot = count_;
        if (slot / per == blocks_.size()) {
            auto fresh = std::make_shared<SlotBlock>();
            fresh->ids.reserve(per);
            fresh->words.reserve(per * base_.words_);
            blocks_.push_back(fresh);
            owned_.push_back(fresh);
        }
        SlotBlock& block = mutable_block(slot / per);
        block.ids.push_back(id);
        block.words.insert(block.words.end(), hv.words().begin(), hv.words().end());
        mutable_slots()[id] = slot;
        count_++;
    }

    void write_words(size_t slot, const Hypervector& hv) {
        const size_t per = base_.block_slots_;
        SlotBlock& block = mutable_block(slot / per);
        std::copy(hv.words().begin(), hv.words().end(),
                  block.words.begin() + (slot % per) * base_.words_);
    }

    const IndexView& base_;
    std::vector<std::shared_ptr<const SlotBlock>> blocks_;
    std::vector<std::shared_ptr<SlotBlock>> owned_;   // blocks cloned by this draft
    std::shared_ptr<SlotMap> map_;                    // null until ids change
    size_t count_;
};

// ═══════════════════════════════════════════════════════════════════════════
// ResonanceIndex: single writer, lock-free readers
// ═══════════════════════════════════════════════════════════════════════════

class ResonanceIndex {
public:
    ResonanceIndex(size_t bits, uint64_t fingerprint, IndexConfig config = {})
        : config_(config)
    {
        if (bits == 0) throw ConfigError("index width must be > 0");
        if (config_.block_slots == 0) throw ConfigError("block_slots must be > 0");
        if (config_.write_timeout.count() <= 0) throw ConfigError("write_timeout must be > 0 ms");
        current_ = std::make_shared<const IndexView>(bits, fingerprint, config_.block_slots);
    }

    ResonanceIndex(const ResonanceIndex&) = delete;
    ResonanceIndex& operator=(const ResonanceIndex&) = delete;

    IndexSnapshot snapshot() const { return std::atomic_load(&current_); }

    size_t bits() const { return snapshot()->bits(); }
    uint64_t fingerprint() const { return snapshot()->fingerprint(); }
    size_t size() const { return snapshot()->size(); }
    bool contains(const EntityId& id) const { return snapshot()->contains(id); }
    const IndexConfig& config() const { return config_; }

    // Throws DuplicateEntity if id is already present
    void insert(const EntityId& id, const Hypervector& hv) {
        transact([&](IndexDraft& d) { d.insert(id, hv); });
    }

    // Throws EntityNotFound if id is absent
    void update(const EntityId& id, const Hypervector& hv) {
        transact([&](IndexDraft& d) { d.update(id, hv); });
    }

    // Insert or replace; returns true if the id was new
    bool upsert(const EntityId& id, const Hypervector& hv) {
        bool inserted = false;
        transact([&](IndexDraft& d) { inserted = d.upsert(id, hv); });
        return inserted;
    }

    // Throws EntityNotFound if id is absent
    void remove(const EntityId& id) {
        transact([&](IndexDraft& d) { d.remove(id); });
    }

    // All entries or none: any failure discards the whole batch
    void apply(const WriteBatch& batch) {
        if (batch.empty()) return;
        transact([&](IndexDraft& d) {
            for (const auto& e : batch.entries()) {
                switch (e.op) {
                    case WriteBatch::Op::Insert: d.insert(e.id, e.hv); break;
                    case WriteBatch::Op::Update: d.update(e.id, e.hv); break;
                    case WriteBatch::Op::Upsert: d.upsert(e.id, e.hv); break;
                    case WriteBatch::Op::Remove: d.remove(e.id); break;
                }
            }
        });
        log::debug("index", "applied batch of %zu writes", batch.size());
    }

    // Run fn(IndexDraft&) as one write. Everything it changes is published
    // together; if it throws, nothing is.
    template <typename Fn>
    void transact(Fn&& fn) {
        std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
        if (!lock.try_lock_for(config_.write_timeout)) {
            throw IndexWriteConflict("writer lock not acquired within " +
                                     std::to_string(config_.write_timeout.count()) + " ms");
        }
        IndexSnapshot base = std::atomic_load(&current_);
        IndexDraft draft(*base);
        fn(draft);
        std::atomic_store(&current_, draft.publish());
    }

private:
    IndexConfig config_;
    std::timed_mutex write_mutex_;
    std::shared_ptr<const IndexView> current_;
};

} // namespace resonance
