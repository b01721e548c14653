#pragma once

#include "chunk_types.hpp"
#include "crypto_oracle.hpp"
#include "erasure_coder.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

enum class ObserveOutcome {
    Registered,      // new tracking entry
    AlreadyKnown,    // identical header already registered
    HeaderConflict,  // different header for the same (height, shard)
    Malformed,       // D = 0, N > 256, N < D or shard count mismatch
    Stale            // below the eviction floor; nothing stored
};

enum class PartOutcome {
    Accepted,
    Duplicate,             // same index, same payload
    InvalidProof,          // proof does not verify or index out of range
    UnknownChunk,          // no entry (never seen, evicted or hash mismatch)
    ConflictingDuplicate,  // proof verifies but payload differs from the held part
    ChunkClosed            // chunk failed validation; nothing more is admitted
};

enum class ReceiptOutcome {
    Accepted,
    Duplicate,
    InvalidProof,
    UnknownChunk
};

enum class FailureReason {
    None,
    RootMismatch,           // reconstructed parts do not commit to encoded_merkle_root
    ReceiptsRootMismatch,   // decoded receipts disagree with receipts_roots
    MalformedPayload,       // decoded bytes do not parse
    RetriesExhausted,       // every obtainable part abandoned, below threshold
    EvictedBeforeComplete
};

struct ChunkStatus {
    enum class Kind { Unknown, InProgress, Complete, Failed };

    Kind kind = Kind::Unknown;
    uint32_t valid_count = 0;    // InProgress: held valid parts
    uint32_t missing_count = 0;  // InProgress: parts still needed to reach D
    FailureReason reason = FailureReason::None;
};

const char* observe_outcome_name(ObserveOutcome o);
const char* part_outcome_name(PartOutcome o);
const char* receipt_outcome_name(ReceiptOutcome o);
const char* failure_reason_name(FailureReason r);

struct ObserveResult {
    ObserveOutcome outcome;
    ChunkId id;
};

struct EvictedChunk {
    ChunkId id;
    bool completed;
};

// In-memory index of every in-flight chunk. The index itself is guarded by a
// shared mutex (exclusive for insert/evict); each entry carries its own mutex
// so different chunks progress in parallel.
class ChunkPool {
public:
    explicit ChunkPool(CryptoOracle& crypto);

    ObserveResult observe_header(const ChunkHeader& header);

    PartOutcome add_part(const ChunkId& id, const ChunkPart& part);
    ReceiptOutcome add_receipt_proof(const ChunkId& id, const ReceiptProof& proof);

    // Indices neither held nor currently requested
    std::set<PartIndex> missing_parts(const ChunkId& id) const;

    // Request bookkeeping driven by the part requester
    void mark_requested(const ChunkId& id, PartIndex index);
    void mark_abandoned(const ChunkId& id, PartIndex index);

    // Returns the reconstructed chunk once; afterwards std::nullopt
    std::optional<Chunk> take_reconstructed(const ChunkId& id);

    // Drop every entry with height < floor, complete or not
    std::vector<EvictedChunk> evict_below(BlockHeight floor);

    ChunkStatus status(const ChunkId& id) const;
    bool contains(const ChunkId& id) const;
    std::optional<ChunkHeader> header(const ChunkId& id) const;
    std::optional<ChunkPart> held_part(const ChunkId& id, PartIndex index) const;
    std::optional<ReceiptProof> receipt_proof(const ChunkId& id, ShardId destination) const;
    uint32_t held_count(const ChunkId& id) const;

    // Ids of entries still collecting parts
    std::vector<ChunkId> open_chunks() const;

    BlockHeight eviction_floor() const;
    size_t size() const;

private:
    enum class EntryState { Collecting, Reconstructed, Delivered, Failed };

    struct PartialChunkState {
        ChunkHeader header;
        ChunkId id;
        std::map<PartIndex, ChunkPart> parts;
        std::set<PartIndex> requested;
        std::set<PartIndex> known_missing;
        std::map<ShardId, ReceiptProof> receipt_proofs;
        std::optional<Chunk> reconstructed;
        EntryState state = EntryState::Collecting;
        FailureReason failure = FailureReason::None;
        bool reconstruction_attempted = false;
        bool evicted = false;
        mutable std::mutex mutex;
    };

    using Key = std::pair<BlockHeight, ShardId>;
    using EntryPtr = std::shared_ptr<PartialChunkState>;

    EntryPtr find(const ChunkId& id) const;
    std::shared_ptr<const ErasureCoder> coder_for(uint32_t data_parts, uint32_t parity_parts);
    void try_reconstruct(PartialChunkState& entry);
    ChunkStatus status_locked(const PartialChunkState& entry) const;

    CryptoOracle& crypto_;

    mutable std::shared_mutex index_mutex_;
    std::map<Key, EntryPtr> entries_;
    BlockHeight eviction_floor_ = 0;

    std::mutex coders_mutex_;
    std::map<std::pair<uint32_t, uint32_t>, std::shared_ptr<const ErasureCoder>> coders_;
};
