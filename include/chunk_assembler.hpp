#pragma once

#include "chunk_config.hpp"
#include "chunk_pool.hpp"
#include "crypto_oracle.hpp"
#include "part_requester.hpp"
#include "part_transport.hpp"
#include "peer_selector.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

enum class HeaderOutcome {
    Registered,
    AlreadyKnown,
    HeaderConflict,
    InvalidSignature,
    Malformed,
    Stale
};

const char* header_outcome_name(HeaderOutcome o);

using ChunkReadyCallback = std::function<void(Chunk)>;
using CompletionCallback = std::function<void(const ChunkId&, const ChunkStatus&)>;

// Who receives what when this node produced the chunk
struct DistributionPlan {
    PartCandidatesFn part_owners;                              // owners of each part
    std::function<std::vector<PeerId>(ShardId)> receipt_recipients;  // trackers of a destination shard
};

// Entry point for the rest of the node: feeds headers, parts, receipt proofs
// and clock ticks into the pool and the requester, and hands every
// reconstructed chunk to the ready callback exactly once.
class ChunkAssembler {
public:
    ChunkAssembler(AssemblerConfig config,
                   CryptoOracle& crypto,
                   BlockOracle& blocks,
                   PartTransport& transport,
                   PeerSelector& selector,
                   ChunkReadyCallback on_ready);

    HeaderOutcome on_header_seen(const ChunkHeader& header);
    // `now` is the arrival time; it feeds the per-peer RTT samples
    PartOutcome on_part_received(const PeerId& from, const ChunkId& id, const ChunkPart& part, TimePoint now);
    ReceiptOutcome on_receipt_proof_received(const ChunkId& id, const ReceiptProof& proof);
    void on_part_request(const PeerId& from, const ChunkId& id, PartIndex index);

    // New head height; entries below head - retention_window go on the next tick
    void on_head_advanced(BlockHeight height);

    // Drive retries, request new parts, evict stale chunks
    void on_tick(TimePoint now);

    // Producer side: register our own chunk and push parts and receipt proofs out
    HeaderOutcome distribute_chunk(const EncodedChunk& chunk, const DistributionPlan& plan);

    // Callback fires once when the chunk completes or fails terminally
    void subscribe(const ChunkId& id, CompletionCallback callback);

    bool is_complete(const ChunkId& id) const;
    ChunkStatus status(const ChunkId& id) const;

    const ChunkPool& pool() const { return pool_; }
    const PartRequester& requester() const { return requester_; }
    size_t forwarded_parts() const;

private:
    void deliver_if_ready(const ChunkId& id);
    void notify(const ChunkId& id, const ChunkStatus& status);
    void apply_forwarded(const ChunkId& id);
    void dispatch(const std::vector<PartRequest>& requests);
    BlockHeight floor_for(BlockHeight head) const;

    AssemblerConfig config_;
    CryptoOracle& crypto_;
    BlockOracle& blocks_;
    PartTransport& transport_;
    ChunkPool pool_;
    PartRequester requester_;
    ChunkReadyCallback on_ready_;

    mutable std::mutex mutex_;
    BlockHeight head_ = 0;
    std::set<ChunkId> trusted_;      // header belongs to a valid block
    std::set<ChunkId> completed_;    // delivered, until evicted
    std::map<ChunkId, FailureReason> failed_;
    std::map<ChunkId, std::vector<CompletionCallback>> waiters_;
    std::map<ChunkId, std::vector<ChunkPart>> forwarded_;
    size_t forwarded_count_ = 0;
};
