#include "chunk_assembler.hpp"
#include <iostream>
#include <utility>

const char* header_outcome_name(HeaderOutcome o) {
    switch (o) {
        case HeaderOutcome::Registered: return "Registered";
        case HeaderOutcome::AlreadyKnown: return "AlreadyKnown";
        case HeaderOutcome::HeaderConflict: return "HeaderConflict";
        case HeaderOutcome::InvalidSignature: return "InvalidSignature";
        case HeaderOutcome::Malformed: return "Malformed";
        case HeaderOutcome::Stale: return "Stale";
        default: return "Unknown";
    }
}

ChunkAssembler::ChunkAssembler(AssemblerConfig config,
                               CryptoOracle& crypto,
                               BlockOracle& blocks,
                               PartTransport& transport,
                               PeerSelector& selector,
                               ChunkReadyCallback on_ready)
    : config_(std::move(config)),
      crypto_(crypto),
      blocks_(blocks),
      transport_(transport),
      pool_(crypto),
      requester_(selector, config_.request_policy),
      on_ready_(std::move(on_ready)) {}

BlockHeight ChunkAssembler::floor_for(BlockHeight head) const {
    return head > config_.retention_window ? head - config_.retention_window : 0;
}

HeaderOutcome ChunkAssembler::on_header_seen(const ChunkHeader& header) {
    if (!crypto_.verify_signature(header)) {
        std::cerr << "[ASSEMBLER] Rejected header with bad signature for shard " << header.shard_id
                  << " at height " << header.height << std::endl;
        return HeaderOutcome::InvalidSignature;
    }

    ObserveResult result = pool_.observe_header(header);
    if (result.outcome != ObserveOutcome::Registered && result.outcome != ObserveOutcome::AlreadyKnown) {
        std::cerr << "[ASSEMBLER] Header for " << to_string(ChunkId::of(header)) << " not registered: "
                  << observe_outcome_name(result.outcome) << std::endl;
    }
    switch (result.outcome) {
        case ObserveOutcome::Registered:
            break;
        case ObserveOutcome::AlreadyKnown:
            return HeaderOutcome::AlreadyKnown;
        case ObserveOutcome::HeaderConflict:
            return HeaderOutcome::HeaderConflict;
        case ObserveOutcome::Malformed:
            return HeaderOutcome::Malformed;
        case ObserveOutcome::Stale:
            return HeaderOutcome::Stale;
    }

    const ChunkId& id = result.id;
    if (blocks_.is_header_for_valid_block(header)) {
        std::lock_guard<std::mutex> lock(mutex_);
        trusted_.insert(id);
    }

    apply_forwarded(id);
    deliver_if_ready(id);
    return HeaderOutcome::Registered;
}

PartOutcome ChunkAssembler::on_part_received(const PeerId& from, const ChunkId& id, const ChunkPart& part,
                                             TimePoint now) {
    PartOutcome outcome = pool_.add_part(id, part);

    switch (outcome) {
        case PartOutcome::Accepted:
        case PartOutcome::Duplicate: {
            requester_.on_response(id, part.part_index, now);
            deliver_if_ready(id);
            break;
        }
        case PartOutcome::UnknownChunk: {
            // Parts may outrun their header; keep them until it shows up, but
            // only for heights the chain can plausibly reach soon
            BlockHeight floor = pool_.eviction_floor();
            std::lock_guard<std::mutex> lock(mutex_);
            if (id.height < floor || id.height > head_ + config_.forward_horizon) break;
            if (forwarded_count_ < config_.max_forwarded_parts && !completed_.count(id) && !failed_.count(id)) {
                forwarded_[id].push_back(part);
                forwarded_count_++;
            }
            break;
        }
        case PartOutcome::InvalidProof:
        case PartOutcome::ConflictingDuplicate:
            std::cerr << "[ASSEMBLER] Byzantine evidence from " << from << ": "
                      << part_outcome_name(outcome) << " for part " << part.part_index << " of "
                      << to_string(id) << std::endl;
            break;
        case PartOutcome::ChunkClosed:
            break;
    }
    return outcome;
}

ReceiptOutcome ChunkAssembler::on_receipt_proof_received(const ChunkId& id, const ReceiptProof& proof) {
    ReceiptOutcome outcome = pool_.add_receipt_proof(id, proof);
    if (outcome == ReceiptOutcome::InvalidProof || outcome == ReceiptOutcome::UnknownChunk) {
        std::cerr << "[ASSEMBLER] Receipt proof for shard " << proof.destination_shard << " of "
                  << to_string(id) << " dropped: " << receipt_outcome_name(outcome) << std::endl;
    }
    return outcome;
}

void ChunkAssembler::on_part_request(const PeerId& from, const ChunkId& id, PartIndex index) {
    auto part = pool_.held_part(id, index);
    if (!part) return;
    transport_.send_part(from, id, *part);
}

void ChunkAssembler::on_head_advanced(BlockHeight height) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (height > head_) head_ = height;
}

void ChunkAssembler::apply_forwarded(const ChunkId& id) {
    std::vector<ChunkPart> parts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = forwarded_.find(id);
        if (it == forwarded_.end()) return;
        parts = std::move(it->second);
        forwarded_count_ -= parts.size();
        forwarded_.erase(it);
    }
    for (const auto& part : parts) pool_.add_part(id, part);
}

void ChunkAssembler::dispatch(const std::vector<PartRequest>& requests) {
    for (const auto& r : requests) {
        pool_.mark_requested(r.chunk_id, r.part_index);
        transport_.request_part(r.peer, r.chunk_id, r.part_index);
    }
}

void ChunkAssembler::deliver_if_ready(const ChunkId& id) {
    std::optional<Chunk> chunk = pool_.take_reconstructed(id);
    std::vector<CompletionCallback> waiters;
    ChunkStatus status;

    if (chunk) {
        requester_.forget(id);
        status.kind = ChunkStatus::Kind::Complete;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.insert(id);
            trusted_.erase(id);
            auto it = waiters_.find(id);
            if (it != waiters_.end()) {
                waiters = std::move(it->second);
                waiters_.erase(it);
            }
        }
        std::cout << "[ASSEMBLER] Delivering " << to_string(id) << " ("
                  << chunk->payload.transactions.size() << " txs)" << std::endl;
        if (on_ready_) on_ready_(std::move(*chunk));
    } else {
        status = pool_.status(id);
        if (status.kind != ChunkStatus::Kind::Failed || status.reason == FailureReason::RetriesExhausted) return;

        requester_.forget(id);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failed_.emplace(id, status.reason).second) return;
        trusted_.erase(id);
        auto it = waiters_.find(id);
        if (it != waiters_.end()) {
            waiters = std::move(it->second);
            waiters_.erase(it);
        }
    }

    for (auto& cb : waiters) cb(id, status);
}

void ChunkAssembler::notify(const ChunkId& id, const ChunkStatus& status) {
    std::vector<CompletionCallback> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) return;
        waiters = std::move(it->second);
        waiters_.erase(it);
    }
    for (auto& cb : waiters) cb(id, status);
}

void ChunkAssembler::on_tick(TimePoint now) {
    BlockHeight floor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        floor = floor_for(head_);
    }

    // Eviction first, so nothing below the floor is requested again
    std::vector<EvictedChunk> evicted = pool_.evict_below(floor);
    requester_.forget_below(floor);

    std::vector<ChunkId> newly_failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : evicted) {
            trusted_.erase(e.id);
            if (!e.completed && !completed_.count(e.id) && failed_.emplace(e.id, FailureReason::EvictedBeforeComplete).second) {
                newly_failed.push_back(e.id);
            }
        }

        for (auto it = forwarded_.begin(); it != forwarded_.end();) {
            if (it->first.height < floor) {
                forwarded_count_ -= it->second.size();
                it = forwarded_.erase(it);
            } else {
                ++it;
            }
        }

        // Outcome records outlive their entries by one more retention window
        BlockHeight record_floor = floor_for(floor);
        for (auto it = completed_.begin(); it != completed_.end() && it->height < record_floor;) it = completed_.erase(it);
        for (auto it = failed_.begin(); it != failed_.end() && it->first.height < record_floor;) it = failed_.erase(it);
    }

    ChunkStatus evicted_status;
    evicted_status.kind = ChunkStatus::Kind::Failed;
    evicted_status.reason = FailureReason::EvictedBeforeComplete;
    for (const auto& id : newly_failed) notify(id, evicted_status);

    RequestPlan plan = requester_.tick(now);
    for (const auto& a : plan.abandoned) pool_.mark_abandoned(a.chunk_id, a.part_index);
    dispatch(plan.requests);

    for (const auto& id : pool_.open_chunks()) {
        bool trusted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            trusted = trusted_.count(id) > 0;
        }
        if (!trusted) {
            auto header = pool_.header(id);
            if (!header || !blocks_.is_header_for_valid_block(*header)) continue;
            std::lock_guard<std::mutex> lock(mutex_);
            trusted_.insert(id);
        }

        dispatch(requester_.request_missing(id, pool_.missing_parts(id), now));
    }
}

HeaderOutcome ChunkAssembler::distribute_chunk(const EncodedChunk& chunk, const DistributionPlan& plan) {
    HeaderOutcome outcome = on_header_seen(chunk.header);
    if (outcome != HeaderOutcome::Registered && outcome != HeaderOutcome::AlreadyKnown) {
        std::cerr << "[ASSEMBLER] Not distributing own chunk: " << header_outcome_name(outcome) << std::endl;
        return outcome;
    }

    ChunkId id = ChunkId::of(chunk.header);
    for (const auto& part : chunk.parts) {
        pool_.add_part(id, part);
        if (!plan.part_owners) continue;
        for (const auto& owner : plan.part_owners(id, part.part_index)) {
            if (owner != config_.self_id) transport_.send_part(owner, id, part);
        }
    }

    for (const auto& proof : chunk.receipt_proofs) {
        pool_.add_receipt_proof(id, proof);
        if (!plan.receipt_recipients) continue;
        for (const auto& peer : plan.receipt_recipients(proof.destination_shard)) {
            if (peer != config_.self_id) transport_.send_receipt_proof(peer, id, proof);
        }
    }

    deliver_if_ready(id);
    return outcome;
}

void ChunkAssembler::subscribe(const ChunkId& id, CompletionCallback callback) {
    ChunkStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_.count(id)) {
            status.kind = ChunkStatus::Kind::Complete;
        } else if (auto it = failed_.find(id); it != failed_.end()) {
            status.kind = ChunkStatus::Kind::Failed;
            status.reason = it->second;
        } else {
            waiters_[id].push_back(std::move(callback));
            return;
        }
    }
    callback(id, status);
}

ChunkStatus ChunkAssembler::status(const ChunkId& id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_.count(id)) {
            ChunkStatus s;
            s.kind = ChunkStatus::Kind::Complete;
            return s;
        }
        auto it = failed_.find(id);
        if (it != failed_.end()) {
            ChunkStatus s;
            s.kind = ChunkStatus::Kind::Failed;
            s.reason = it->second;
            return s;
        }
    }
    return pool_.status(id);
}

bool ChunkAssembler::is_complete(const ChunkId& id) const {
    return status(id).kind == ChunkStatus::Kind::Complete;
}

size_t ChunkAssembler::forwarded_parts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forwarded_count_;
}
