#include "chunk_pool.hpp"
#include "chunk_producer.hpp"
#include "payload_parser.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

const char* observe_outcome_name(ObserveOutcome o) {
    switch (o) {
        case ObserveOutcome::Registered: return "Registered";
        case ObserveOutcome::AlreadyKnown: return "AlreadyKnown";
        case ObserveOutcome::HeaderConflict: return "HeaderConflict";
        case ObserveOutcome::Malformed: return "Malformed";
        case ObserveOutcome::Stale: return "Stale";
        default: return "Unknown";
    }
}

const char* part_outcome_name(PartOutcome o) {
    switch (o) {
        case PartOutcome::Accepted: return "Accepted";
        case PartOutcome::Duplicate: return "Duplicate";
        case PartOutcome::InvalidProof: return "InvalidProof";
        case PartOutcome::UnknownChunk: return "UnknownChunk";
        case PartOutcome::ConflictingDuplicate: return "ConflictingDuplicate";
        case PartOutcome::ChunkClosed: return "ChunkClosed";
        default: return "Unknown";
    }
}

const char* receipt_outcome_name(ReceiptOutcome o) {
    switch (o) {
        case ReceiptOutcome::Accepted: return "Accepted";
        case ReceiptOutcome::Duplicate: return "Duplicate";
        case ReceiptOutcome::InvalidProof: return "InvalidProof";
        case ReceiptOutcome::UnknownChunk: return "UnknownChunk";
        default: return "Unknown";
    }
}

const char* failure_reason_name(FailureReason r) {
    switch (r) {
        case FailureReason::None: return "None";
        case FailureReason::RootMismatch: return "RootMismatch";
        case FailureReason::ReceiptsRootMismatch: return "ReceiptsRootMismatch";
        case FailureReason::MalformedPayload: return "MalformedPayload";
        case FailureReason::RetriesExhausted: return "RetriesExhausted";
        case FailureReason::EvictedBeforeComplete: return "EvictedBeforeComplete";
        default: return "Unknown";
    }
}

namespace {

bool header_is_well_formed(const ChunkHeader& h) {
    if (h.data_parts_count == 0) return false;
    if (h.parts_count < h.data_parts_count || h.parts_count > MAX_TOTAL_PARTS) return false;
    if (h.encoded_length > MAX_ENCODED_LENGTH) return false;
    if (h.receipts_roots.empty()) return false;
    return merkle_root(h.receipts_roots) == h.outgoing_receipts_root;
}

}  // namespace

ChunkPool::ChunkPool(CryptoOracle& crypto) : crypto_(crypto) {}

ObserveResult ChunkPool::observe_header(const ChunkHeader& header) {
    ChunkId id = ChunkId::of(header);

    if (!header_is_well_formed(header)) {
        std::cerr << "[POOL] Malformed header for " << to_string(id)
                  << " (N=" << header.parts_count << ", D=" << header.data_parts_count << ")" << std::endl;
        return {ObserveOutcome::Malformed, id};
    }

    std::unique_lock<std::shared_mutex> lock(index_mutex_);

    if (header.height < eviction_floor_) {
        return {ObserveOutcome::Stale, id};
    }

    Key key{header.height, header.shard_id};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        const auto& existing = it->second;
        if (existing->header == header) {
            return {ObserveOutcome::AlreadyKnown, existing->id};
        }
        std::cerr << "[POOL] Header conflict at height " << header.height << " shard " << header.shard_id
                  << ": have " << short_hex(existing->id.hash) << ", got " << short_hex(id.hash) << std::endl;
        return {ObserveOutcome::HeaderConflict, existing->id};
    }

    auto entry = std::make_shared<PartialChunkState>();
    entry->header = header;
    entry->id = id;
    entries_.emplace(key, std::move(entry));
    return {ObserveOutcome::Registered, id};
}

ChunkPool::EntryPtr ChunkPool::find(const ChunkId& id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = entries_.find(Key{id.height, id.shard_id});
    if (it == entries_.end() || it->second->id.hash != id.hash) return nullptr;
    return it->second;
}

std::shared_ptr<const ErasureCoder> ChunkPool::coder_for(uint32_t data_parts, uint32_t parity_parts) {
    std::lock_guard<std::mutex> lock(coders_mutex_);
    auto key = std::make_pair(data_parts, parity_parts);
    auto it = coders_.find(key);
    if (it != coders_.end()) return it->second;

    auto coder = std::make_shared<const ErasureCoder>(static_cast<int>(data_parts),
                                                      static_cast<int>(parity_parts));
    coders_.emplace(key, coder);
    return coder;
}

PartOutcome ChunkPool::add_part(const ChunkId& id, const ChunkPart& part) {
    EntryPtr entry = find(id);
    if (!entry) return PartOutcome::UnknownChunk;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->evicted) return PartOutcome::UnknownChunk;
    if (entry->state == EntryState::Failed) return PartOutcome::ChunkClosed;

    const ChunkHeader& header = entry->header;
    if (part.part_index >= header.parts_count) {
        std::cerr << "[POOL] Part index " << part.part_index << " out of range for "
                  << to_string(id) << std::endl;
        return PartOutcome::InvalidProof;
    }

    Hash leaf = leaf_hash(part.payload);
    auto held = entry->parts.find(part.part_index);
    if (held != entry->parts.end()) {
        if (held->second.payload == part.payload) return PartOutcome::Duplicate;
        if (crypto_.verify_merkle_proof(leaf, part.part_index, header.parts_count, part.merkle_proof,
                                        header.encoded_merkle_root)) {
            std::cerr << "[POOL] Conflicting payloads for part " << part.part_index << " of "
                      << to_string(id) << std::endl;
            return PartOutcome::ConflictingDuplicate;
        }
        return PartOutcome::InvalidProof;
    }

    if (!crypto_.verify_merkle_proof(leaf, part.part_index, header.parts_count, part.merkle_proof,
                                     header.encoded_merkle_root)) {
        std::cerr << "[POOL] Invalid proof for part " << part.part_index << " of " << to_string(id) << std::endl;
        return PartOutcome::InvalidProof;
    }

    // A producer can commit to parts the codec cannot use; never admit them
    size_t expected_size = coder_for(header.data_parts_count, header.parity_parts_count())
                               ->part_size(header.encoded_length);
    if (part.payload.size() != expected_size) {
        std::cerr << "[POOL] Part " << part.part_index << " of " << to_string(id) << " has size "
                  << part.payload.size() << ", expected " << expected_size << std::endl;
        return PartOutcome::InvalidProof;
    }

    entry->parts.emplace(part.part_index, part);
    entry->requested.erase(part.part_index);
    entry->known_missing.erase(part.part_index);

    // Parts arriving after reconstruction are kept so they can be served to peers
    if (entry->state == EntryState::Collecting && !entry->reconstruction_attempted &&
        entry->parts.size() >= header.data_parts_count) {
        try_reconstruct(*entry);
    }
    return PartOutcome::Accepted;
}

void ChunkPool::try_reconstruct(PartialChunkState& entry) {
    const ChunkHeader& header = entry.header;
    auto coder = coder_for(header.data_parts_count, header.parity_parts_count());

    std::map<uint32_t, std::vector<uint8_t>> blocks;
    for (const auto& [index, part] : entry.parts) blocks.emplace(index, part.payload);

    std::vector<uint8_t> recovered;
    CodecStatus codec_status = coder->decode(blocks, header.encoded_length, recovered);
    if (codec_status == CodecStatus::InsufficientParts) {
        return;  // try again on the next admitted part
    }
    if (codec_status != CodecStatus::Ok) {
        throw std::logic_error(std::string("admitted parts failed to decode: ") +
                               codec_status_name(codec_status));
    }
    entry.reconstruction_attempted = true;
    entry.requested.clear();

    Hash root = merkle_root(part_leaves(coder->encode(recovered)));
    if (root != header.encoded_merkle_root) {
        std::cerr << "[POOL] Reconstructed root mismatch for " << to_string(entry.id) << std::endl;
        entry.state = EntryState::Failed;
        entry.failure = FailureReason::RootMismatch;
        return;
    }

    ChunkPayload payload;
    try {
        payload = parse_payload(recovered.data(), recovered.size());
    } catch (const std::runtime_error& e) {
        std::cerr << "[POOL] Undecodable payload in " << to_string(entry.id) << ": " << e.what() << std::endl;
        entry.state = EntryState::Failed;
        entry.failure = FailureReason::MalformedPayload;
        return;
    }

    auto grouped = group_receipts_by_shard(payload.outgoing_receipts);
    for (ShardId shard = 0; shard < header.receipts_roots.size(); ++shard) {
        auto it = grouped.find(shard);
        Hash expected = (it == grouped.end()) ? Hash{} : receipts_root(it->second);
        if (expected != header.receipts_roots[shard]) {
            std::cerr << "[POOL] Receipts root mismatch for shard " << shard << " in "
                      << to_string(entry.id) << std::endl;
            entry.state = EntryState::Failed;
            entry.failure = FailureReason::ReceiptsRootMismatch;
            return;
        }
    }
    if (!grouped.empty() && grouped.rbegin()->first >= header.receipts_roots.size()) {
        entry.state = EntryState::Failed;
        entry.failure = FailureReason::ReceiptsRootMismatch;
        return;
    }

    Chunk chunk;
    chunk.header = header;
    chunk.payload = std::move(payload);
    chunk.receipts_by_shard = std::move(grouped);
    entry.reconstructed = std::move(chunk);
    entry.state = EntryState::Reconstructed;

    std::cout << "[POOL] Reconstructed " << to_string(entry.id) << " from " << entry.parts.size()
              << "/" << header.parts_count << " parts" << std::endl;
}

ReceiptOutcome ChunkPool::add_receipt_proof(const ChunkId& id, const ReceiptProof& proof) {
    EntryPtr entry = find(id);
    if (!entry) return ReceiptOutcome::UnknownChunk;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->evicted) return ReceiptOutcome::UnknownChunk;

    const ChunkHeader& header = entry->header;
    if (proof.destination_shard >= header.receipts_roots.size()) return ReceiptOutcome::InvalidProof;

    auto held = entry->receipt_proofs.find(proof.destination_shard);
    if (held != entry->receipt_proofs.end() && held->second == proof) return ReceiptOutcome::Duplicate;

    for (const auto& r : proof.receipts) {
        if (r.destination_shard != proof.destination_shard) return ReceiptOutcome::InvalidProof;
    }

    const Hash& shard_root = header.receipts_roots[proof.destination_shard];
    if (receipts_root(proof.receipts) != shard_root ||
        !crypto_.verify_merkle_proof(shard_root, proof.destination_shard, header.receipts_roots.size(),
                                     proof.merkle_proof, header.outgoing_receipts_root)) {
        std::cerr << "[POOL] Invalid receipt proof for shard " << proof.destination_shard << " in "
                  << to_string(id) << std::endl;
        return ReceiptOutcome::InvalidProof;
    }

    // Both proofs verify against the same root, so the receipt lists match
    if (held != entry->receipt_proofs.end()) return ReceiptOutcome::Duplicate;

    entry->receipt_proofs.emplace(proof.destination_shard, proof);
    return ReceiptOutcome::Accepted;
}

std::set<PartIndex> ChunkPool::missing_parts(const ChunkId& id) const {
    std::set<PartIndex> missing;
    EntryPtr entry = find(id);
    if (!entry) return missing;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->evicted || entry->state != EntryState::Collecting) return missing;

    for (PartIndex i = 0; i < entry->header.parts_count; ++i) {
        if (!entry->parts.count(i) && !entry->requested.count(i)) missing.insert(i);
    }
    return missing;
}

void ChunkPool::mark_requested(const ChunkId& id, PartIndex index) {
    EntryPtr entry = find(id);
    if (!entry) return;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->state != EntryState::Collecting || index >= entry->header.parts_count) return;
    if (!entry->parts.count(index)) entry->requested.insert(index);
}

void ChunkPool::mark_abandoned(const ChunkId& id, PartIndex index) {
    EntryPtr entry = find(id);
    if (!entry) return;

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->requested.erase(index);
    if (index < entry->header.parts_count && !entry->parts.count(index)) entry->known_missing.insert(index);
}

std::optional<Chunk> ChunkPool::take_reconstructed(const ChunkId& id) {
    EntryPtr entry = find(id);
    if (!entry) return std::nullopt;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->state != EntryState::Reconstructed || !entry->reconstructed) return std::nullopt;

    std::optional<Chunk> out = std::move(entry->reconstructed);
    entry->reconstructed.reset();
    entry->state = EntryState::Delivered;
    return out;
}

std::vector<EvictedChunk> ChunkPool::evict_below(BlockHeight floor) {
    std::vector<EvictedChunk> evicted;
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    eviction_floor_ = std::max(eviction_floor_, floor);

    auto end = entries_.lower_bound(Key{floor, 0});
    for (auto it = entries_.begin(); it != end; ++it) {
        auto& entry = it->second;
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        entry->evicted = true;
        bool completed = entry->state == EntryState::Reconstructed || entry->state == EntryState::Delivered;
        if (!completed) {
            std::cerr << "[POOL] Evicting incomplete " << to_string(entry->id) << " with "
                      << entry->parts.size() << "/" << entry->header.data_parts_count << " parts" << std::endl;
        }
        evicted.push_back({entry->id, completed});
    }
    entries_.erase(entries_.begin(), end);
    return evicted;
}

ChunkStatus ChunkPool::status_locked(const PartialChunkState& entry) const {
    ChunkStatus s;
    switch (entry.state) {
        case EntryState::Reconstructed:
        case EntryState::Delivered:
            s.kind = ChunkStatus::Kind::Complete;
            return s;
        case EntryState::Failed:
            s.kind = ChunkStatus::Kind::Failed;
            s.reason = entry.failure;
            return s;
        case EntryState::Collecting:
            break;
    }

    const uint32_t held = static_cast<uint32_t>(entry.parts.size());
    const uint32_t needed = entry.header.data_parts_count > held ? entry.header.data_parts_count - held : 0;
    const uint32_t obtainable = entry.header.parts_count - held - static_cast<uint32_t>(entry.known_missing.size());
    if (obtainable < needed) {
        s.kind = ChunkStatus::Kind::Failed;
        s.reason = FailureReason::RetriesExhausted;
        return s;
    }

    s.kind = ChunkStatus::Kind::InProgress;
    s.valid_count = held;
    s.missing_count = needed;
    return s;
}

ChunkStatus ChunkPool::status(const ChunkId& id) const {
    EntryPtr entry = find(id);
    if (!entry) return ChunkStatus{};

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->evicted) return ChunkStatus{};
    return status_locked(*entry);
}

bool ChunkPool::contains(const ChunkId& id) const {
    return find(id) != nullptr;
}

std::optional<ChunkHeader> ChunkPool::header(const ChunkId& id) const {
    EntryPtr entry = find(id);
    if (!entry) return std::nullopt;
    return entry->header;  // immutable after insert
}

std::optional<ChunkPart> ChunkPool::held_part(const ChunkId& id, PartIndex index) const {
    EntryPtr entry = find(id);
    if (!entry) return std::nullopt;

    std::lock_guard<std::mutex> lock(entry->mutex);
    auto it = entry->parts.find(index);
    if (it == entry->parts.end()) return std::nullopt;
    return it->second;
}

std::optional<ReceiptProof> ChunkPool::receipt_proof(const ChunkId& id, ShardId destination) const {
    EntryPtr entry = find(id);
    if (!entry) return std::nullopt;

    std::lock_guard<std::mutex> lock(entry->mutex);
    auto it = entry->receipt_proofs.find(destination);
    if (it == entry->receipt_proofs.end()) return std::nullopt;
    return it->second;
}

uint32_t ChunkPool::held_count(const ChunkId& id) const {
    EntryPtr entry = find(id);
    if (!entry) return 0;

    std::lock_guard<std::mutex> lock(entry->mutex);
    return static_cast<uint32_t>(entry->parts.size());
}

std::vector<ChunkId> ChunkPool::open_chunks() const {
    std::vector<ChunkId> ids;
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    for (const auto& [key, entry] : entries_) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (entry->state == EntryState::Collecting) ids.push_back(entry->id);
    }
    return ids;
}

BlockHeight ChunkPool::eviction_floor() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return eviction_floor_;
}

size_t ChunkPool::size() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return entries_.size();
}
