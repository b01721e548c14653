// tests/test_helpers.hpp
//
// Shared fixtures: payload builders, a per-shard producer key ring and
// in-memory stand-ins for the transport and block collaborators.
#pragma once

#include "chunk_producer.hpp"
#include "crypto_oracle.hpp"
#include "part_transport.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace testutil {

inline Hash hash_of(const std::string& s) {
    return sha256(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

inline ChunkPayload make_payload(size_t tx_count, size_t receipt_count, uint32_t num_shards) {
    ChunkPayload p;
    for (size_t i = 0; i < tx_count; ++i) {
        Transaction tx;
        tx.signer_id = "alice" + std::to_string(i);
        tx.nonce = i + 1;
        tx.body.assign(20 + i, static_cast<uint8_t>(i));
        p.transactions.push_back(tx);
    }
    for (size_t i = 0; i < receipt_count; ++i) {
        Receipt r;
        r.receipt_id = hash_of("receipt" + std::to_string(i));
        r.destination_shard = static_cast<ShardId>(i % num_shards);
        r.predecessor_id = "alice" + std::to_string(i);
        r.receiver_id = "bob" + std::to_string(i);
        r.body.assign(8, static_cast<uint8_t>(0xA0 + i));
        p.outgoing_receipts.push_back(r);
    }
    return p;
}

// One Ed25519 producer key per shard
class KeyRing {
public:
    HeaderSigner& signer(ShardId shard) {
        auto it = signers_.find(shard);
        if (it == signers_.end()) it = signers_.emplace(shard, Ed25519Signer::generate()).first;
        return *it->second;
    }

    ProducerKeyLookup lookup() {
        return [this](ShardId shard, BlockHeight) -> std::optional<PublicKey> {
            auto it = signers_.find(shard);
            if (it == signers_.end()) return std::nullopt;
            return it->second->public_key();
        };
    }

private:
    std::map<ShardId, std::unique_ptr<Ed25519Signer>> signers_;
};

inline EncodedChunk make_chunk(KeyRing& keys, ShardId shard, BlockHeight height,
                               uint32_t data_parts, uint32_t parity_parts,
                               const ChunkPayload& payload, uint32_t num_shards = 4,
                               const std::string& prev = "prev") {
    ChunkProductionParams params;
    params.shard_id = shard;
    params.height = height;
    params.prev_block_hash = hash_of(prev);
    params.num_shards = num_shards;
    params.data_parts = data_parts;
    params.parity_parts = parity_parts;
    return produce_encoded_chunk(payload, params, keys.signer(shard));
}

struct SentRequest {
    PeerId peer;
    ChunkId id;
    PartIndex index;
};

struct SentPart {
    PeerId peer;
    ChunkId id;
    ChunkPart part;
};

class FakeTransport : public PartTransport {
public:
    void request_part(const PeerId& target, const ChunkId& id, PartIndex index) override {
        requests.push_back({target, id, index});
    }
    void send_part(const PeerId& target, const ChunkId& id, const ChunkPart& part) override {
        parts.push_back({target, id, part});
    }
    void send_receipt_proof(const PeerId& target, const ChunkId& id, const ReceiptProof& proof) override {
        receipt_proofs.push_back({target, proof.destination_shard});
        (void)id;
    }

    std::vector<SentRequest> requests;
    std::vector<SentPart> parts;
    std::vector<std::pair<PeerId, ShardId>> receipt_proofs;
};

class FakeBlockOracle : public BlockOracle {
public:
    bool is_header_for_valid_block(const ChunkHeader&) override { return valid; }
    bool valid = true;
};

}  // namespace testutil
