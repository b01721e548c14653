#pragma once
#include "hash.hpp"
#include "merkle.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using ShardId = uint32_t;
using BlockHeight = uint64_t;
using PartIndex = uint32_t;
using PeerId = std::string;

// Reed-Solomon over GF(2^8): at most 256 parts per chunk
constexpr uint32_t MAX_TOTAL_PARTS = 256;
constexpr uint64_t MAX_ENCODED_LENGTH = 64ull * 1024 * 1024;  // serialized payload bytes

struct Transaction {
    std::string signer_id;
    uint64_t nonce = 0;
    std::vector<uint8_t> body;

    bool operator==(const Transaction& o) const {
        return signer_id == o.signer_id && nonce == o.nonce && body == o.body;
    }
};

struct Receipt {
    Hash receipt_id{};
    ShardId destination_shard = 0;
    std::string predecessor_id;
    std::string receiver_id;
    std::vector<uint8_t> body;

    bool operator==(const Receipt& o) const {
        return receipt_id == o.receipt_id && destination_shard == o.destination_shard &&
               predecessor_id == o.predecessor_id && receiver_id == o.receiver_id &&
               body == o.body;
    }
};

// What a shard chunk carries before erasure coding
struct ChunkPayload {
    std::vector<Transaction> transactions;
    std::vector<Receipt> outgoing_receipts;

    bool operator==(const ChunkPayload& o) const {
        return transactions == o.transactions && outgoing_receipts == o.outgoing_receipts;
    }
};

struct ChunkHeader {
    ShardId shard_id = 0;
    BlockHeight height = 0;
    Hash prev_block_hash{};
    uint64_t encoded_length = 0;
    Hash encoded_merkle_root{};
    uint32_t parts_count = 0;        // N
    uint32_t data_parts_count = 0;   // D
    std::vector<Hash> receipts_roots;  // indexed by destination shard
    Hash outgoing_receipts_root{};     // merkle root over receipts_roots
    std::vector<uint8_t> signature;

    uint32_t parity_parts_count() const { return parts_count - data_parts_count; }

    // Hash over every field except the signature; this is what gets signed
    Hash hash() const;

    bool operator==(const ChunkHeader& o) const;
    bool operator!=(const ChunkHeader& o) const { return !(*this == o); }
};

struct ChunkId {
    BlockHeight height = 0;
    ShardId shard_id = 0;
    Hash hash{};

    static ChunkId of(const ChunkHeader& header) {
        return ChunkId{header.height, header.shard_id, header.hash()};
    }

    bool operator==(const ChunkId& o) const {
        return height == o.height && shard_id == o.shard_id && hash == o.hash;
    }
    bool operator!=(const ChunkId& o) const { return !(*this == o); }
    bool operator<(const ChunkId& o) const {
        if (height != o.height) return height < o.height;
        if (shard_id != o.shard_id) return shard_id < o.shard_id;
        return hash < o.hash;
    }
};

std::string to_string(const ChunkId& id);

struct ChunkPart {
    PartIndex part_index = 0;
    std::vector<uint8_t> payload;
    MerklePath merkle_proof;  // against encoded_merkle_root
};

struct ReceiptProof {
    ShardId destination_shard = 0;
    std::vector<Receipt> receipts;
    MerklePath merkle_proof;  // receipts_roots[dest] against outgoing_receipts_root

    bool operator==(const ReceiptProof& o) const {
        return destination_shard == o.destination_shard && receipts == o.receipts &&
               merkle_proof == o.merkle_proof;
    }
};

// A fully reconstructed and validated chunk
struct Chunk {
    ChunkHeader header;
    ChunkPayload payload;
    std::map<ShardId, std::vector<Receipt>> receipts_by_shard;
};

// Producer output: header, all N parts with proofs, receipt proofs for
// every non-empty destination shard
struct EncodedChunk {
    ChunkHeader header;
    std::vector<ChunkPart> parts;
    std::vector<ReceiptProof> receipt_proofs;
};

Hash receipt_hash(const Receipt& r);

// Merkle root over the hashes of a destination shard's receipt list
Hash receipts_root(const std::vector<Receipt>& receipts);

// Stable grouping by destination shard, keeping payload order within a shard
std::map<ShardId, std::vector<Receipt>> group_receipts_by_shard(const std::vector<Receipt>& receipts);
