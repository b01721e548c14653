#pragma once
#include "chunk_types.hpp"
#include "crypto_oracle.hpp"
#include <vector>
#include <cstdint>

struct ChunkProductionParams {
    ShardId shard_id = 0;
    BlockHeight height = 0;
    Hash prev_block_hash{};
    uint32_t num_shards = 1;      // size of receipts_roots
    uint32_t data_parts = 1;      // D
    uint32_t parity_parts = 0;    // P
};

// Encode a shard payload into N parts, commit to them and to the outgoing
// receipts, and sign the resulting header. Throws std::invalid_argument on
// bad parameters (D = 0, N > 256, receipt for a shard >= num_shards).
EncodedChunk produce_encoded_chunk(const ChunkPayload& payload,
                                   const ChunkProductionParams& params,
                                   HeaderSigner& signer);

// Merkle leaves of the encoded parts: sha256 of each part payload
std::vector<Hash> part_leaves(const std::vector<std::vector<uint8_t>>& parts);
