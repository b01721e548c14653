#pragma once
#include "chunk_types.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

// Canonical byte layout, little endian, length-prefixed:
//
// payload  := u32 tx_count, tx*, u32 receipt_count, receipt*
// tx       := bytes signer_id, u64 nonce, bytes body
// receipt  := [32] receipt_id, u32 destination_shard,
//             bytes predecessor_id, bytes receiver_id, bytes body
// bytes    := u32 len, [len]
//
// header inner := u32 shard_id, u64 height, [32] prev_block_hash,
//                 u64 encoded_length, [32] encoded_merkle_root,
//                 u32 parts_count, u32 data_parts_count,
//                 u32 root_count, [32]*root_count, [32] outgoing_receipts_root

// ChunkPayload -> bytes
std::vector<uint8_t> serialize_payload(const ChunkPayload& payload);

// bytes -> ChunkPayload. Throws std::runtime_error on truncated or trailing data.
ChunkPayload parse_payload(const uint8_t* data, std::size_t len);

std::vector<uint8_t> serialize_receipt(const Receipt& receipt);

// Header fields covered by the hash and the signature
std::vector<uint8_t> serialize_header_inner(const ChunkHeader& header);
