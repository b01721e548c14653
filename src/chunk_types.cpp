#include "chunk_types.hpp"
#include "payload_parser.hpp"

Hash ChunkHeader::hash() const {
    return sha256(serialize_header_inner(*this));
}

bool ChunkHeader::operator==(const ChunkHeader& o) const {
    return shard_id == o.shard_id && height == o.height &&
           prev_block_hash == o.prev_block_hash && encoded_length == o.encoded_length &&
           encoded_merkle_root == o.encoded_merkle_root && parts_count == o.parts_count &&
           data_parts_count == o.data_parts_count && receipts_roots == o.receipts_roots &&
           outgoing_receipts_root == o.outgoing_receipts_root && signature == o.signature;
}

std::string to_string(const ChunkId& id) {
    return "chunk(h=" + std::to_string(id.height) + ", shard=" + std::to_string(id.shard_id) +
           ", " + short_hex(id.hash) + ")";
}

Hash receipt_hash(const Receipt& r) {
    return leaf_hash(serialize_receipt(r));
}

Hash receipts_root(const std::vector<Receipt>& receipts) {
    std::vector<Hash> leaves;
    leaves.reserve(receipts.size());
    for (const auto& r : receipts) leaves.push_back(receipt_hash(r));
    return merkle_root(leaves);
}

std::map<ShardId, std::vector<Receipt>> group_receipts_by_shard(const std::vector<Receipt>& receipts) {
    std::map<ShardId, std::vector<Receipt>> grouped;
    for (const auto& r : receipts) grouped[r.destination_shard].push_back(r);
    return grouped;
}
