#include "chunk_producer.hpp"
#include "erasure_coder.hpp"
#include "payload_parser.hpp"
#include <stdexcept>
#include <string>
#include <iostream>

std::vector<Hash> part_leaves(const std::vector<std::vector<uint8_t>>& parts) {
    std::vector<Hash> leaves;
    leaves.reserve(parts.size());
    for (const auto& p : parts) leaves.push_back(leaf_hash(p));
    return leaves;
}

EncodedChunk produce_encoded_chunk(const ChunkPayload& payload,
                                   const ChunkProductionParams& params,
                                   HeaderSigner& signer) {
    if (params.data_parts == 0)
        throw std::invalid_argument("data_parts must be at least 1");
    if (params.data_parts + params.parity_parts > MAX_TOTAL_PARTS)
        throw std::invalid_argument("at most " + std::to_string(MAX_TOTAL_PARTS) + " parts per chunk");
    if (params.num_shards == 0)
        throw std::invalid_argument("num_shards must be at least 1");

    auto grouped = group_receipts_by_shard(payload.outgoing_receipts);
    for (const auto& [shard, receipts] : grouped) {
        if (shard >= params.num_shards)
            throw std::invalid_argument("receipt destined to unknown shard " + std::to_string(shard));
    }

    std::vector<uint8_t> encoded = serialize_payload(payload);
    if (encoded.size() > MAX_ENCODED_LENGTH)
        throw std::invalid_argument("payload of " + std::to_string(encoded.size()) + " bytes exceeds the chunk limit");

    ErasureCoder coder(static_cast<int>(params.data_parts), static_cast<int>(params.parity_parts));
    std::vector<std::vector<uint8_t>> blocks = coder.encode(encoded);
    MerkleTree parts_tree = merklize(part_leaves(blocks));

    EncodedChunk out;
    ChunkHeader& header = out.header;
    header.shard_id = params.shard_id;
    header.height = params.height;
    header.prev_block_hash = params.prev_block_hash;
    header.encoded_length = encoded.size();
    header.encoded_merkle_root = parts_tree.root;
    header.parts_count = params.data_parts + params.parity_parts;
    header.data_parts_count = params.data_parts;

    // Empty shards get the zero root
    header.receipts_roots.assign(params.num_shards, Hash{});
    for (const auto& [shard, receipts] : grouped) header.receipts_roots[shard] = receipts_root(receipts);
    MerkleTree receipts_tree = merklize(header.receipts_roots);
    header.outgoing_receipts_root = receipts_tree.root;

    header.signature = signer.sign(header.hash());

    out.parts.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        ChunkPart part;
        part.part_index = static_cast<PartIndex>(i);
        part.payload = std::move(blocks[i]);
        part.merkle_proof = parts_tree.paths[i];
        out.parts.push_back(std::move(part));
    }

    for (auto& [shard, receipts] : grouped) {
        ReceiptProof proof;
        proof.destination_shard = shard;
        proof.receipts = std::move(receipts);
        proof.merkle_proof = receipts_tree.paths[shard];
        out.receipt_proofs.push_back(std::move(proof));
    }

    std::cout << "[PRODUCER] Produced " << to_string(ChunkId::of(header)) << " with "
              << payload.transactions.size() << " txs, " << payload.outgoing_receipts.size()
              << " receipts, " << header.parts_count << " parts of "
              << coder.part_size(encoded.size()) << " bytes" << std::endl;
    return out;
}
