#pragma once

#include "chunk_types.hpp"

// Fire-and-forget sends. Responses come back through
// ChunkAssembler::on_part_received / on_receipt_proof_received.
class PartTransport {
public:
    virtual ~PartTransport() = default;
    virtual void request_part(const PeerId& target, const ChunkId& id, PartIndex index) = 0;
    virtual void send_part(const PeerId& target, const ChunkId& id, const ChunkPart& part) = 0;
    virtual void send_receipt_proof(const PeerId& target, const ChunkId& id, const ReceiptProof& proof) = 0;
};

// Block/fork-choice view: is this header part of a block we accept?
class BlockOracle {
public:
    virtual ~BlockOracle() = default;
    virtual bool is_header_for_valid_block(const ChunkHeader& header) = 0;
};
