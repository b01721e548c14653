#include "payload_parser.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) buf.push_back((v >> (i * 8)) & 0xFF);
}

void put_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) buf.push_back((v >> (i * 8)) & 0xFF);
}

void put_hash(std::vector<uint8_t>& buf, const Hash& h) {
    buf.insert(buf.end(), h.begin(), h.end());
}

void put_bytes(std::vector<uint8_t>& buf, const uint8_t* data, size_t len) {
    put_u32(buf, static_cast<uint32_t>(len));
    buf.insert(buf.end(), data, data + len);
}

void put_receipt(std::vector<uint8_t>& buf, const Receipt& r) {
    put_hash(buf, r.receipt_id);
    put_u32(buf, r.destination_shard);
    put_bytes(buf, reinterpret_cast<const uint8_t*>(r.predecessor_id.data()), r.predecessor_id.size());
    put_bytes(buf, reinterpret_cast<const uint8_t*>(r.receiver_id.data()), r.receiver_id.size());
    put_bytes(buf, r.body.data(), r.body.size());
}

class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    uint32_t u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(data_[pos_ + i]) << (i * 8);
        pos_ += 4;
        return v;
    }

    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
        pos_ += 8;
        return v;
    }

    Hash hash() {
        need(HASH_SIZE);
        Hash h;
        std::copy(data_ + pos_, data_ + pos_ + HASH_SIZE, h.begin());
        pos_ += HASH_SIZE;
        return h;
    }

    std::vector<uint8_t> bytes() {
        uint32_t len = u32();
        need(len);
        std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return out;
    }

    std::string str() {
        auto b = bytes();
        return std::string(b.begin(), b.end());
    }

    // Element counts are bounded by what the remaining input could hold
    uint32_t count(size_t min_element_size) {
        uint32_t n = u32();
        if (static_cast<uint64_t>(n) * min_element_size > len_ - pos_)
            throw std::runtime_error("[parse_payload] Element count exceeds input");
        return n;
    }

    bool at_end() const { return pos_ == len_; }

private:
    void need(size_t n) const {
        if (len_ - pos_ < n) throw std::runtime_error("[parse_payload] Payload truncated");
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

}  // namespace

std::vector<uint8_t> serialize_payload(const ChunkPayload& payload) {
    std::vector<uint8_t> buffer;

    put_u32(buffer, static_cast<uint32_t>(payload.transactions.size()));
    for (const auto& tx : payload.transactions) {
        put_bytes(buffer, reinterpret_cast<const uint8_t*>(tx.signer_id.data()), tx.signer_id.size());
        put_u64(buffer, tx.nonce);
        put_bytes(buffer, tx.body.data(), tx.body.size());
    }

    put_u32(buffer, static_cast<uint32_t>(payload.outgoing_receipts.size()));
    for (const auto& r : payload.outgoing_receipts) put_receipt(buffer, r);

    return buffer;
}

ChunkPayload parse_payload(const uint8_t* data, std::size_t len) {
    Reader in(data, len);
    ChunkPayload payload;

    uint32_t tx_count = in.count(16);
    payload.transactions.reserve(tx_count);
    for (uint32_t i = 0; i < tx_count; ++i) {
        Transaction tx;
        tx.signer_id = in.str();
        tx.nonce = in.u64();
        tx.body = in.bytes();
        payload.transactions.push_back(std::move(tx));
    }

    uint32_t receipt_count = in.count(HASH_SIZE + 16);
    payload.outgoing_receipts.reserve(receipt_count);
    for (uint32_t i = 0; i < receipt_count; ++i) {
        Receipt r;
        r.receipt_id = in.hash();
        r.destination_shard = in.u32();
        r.predecessor_id = in.str();
        r.receiver_id = in.str();
        r.body = in.bytes();
        payload.outgoing_receipts.push_back(std::move(r));
    }

    if (!in.at_end()) throw std::runtime_error("[parse_payload] Trailing bytes after payload");
    return payload;
}

std::vector<uint8_t> serialize_receipt(const Receipt& receipt) {
    std::vector<uint8_t> buffer;
    put_receipt(buffer, receipt);
    return buffer;
}

std::vector<uint8_t> serialize_header_inner(const ChunkHeader& header) {
    std::vector<uint8_t> buffer;
    buffer.reserve(4 + 8 + 32 + 8 + 32 + 4 + 4 + 4 + HASH_SIZE * (header.receipts_roots.size() + 1));

    put_u32(buffer, header.shard_id);
    put_u64(buffer, header.height);
    put_hash(buffer, header.prev_block_hash);
    put_u64(buffer, header.encoded_length);
    put_hash(buffer, header.encoded_merkle_root);
    put_u32(buffer, header.parts_count);
    put_u32(buffer, header.data_parts_count);
    put_u32(buffer, static_cast<uint32_t>(header.receipts_roots.size()));
    for (const auto& root : header.receipts_roots) put_hash(buffer, root);
    put_hash(buffer, header.outgoing_receipts_root);

    return buffer;
}
