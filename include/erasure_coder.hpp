#pragma once
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>

enum class CodecStatus {
    Ok,
    InsufficientParts,   // fewer than k distinct parts; wait for more
    InconsistentParts    // parts disagree in size or index range; upstream defect
};

const char* codec_status_name(CodecStatus s);

// Systematic Reed-Solomon (Vandermonde, GF(2^w)) over k data + r parity parts.
// Any k of the k + r parts recover the payload.
class ErasureCoder {
public:
    ErasureCoder(int k, int r, int w = 8);
    ~ErasureCoder();

    ErasureCoder(const ErasureCoder&) = delete;
    ErasureCoder& operator=(const ErasureCoder&) = delete;

    int data_parts() const { return k_; }
    int parity_parts() const { return r_; }
    int total_parts() const { return k_ + r_; }

    // Per-part size for a payload of `length` bytes: ceil(length / k) rounded
    // up to a multiple of sizeof(long), never zero. Throws std::length_error
    // if the rounded size does not fit in size_t.
    size_t part_size(size_t length) const;

    // payload -> k + r parts (payload zero-padded to k * part_size)
    std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& payload) const;

    // Recover the first `length` payload bytes from any k parts.
    CodecStatus decode(const std::map<uint32_t, std::vector<uint8_t>>& parts,
                       size_t length,
                       std::vector<uint8_t>& recovered_data) const;

private:
    int k_, r_, w_;
    int* matrix_ = nullptr;
};
