#include "erasure_coder.hpp"
#include <stdexcept>
#include <jerasure.h>
#include <reed_sol.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <vector>
#include <iostream>

namespace {
// Galois field tables are built lazily on first matrix construction
std::mutex g_matrix_mutex;
}

const char* codec_status_name(CodecStatus s) {
    switch (s) {
        case CodecStatus::Ok: return "Ok";
        case CodecStatus::InsufficientParts: return "InsufficientParts";
        case CodecStatus::InconsistentParts: return "InconsistentParts";
        default: return "Unknown";
    }
}

ErasureCoder::ErasureCoder(int k, int r, int w)
    : k_(k), r_(r), w_(w) {
    if (k_ < 1 || r_ < 0)
        throw std::invalid_argument("ErasureCoder requires k >= 1 and r >= 0");
    if (w_ != 8 && w_ != 16 && w_ != 32)
        throw std::invalid_argument("ErasureCoder word size must be 8, 16 or 32");
    if (w_ == 8 && k_ + r_ > 256)
        throw std::invalid_argument("ErasureCoder with w=8 supports at most 256 parts");

    if (r_ > 0) {
        std::lock_guard<std::mutex> lock(g_matrix_mutex);
        matrix_ = reed_sol_vandermonde_coding_matrix(k_, r_, w_);
        if (!matrix_) throw std::runtime_error("Failed to create coding matrix");
    }
}

ErasureCoder::~ErasureCoder() {
    if (matrix_) free(matrix_);
}

size_t ErasureCoder::part_size(size_t length) const {
    const size_t align = sizeof(long);
    size_t size = length / k_ + (length % k_ != 0 ? 1 : 0);
    if (size % align != 0) {
        if (size > SIZE_MAX - align) throw std::length_error("part size overflows size_t");
        size += align - size % align;
    }
    return size == 0 ? align : size;
}

std::vector<std::vector<uint8_t>> ErasureCoder::encode(const std::vector<uint8_t>& payload) const {
    size_t block_size = part_size(payload.size());

    std::vector<std::vector<uint8_t>> out_blocks(k_ + r_, std::vector<uint8_t>(block_size, 0));
    for (int i = 0; i < k_; ++i) {
        size_t offset = static_cast<size_t>(i) * block_size;
        if (offset >= payload.size()) break;
        size_t len = std::min(block_size, payload.size() - offset);
        std::memcpy(out_blocks[i].data(), payload.data() + offset, len);
    }

    if (r_ == 0) return out_blocks;

    std::vector<char*> data_ptrs(k_);
    std::vector<char*> code_ptrs(r_);
    for (int i = 0; i < k_; ++i) data_ptrs[i] = reinterpret_cast<char*>(out_blocks[i].data());
    for (int i = 0; i < r_; ++i) code_ptrs[i] = reinterpret_cast<char*>(out_blocks[k_ + i].data());

    jerasure_matrix_encode(k_, r_, w_, matrix_, data_ptrs.data(), code_ptrs.data(),
                           static_cast<int>(block_size));
    return out_blocks;
}

CodecStatus ErasureCoder::decode(const std::map<uint32_t, std::vector<uint8_t>>& parts,
                                 size_t length,
                                 std::vector<uint8_t>& recovered_data) const {
    const int n = k_ + r_;

    for (const auto& [index, block] : parts) {
        if (index >= static_cast<uint32_t>(n)) {
            std::cerr << "[FEC] Part index out of range: " << index << " >= " << n << std::endl;
            return CodecStatus::InconsistentParts;
        }
    }

    if (parts.size() < static_cast<size_t>(k_)) {
        return CodecStatus::InsufficientParts;
    }

    size_t block_size = part_size(length);
    for (const auto& [index, block] : parts) {
        if (block.size() != block_size) {
            std::cerr << "[FEC] Part " << index << " has size " << block.size()
                      << ", expected " << block_size << std::endl;
            return CodecStatus::InconsistentParts;
        }
    }

    // Working copies; missing blocks start zeroed
    std::vector<std::vector<uint8_t>> working_blocks(n, std::vector<uint8_t>(block_size, 0));
    std::vector<bool> received(n, false);
    for (const auto& [index, block] : parts) {
        working_blocks[index] = block;
        received[index] = true;
    }

    // Build erasure list
    std::vector<int> erasures;
    bool data_missing = false;
    for (int i = 0; i < n; ++i) {
        if (!received[i]) {
            erasures.push_back(i);
            if (i < k_) data_missing = true;
        }
    }
    erasures.push_back(-1); // terminator

    if (data_missing) {
        std::vector<char*> data_ptrs(k_);
        std::vector<char*> code_ptrs(r_);
        for (int i = 0; i < k_; ++i) data_ptrs[i] = reinterpret_cast<char*>(working_blocks[i].data());
        for (int i = 0; i < r_; ++i) code_ptrs[i] = reinterpret_cast<char*>(working_blocks[k_ + i].data());

        int ret = jerasure_matrix_decode(k_, r_, w_, matrix_, 0, erasures.data(),
                                         data_ptrs.data(), code_ptrs.data(),
                                         static_cast<int>(block_size));
        if (ret < 0) {
            std::cerr << "[FEC] Decode failed with error: " << ret << std::endl;
            return CodecStatus::InconsistentParts;
        }
    }

    recovered_data.clear();
    recovered_data.reserve(static_cast<size_t>(k_) * block_size);
    for (int i = 0; i < k_; ++i) {
        recovered_data.insert(recovered_data.end(),
                              working_blocks[i].begin(),
                              working_blocks[i].end());
    }
    recovered_data.resize(length);

    return CodecStatus::Ok;
}
