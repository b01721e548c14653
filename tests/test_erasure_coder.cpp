// tests/test_erasure_coder.cpp
//
// Reed-Solomon encode/decode through jerasure: any k of the k + r parts
// recover the payload, fewer report InsufficientParts.

#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <map>
#include <random>
#include <stdexcept>
#include <vector>

#include "erasure_coder.hpp"

namespace {

std::vector<uint8_t> random_bytes(size_t len, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(len);
    for (auto& b : out) b = static_cast<uint8_t>(rng() & 0xFF);
    return out;
}

// Calls fn for every k-sized subset of [0, n)
void for_each_subset(int n, int k, const std::function<void(const std::vector<int>&)>& fn) {
    std::vector<int> idx(k);
    std::function<void(int, int)> rec = [&](int start, int depth) {
        if (depth == k) {
            fn(idx);
            return;
        }
        for (int i = start; i <= n - (k - depth); ++i) {
            idx[depth] = i;
            rec(i + 1, depth + 1);
        }
    };
    rec(0, 0);
}

}  // namespace

TEST(ErasureCoderTest, EveryDataSubsetRecoversPayload)
{
    const std::vector<std::pair<int, int>> shapes = {{1, 0}, {1, 2}, {3, 0}, {4, 2}, {5, 3}};
    const std::vector<size_t> lengths = {0, 1, 7, 33, 1000};

    for (const auto& [k, r] : shapes) {
        ErasureCoder coder(k, r);
        for (size_t len : lengths) {
            auto payload = random_bytes(len, static_cast<uint32_t>(len * 31 + k));
            auto blocks = coder.encode(payload);
            ASSERT_EQ(blocks.size(), static_cast<size_t>(k + r));

            for_each_subset(k + r, k, [&](const std::vector<int>& subset) {
                std::map<uint32_t, std::vector<uint8_t>> parts;
                for (int i : subset) parts[i] = blocks[i];

                std::vector<uint8_t> recovered;
                ASSERT_EQ(coder.decode(parts, len, recovered), CodecStatus::Ok)
                    << "k=" << k << " r=" << r << " len=" << len;
                EXPECT_EQ(recovered, payload);
            });
        }
    }
}

TEST(ErasureCoderTest, DataPartsCarryPayloadVerbatim)
{
    ErasureCoder coder(4, 2);
    std::vector<uint8_t> payload(64);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i);

    auto blocks = coder.encode(payload);
    ASSERT_EQ(blocks[0].size(), 16u);
    EXPECT_EQ(std::vector<uint8_t>(payload.begin(), payload.begin() + 16), blocks[0]);
    EXPECT_EQ(std::vector<uint8_t>(payload.begin() + 48, payload.end()), blocks[3]);
}

TEST(ErasureCoderTest, FewerThanKPartsIsInsufficient)
{
    ErasureCoder coder(4, 2);
    auto payload = random_bytes(100, 7);
    auto blocks = coder.encode(payload);

    std::map<uint32_t, std::vector<uint8_t>> parts{{0, blocks[0]}, {4, blocks[4]}, {5, blocks[5]}};
    std::vector<uint8_t> recovered;
    EXPECT_EQ(coder.decode(parts, payload.size(), recovered), CodecStatus::InsufficientParts);
    EXPECT_TRUE(recovered.empty());
}

TEST(ErasureCoderTest, MismatchedPartSizesAreInconsistent)
{
    ErasureCoder coder(2, 1);
    auto payload = random_bytes(40, 3);
    auto blocks = coder.encode(payload);

    blocks[1].push_back(0);
    std::map<uint32_t, std::vector<uint8_t>> parts{{0, blocks[0]}, {1, blocks[1]}};
    std::vector<uint8_t> recovered;
    EXPECT_EQ(coder.decode(parts, payload.size(), recovered), CodecStatus::InconsistentParts);
}

TEST(ErasureCoderTest, IndexOutOfRangeIsInconsistent)
{
    ErasureCoder coder(2, 1);
    auto blocks = coder.encode(random_bytes(16, 1));
    std::map<uint32_t, std::vector<uint8_t>> parts{{0, blocks[0]}, {7, blocks[1]}};
    std::vector<uint8_t> recovered;
    EXPECT_EQ(coder.decode(parts, 16, recovered), CodecStatus::InconsistentParts);
}

TEST(ErasureCoderTest, PartSizeIsWordAligned)
{
    ErasureCoder coder(3, 2);
    EXPECT_EQ(coder.part_size(0), sizeof(long));
    EXPECT_EQ(coder.part_size(1), sizeof(long));
    EXPECT_EQ(coder.part_size(3 * sizeof(long)), sizeof(long));
    EXPECT_EQ(coder.part_size(3 * sizeof(long) + 1), 2 * sizeof(long));
}

TEST(ErasureCoderTest, PartSizeNearSizeLimitDoesNotWrap)
{
    ErasureCoder single(1, 0);
    EXPECT_THROW(single.part_size(SIZE_MAX), std::length_error);
    EXPECT_EQ(single.part_size(SIZE_MAX - sizeof(long) + 1), SIZE_MAX - sizeof(long) + 1);

    ErasureCoder wide(4, 2);
    EXPECT_GE(wide.part_size(SIZE_MAX), SIZE_MAX / 4);
}

TEST(ErasureCoderTest, RejectsInvalidShapes)
{
    EXPECT_THROW(ErasureCoder(0, 2), std::invalid_argument);
    EXPECT_THROW(ErasureCoder(2, -1), std::invalid_argument);
    EXPECT_THROW(ErasureCoder(200, 57), std::invalid_argument);
    EXPECT_NO_THROW(ErasureCoder(250, 6));
}
