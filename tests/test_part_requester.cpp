// tests/test_part_requester.cpp
//
// Retry/backoff timeline of PartRequester, driven by explicit time points.

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "part_requester.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using namespace testutil;

namespace {

// Records every select/timeout/response; rotates over three peers
class RecordingSelector : public PeerSelector {
public:
    std::optional<PeerId> select(const ChunkId&, PartIndex index, uint32_t attempt) override {
        if (no_peers) return std::nullopt;
        return "peer" + std::to_string((index + attempt) % 3);
    }
    void on_response(const PeerId& peer, std::chrono::milliseconds rtt) override {
        responses.push_back(peer);
        last_rtt = rtt;
    }
    void on_timeout(const PeerId& peer) override { timeouts.push_back(peer); }

    bool no_peers = false;
    std::vector<PeerId> responses;
    std::vector<PeerId> timeouts;
    std::chrono::milliseconds last_rtt{0};
};

RequestPolicy test_policy() {
    RequestPolicy p;
    p.request_timeout = 100ms;
    p.backoff_base = 50ms;
    p.backoff_multiplier = 2.0;
    p.max_backoff = 1000ms;
    p.max_retries = 2;
    return p;
}

ChunkId chunk_at(BlockHeight height, ShardId shard = 0) {
    return ChunkId{height, shard, hash_of("chunk" + std::to_string(height) + "/" + std::to_string(shard))};
}

class PartRequesterTest : public ::testing::Test {
protected:
    PartRequesterTest() : requester_(selector_, test_policy()) {}

    RecordingSelector selector_;
    PartRequester requester_;
    const TimePoint t0_ = TimePoint{} + 10s;
};

}  // namespace

TEST_F(PartRequesterTest, TimeoutBackoffAndAbandon)
{
    const ChunkId id = chunk_at(7);
    auto first = requester_.request_missing(id, {2}, t0_);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].peer, "peer2");
    EXPECT_EQ(first[0].attempt, 0u);
    EXPECT_EQ(requester_.state(id, 2), PartRequestState::Requested);

    EXPECT_TRUE(requester_.tick(t0_ + 99ms).requests.empty());
    EXPECT_EQ(requester_.state(id, 2), PartRequestState::Requested);

    // First timeout: wait backoff_base before resending
    RequestPlan plan = requester_.tick(t0_ + 100ms);
    EXPECT_TRUE(plan.requests.empty());
    EXPECT_EQ(requester_.state(id, 2), PartRequestState::Retrying);
    EXPECT_EQ(requester_.outstanding(), 0u);
    ASSERT_EQ(selector_.timeouts.size(), 1u);
    EXPECT_EQ(selector_.timeouts[0], "peer2");

    EXPECT_TRUE(requester_.tick(t0_ + 149ms).requests.empty());
    plan = requester_.tick(t0_ + 150ms);
    ASSERT_EQ(plan.requests.size(), 1u);
    EXPECT_EQ(plan.requests[0].attempt, 1u);
    EXPECT_EQ(plan.requests[0].peer, "peer0");
    EXPECT_EQ(requester_.outstanding(), 1u);

    // Second timeout doubles the backoff
    EXPECT_TRUE(requester_.tick(t0_ + 250ms).requests.empty());
    EXPECT_TRUE(requester_.tick(t0_ + 349ms).requests.empty());
    plan = requester_.tick(t0_ + 350ms);
    ASSERT_EQ(plan.requests.size(), 1u);
    EXPECT_EQ(plan.requests[0].attempt, 2u);

    plan = requester_.tick(t0_ + 450ms);
    EXPECT_TRUE(plan.requests.empty());
    ASSERT_EQ(plan.abandoned.size(), 1u);
    EXPECT_EQ(plan.abandoned[0].chunk_id, id);
    EXPECT_EQ(plan.abandoned[0].part_index, 2u);
    EXPECT_EQ(requester_.state(id, 2), PartRequestState::Abandoned);
    EXPECT_EQ(selector_.timeouts.size(), 3u);

    // Terminal: neither ticks nor new requests revive it
    EXPECT_TRUE(requester_.tick(t0_ + 10s).abandoned.empty());
    EXPECT_TRUE(requester_.request_missing(id, {2}, t0_ + 10s).empty());
}

TEST_F(PartRequesterTest, BackoffIsCapped)
{
    RequestPolicy p = test_policy();
    p.max_retries = 10;
    p.backoff_base = 400ms;
    p.max_backoff = 500ms;
    PartRequester requester(selector_, p);

    const ChunkId id = chunk_at(3);
    requester.request_missing(id, {0}, t0_);
    requester.tick(t0_ + 100ms);                                   // timeout, resend at +500
    ASSERT_EQ(requester.tick(t0_ + 500ms).requests.size(), 1u);
    requester.tick(t0_ + 600ms);                                   // timeout, 800ms capped to 500
    EXPECT_TRUE(requester.tick(t0_ + 1099ms).requests.empty());
    EXPECT_EQ(requester.tick(t0_ + 1100ms).requests.size(), 1u);
}

TEST_F(PartRequesterTest, AtMostOneOutstandingRequestPerPart)
{
    const ChunkId id = chunk_at(5);
    EXPECT_EQ(requester_.request_missing(id, {0, 1, 2}, t0_).size(), 3u);
    EXPECT_TRUE(requester_.request_missing(id, {0, 1, 2}, t0_ + 10ms).empty());
    EXPECT_EQ(requester_.request_missing(id, {2, 3}, t0_ + 20ms).size(), 1u);
    EXPECT_EQ(requester_.outstanding(), 4u);

    // Retrying parts are not re-requested early either
    requester_.tick(t0_ + 100ms);
    EXPECT_EQ(requester_.state(id, 0), PartRequestState::Retrying);
    EXPECT_TRUE(requester_.request_missing(id, {0}, t0_ + 101ms).empty());
}

TEST_F(PartRequesterTest, ResponseStopsRetries)
{
    const ChunkId id = chunk_at(9);
    requester_.request_missing(id, {4}, t0_);

    EXPECT_TRUE(requester_.on_response(id, 4, t0_ + 30ms));
    EXPECT_EQ(requester_.state(id, 4), PartRequestState::Received);
    ASSERT_EQ(selector_.responses.size(), 1u);
    EXPECT_EQ(selector_.responses[0], "peer1");
    EXPECT_EQ(selector_.last_rtt, 30ms);
    EXPECT_EQ(requester_.outstanding(), 0u);

    EXPECT_FALSE(requester_.on_response(id, 4, t0_ + 40ms));
    EXPECT_FALSE(requester_.on_response(id, 5, t0_ + 40ms));

    RequestPlan plan = requester_.tick(t0_ + 5s);
    EXPECT_TRUE(plan.requests.empty());
    EXPECT_TRUE(plan.abandoned.empty());
    EXPECT_TRUE(selector_.timeouts.empty());
}

TEST_F(PartRequesterTest, ResponseDuringBackoffCountsAsReceived)
{
    const ChunkId id = chunk_at(9);
    requester_.request_missing(id, {0}, t0_);
    requester_.tick(t0_ + 100ms);
    EXPECT_TRUE(requester_.on_response(id, 0, t0_ + 120ms));
    EXPECT_TRUE(selector_.responses.empty());  // late answer, no RTT sample
    EXPECT_TRUE(requester_.tick(t0_ + 150ms).requests.empty());
}

TEST_F(PartRequesterTest, NoCandidateLeavesPartMissing)
{
    selector_.no_peers = true;
    const ChunkId id = chunk_at(2);
    EXPECT_TRUE(requester_.request_missing(id, {1}, t0_).empty());
    EXPECT_EQ(requester_.state(id, 1), PartRequestState::Missing);

    selector_.no_peers = false;
    EXPECT_EQ(requester_.request_missing(id, {1}, t0_ + 1s).size(), 1u);
}

TEST_F(PartRequesterTest, ForgetDropsTrackers)
{
    const ChunkId low = chunk_at(4);
    const ChunkId other_shard = chunk_at(4, 1);
    const ChunkId high = chunk_at(12);
    requester_.request_missing(low, {0, 1}, t0_);
    requester_.request_missing(other_shard, {0}, t0_);
    requester_.request_missing(high, {0}, t0_);
    EXPECT_EQ(requester_.tracked(), 4u);

    requester_.forget(low);
    EXPECT_EQ(requester_.tracked(), 2u);
    EXPECT_FALSE(requester_.state(low, 0).has_value());
    EXPECT_TRUE(requester_.state(other_shard, 0).has_value());

    requester_.forget_below(10);
    EXPECT_EQ(requester_.tracked(), 1u);
    EXPECT_TRUE(requester_.state(high, 0).has_value());

    // Nothing forgotten can time out later
    EXPECT_EQ(requester_.tick(t0_ + 1s).abandoned.size(), 0u);
    EXPECT_EQ(selector_.timeouts.size(), 1u);
}
