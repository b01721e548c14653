#pragma once

#include "chunk_types.hpp"
#include "peer_stats.hpp"

#include <functional>
#include <optional>
#include <random>
#include <vector>

// Candidate holders of a part, in preference order. The first entry is the
// part's designated owner; the assignment itself lives outside this engine.
using PartCandidatesFn = std::function<std::vector<PeerId>(const ChunkId&, PartIndex)>;

// Decides whom to ask for a part. attempt = 0 for the first request.
class PeerSelector {
public:
    virtual ~PeerSelector() = default;
    virtual std::optional<PeerId> select(const ChunkId& id, PartIndex index, uint32_t attempt) = 0;

    virtual void on_response(const PeerId& /*peer*/, std::chrono::milliseconds /*rtt*/) {}
    virtual void on_timeout(const PeerId& /*peer*/) {}
};

// First owner, then rotate through the remaining candidates on retry
class OwnerRotationSelector : public PeerSelector {
public:
    explicit OwnerRotationSelector(PartCandidatesFn candidates);

    std::optional<PeerId> select(const ChunkId& id, PartIndex index, uint32_t attempt) override;

private:
    PartCandidatesFn candidates_;
};

// Weighted random choice among candidates; weight grows with low RTT and low loss
class WeightedPeerSelector : public PeerSelector {
public:
    static constexpr double DEFAULT_RTT_MS = 50.0;  // until a peer has answered once

    WeightedPeerSelector(PartCandidatesFn candidates, uint32_t seed = std::random_device{}());

    std::optional<PeerId> select(const ChunkId& id, PartIndex index, uint32_t attempt) override;
    void on_response(const PeerId& peer, std::chrono::milliseconds rtt) override;
    void on_timeout(const PeerId& peer) override;

    int weight(const PeerId& peer) const;
    const PeerStats& stats() const { return stats_; }

private:
    PartCandidatesFn candidates_;
    PeerStats stats_;
    std::mt19937 rng_;
};
