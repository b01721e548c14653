#include "peer_selector.hpp"
#include <algorithm>
#include <iostream>

// ---------------------- OwnerRotationSelector ----------------------

OwnerRotationSelector::OwnerRotationSelector(PartCandidatesFn candidates)
    : candidates_(std::move(candidates)) {}

std::optional<PeerId> OwnerRotationSelector::select(const ChunkId& id, PartIndex index, uint32_t attempt) {
    std::vector<PeerId> peers = candidates_(id, index);
    if (peers.empty()) return std::nullopt;
    return peers[attempt % peers.size()];
}

// ---------------------- WeightedPeerSelector ----------------------

WeightedPeerSelector::WeightedPeerSelector(PartCandidatesFn candidates, uint32_t seed)
    : candidates_(std::move(candidates)), rng_(seed) {}

int WeightedPeerSelector::weight(const PeerId& peer) const {
    double rtt = stats_.get_rtt(peer);
    if (rtt < 0) rtt = DEFAULT_RTT_MS;
    double loss = stats_.get_loss_rate(peer);
    double score = 1000.0 / (rtt + 1.0) * (1.0 - std::min(loss, 1.0));
    return std::max(1, static_cast<int>(score));
}

std::optional<PeerId> WeightedPeerSelector::select(const ChunkId& id, PartIndex index, uint32_t attempt) {
    std::vector<PeerId> peers = candidates_(id, index);
    if (peers.empty()) return std::nullopt;

    // The owner gets the first ask
    if (attempt == 0) return peers.front();

    std::vector<int> cumulative_weights;
    int total_weight = 0;
    for (const auto& p : peers) {
        total_weight += weight(p);
        cumulative_weights.push_back(total_weight);
    }

    std::uniform_int_distribution<int> dist(1, total_weight);
    int r = dist(rng_);

    for (size_t i = 0; i < cumulative_weights.size(); ++i) {
        if (r <= cumulative_weights[i]) return peers[i];
    }
    return peers.back();
}

void WeightedPeerSelector::on_response(const PeerId& peer, std::chrono::milliseconds rtt) {
    stats_.request_sent(peer);
    stats_.response_received(peer, rtt);
}

void WeightedPeerSelector::on_timeout(const PeerId& peer) {
    stats_.request_sent(peer);
    stats_.request_timed_out(peer);
    if (stats_.get_timeout_count(peer) % 10 == 0) {
        std::cerr << "[REQUEST] Peer " << peer << " has timed out " << stats_.get_timeout_count(peer)
                  << " times, loss rate " << stats_.get_loss_rate(peer) << std::endl;
    }
}
