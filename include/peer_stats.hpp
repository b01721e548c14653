#ifndef SHARDCHUNK_PEER_STATS_HPP
#define SHARDCHUNK_PEER_STATS_HPP

#include "chunk_types.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

// Per-peer response tracking for part requests: RTT history and
// request/response/timeout counters.
class PeerStats {
public:
    static constexpr size_t MAX_HISTORY_SIZE = 10;

    void request_sent(const PeerId& peer);
    void response_received(const PeerId& peer, std::chrono::milliseconds rtt);
    void request_timed_out(const PeerId& peer);

    double get_rtt(const PeerId& peer) const;      // average over history, -1.0 if unknown
    double get_loss_rate(const PeerId& peer) const;
    int get_timeout_count(const PeerId& peer) const;
    std::vector<PeerId> get_high_loss_peers(double threshold = 0.5) const;

private:
    struct Stats {
        uint64_t requests_sent = 0;
        uint64_t responses_received = 0;
        int timeouts = 0;
        std::deque<double> rtt_history;
    };

    mutable std::mutex mutex_;
    std::unordered_map<PeerId, Stats> stats_;
};

#endif // SHARDCHUNK_PEER_STATS_HPP
