#include "peer_stats.hpp"
#include <numeric>

void PeerStats::request_sent(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_[peer].requests_sent++;
}

void PeerStats::response_received(const PeerId& peer, std::chrono::milliseconds rtt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = stats_[peer];
    s.responses_received++;

    s.rtt_history.push_back(static_cast<double>(rtt.count()));
    if (s.rtt_history.size() > MAX_HISTORY_SIZE) {
        s.rtt_history.pop_front();
    }
}

void PeerStats::request_timed_out(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_[peer].timeouts++;
}

double PeerStats::get_rtt(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(peer);
    if (it == stats_.end() || it->second.rtt_history.empty()) return -1.0;  // unknown

    const auto& h = it->second.rtt_history;
    return std::accumulate(h.begin(), h.end(), 0.0) / h.size();
}

double PeerStats::get_loss_rate(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(peer);
    if (it == stats_.end() || it->second.requests_sent == 0) return 0.0;

    const auto& s = it->second;
    return static_cast<double>(s.timeouts) / s.requests_sent;
}

int PeerStats::get_timeout_count(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(peer);
    return (it != stats_.end()) ? it->second.timeouts : 0;
}

std::vector<PeerId> PeerStats::get_high_loss_peers(double threshold) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerId> result;

    for (const auto& [peer, s] : stats_) {
        if (s.requests_sent > 0) {
            double loss_rate = static_cast<double>(s.timeouts) / s.requests_sent;
            if (loss_rate > threshold) {
                result.push_back(peer);
            }
        }
    }

    return result;
}
