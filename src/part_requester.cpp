#include "part_requester.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std::chrono;

PartRequester::PartRequester(PeerSelector& selector, RequestPolicy policy)
    : selector_(selector), policy_(policy) {}

milliseconds PartRequester::backoff_for(uint32_t attempt) const {
    double factor = std::pow(policy_.backoff_multiplier, attempt > 0 ? attempt - 1 : 0);
    double ms = static_cast<double>(policy_.backoff_base.count()) * factor;
    ms = std::min(ms, static_cast<double>(policy_.max_backoff.count()));
    return milliseconds(static_cast<int64_t>(ms));
}

bool PartRequester::issue(const Key& key, Tracker& t, TimePoint now, std::vector<PartRequest>& out) {
    auto peer = selector_.select(key.first, key.second, t.attempt);
    if (!peer) return false;

    t.peer = *peer;
    t.in_flight = true;
    t.sent_at = now;
    t.deadline = now + policy_.request_timeout;
    out.push_back(PartRequest{*peer, key.first, key.second, t.attempt});
    return true;
}

std::vector<PartRequest> PartRequester::request_missing(const ChunkId& id, const std::set<PartIndex>& missing,
                                                        TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PartRequest> out;

    for (PartIndex index : missing) {
        Key key{id, index};
        Tracker& t = trackers_[key];
        if (t.state != PartRequestState::Missing) continue;  // already live or terminal
        if (issue(key, t, now, out)) t.state = PartRequestState::Requested;
    }
    return out;
}

bool PartRequester::on_response(const ChunkId& id, PartIndex index, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(Key{id, index});
    if (it == trackers_.end()) return false;

    Tracker& t = it->second;
    if (t.state != PartRequestState::Requested && t.state != PartRequestState::Retrying) return false;

    if (t.in_flight) selector_.on_response(t.peer, duration_cast<milliseconds>(now - t.sent_at));
    t.state = PartRequestState::Received;
    t.in_flight = false;
    return true;
}

RequestPlan PartRequester::tick(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequestPlan plan;

    for (auto& [key, t] : trackers_) {
        switch (t.state) {
            case PartRequestState::Requested:
            case PartRequestState::Retrying:
                break;
            default:
                continue;
        }
        if (now < t.deadline) continue;

        if (t.in_flight) {
            // Response deadline passed
            selector_.on_timeout(t.peer);
            t.in_flight = false;

            if (t.attempt >= policy_.max_retries) {
                t.state = PartRequestState::Abandoned;
                plan.abandoned.push_back(AbandonedPart{key.first, key.second});
                std::cerr << "[REQUEST] Abandoned part " << key.second << " of " << to_string(key.first)
                          << " after " << (t.attempt + 1) << " attempts" << std::endl;
                continue;
            }

            t.attempt++;
            t.state = PartRequestState::Retrying;
            t.deadline = now + backoff_for(t.attempt);
            continue;
        }

        // Backoff elapsed: re-issue, to the next candidate if the selector rotates
        if (!issue(key, t, now, plan.requests)) {
            t.deadline = now + backoff_for(t.attempt);
        }
    }
    return plan;
}

void PartRequester::forget(const ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.lower_bound(Key{id, 0});
    while (it != trackers_.end() && it->first.first == id) it = trackers_.erase(it);
}

void PartRequester::forget_below(BlockHeight floor) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = trackers_.begin(); it != trackers_.end();) {
        if (it->first.first.height < floor) it = trackers_.erase(it);
        else ++it;
    }
}

std::optional<PartRequestState> PartRequester::state(const ChunkId& id, PartIndex index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(Key{id, index});
    if (it == trackers_.end()) return std::nullopt;
    return it->second.state;
}

size_t PartRequester::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(trackers_.begin(), trackers_.end(),
                         [](const auto& kv) { return kv.second.in_flight; });
}

size_t PartRequester::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackers_.size();
}
