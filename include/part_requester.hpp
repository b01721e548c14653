#pragma once

#include "chunk_config.hpp"
#include "chunk_types.hpp"
#include "peer_selector.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum class PartRequestState {
    Missing,    // needed, no candidate holder known yet
    Requested,  // one request outstanding
    Retrying,   // previous request timed out; re-issued after backoff
    Received,   // a response arrived
    Abandoned   // retries exhausted
};

struct PartRequest {
    PeerId peer;
    ChunkId chunk_id;
    PartIndex part_index = 0;
    uint32_t attempt = 0;
};

struct AbandonedPart {
    ChunkId chunk_id;
    PartIndex part_index = 0;
};

// Result of one tick: requests to put on the wire and parts given up on
struct RequestPlan {
    std::vector<PartRequest> requests;
    std::vector<AbandonedPart> abandoned;
};

// Retry/backoff state machine per (chunk, part). Owns no timers: time only
// moves through the `now` arguments. At most one request per part is ever
// outstanding.
class PartRequester {
public:
    PartRequester(PeerSelector& selector, RequestPolicy policy = RequestPolicy{});

    // Missing -> Requested for every index without live state
    std::vector<PartRequest> request_missing(const ChunkId& id, const std::set<PartIndex>& missing,
                                             TimePoint now);

    // Requested/Retrying -> Received. Returns false if nothing was outstanding.
    bool on_response(const ChunkId& id, PartIndex index, TimePoint now);

    // Advance every timer that is due: timeouts, backoff expiry, abandonment
    RequestPlan tick(TimePoint now);

    void forget(const ChunkId& id);
    void forget_below(BlockHeight floor);

    std::optional<PartRequestState> state(const ChunkId& id, PartIndex index) const;
    size_t outstanding() const;
    size_t tracked() const;

private:
    struct Tracker {
        PartRequestState state = PartRequestState::Missing;
        uint32_t attempt = 0;
        PeerId peer;
        bool in_flight = false;
        TimePoint sent_at{};
        TimePoint deadline{};  // response deadline if in flight, else resend time
    };

    using Key = std::pair<ChunkId, PartIndex>;

    std::chrono::milliseconds backoff_for(uint32_t attempt) const;
    bool issue(const Key& key, Tracker& t, TimePoint now, std::vector<PartRequest>& out);

    PeerSelector& selector_;
    RequestPolicy policy_;

    mutable std::mutex mutex_;
    std::map<Key, Tracker> trackers_;
};
