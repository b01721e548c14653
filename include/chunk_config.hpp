#ifndef SHARDCHUNK_CHUNK_CONFIG_HPP
#define SHARDCHUNK_CHUNK_CONFIG_HPP

#include "chunk_types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

constexpr int64_t DEFAULT_REQUEST_TIMEOUT_MS = 200;   // wait for a part response
constexpr int64_t DEFAULT_BACKOFF_BASE_MS = 100;      // first retry delay
constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
constexpr int64_t DEFAULT_MAX_BACKOFF_MS = 3000;
constexpr uint32_t DEFAULT_MAX_RETRIES = 4;
constexpr BlockHeight DEFAULT_RETENTION_WINDOW = 5;   // heights kept below head
constexpr size_t DEFAULT_MAX_FORWARDED_PARTS = 1024;  // parts cached before their header
constexpr BlockHeight DEFAULT_FORWARD_HORIZON = 5;     // heights above head a cached part may claim

struct RequestPolicy {
    std::chrono::milliseconds request_timeout{DEFAULT_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds backoff_base{DEFAULT_BACKOFF_BASE_MS};
    double backoff_multiplier = DEFAULT_BACKOFF_MULTIPLIER;
    std::chrono::milliseconds max_backoff{DEFAULT_MAX_BACKOFF_MS};
    uint32_t max_retries = DEFAULT_MAX_RETRIES;
};

struct AssemblerConfig {
    PeerId self_id;
    BlockHeight retention_window = DEFAULT_RETENTION_WINDOW;
    size_t max_forwarded_parts = DEFAULT_MAX_FORWARDED_PARTS;
    BlockHeight forward_horizon = DEFAULT_FORWARD_HORIZON;
    RequestPolicy request_policy;
};

#endif // SHARDCHUNK_CHUNK_CONFIG_HPP
