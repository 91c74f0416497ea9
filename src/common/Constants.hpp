#pragma once

#include <QtGlobal>

#include <cstddef>

namespace parley {

    inline constexpr const char* VERSION = "1.0.0";

    // Gateway
    inline constexpr quint16     DEFAULT_GATEWAY_PORT       = 15177;
    inline constexpr int         DEFAULT_SWEEP_INTERVAL_MS  = 200;
    inline constexpr int         DEFAULT_MAX_PENDING        = 100;
    inline constexpr std::size_t MAX_HTTP_BODY_SIZE         = 4 * 1024 * 1024;  // 4 MiB
    inline constexpr int         DEFAULT_IDLE_TIMEOUT_MS    = 10000;
    inline constexpr int         DEFAULT_HEARTBEAT_MS       = 10000;
    inline constexpr int         SHUTDOWN_FLUSH_TIMEOUT_MS  = 500;

    // Question / answer limits
    inline constexpr std::size_t MAX_QUESTION_TEXT_SIZE     = 1024 * 1024;      // 1 MiB
    inline constexpr int         MAX_CHOICES                = 20;
    inline constexpr std::size_t MAX_ANSWER_SIZE            = 10 * 1024 * 1024; // 10 MiB

    // Control socket
    inline constexpr std::size_t MAX_MESSAGE_SIZE           = 16 * 1024 * 1024; // 16 MiB
    inline constexpr int         IPC_CONNECT_TIMEOUT_MS     = 1000;
    inline constexpr int         IPC_READ_TIMEOUT_MS        = 1000;
    inline constexpr int         IPC_WRITE_TIMEOUT_MS       = 1000;
    inline constexpr int         EVENT_BACKLOG_SIZE         = 256;

    // Registry
    inline constexpr int         REGISTRY_SHARDS            = 16;
    inline constexpr int         TOMBSTONES_PER_SHARD       = 256;

    // Dispatcher-side client
    inline constexpr int         DEFAULT_CONNECT_TIMEOUT_MS = 2000;
    inline constexpr int         DEFAULT_RESPONSE_GRACE_MS  = 5000;
    inline constexpr int         DEFAULT_HEARTBEAT_TIMEOUT_MS = 3 * DEFAULT_HEARTBEAT_MS;
    inline constexpr int         HEALTH_CHECK_TIMEOUT_MS    = 1000;

    // Interaction history
    inline constexpr int         MAX_HISTORY_RECORDS        = 100;
    inline constexpr int         DEFAULT_HISTORY_LIMIT      = 20;

} // namespace parley
