#pragma once

#include "Constants.hpp"

#include <QString>

#include <optional>

namespace parley {

    struct Config {
        // [gateway]
        quint16 port             = DEFAULT_GATEWAY_PORT;
        int     sweepIntervalMs  = DEFAULT_SWEEP_INTERVAL_MS;
        int     maxPending       = DEFAULT_MAX_PENDING;
        qint64  maxRequestAgeMs  = 0; // 0 disables age-based expiry
        int     idleTimeoutMs    = DEFAULT_IDLE_TIMEOUT_MS;
        int     heartbeatMs      = DEFAULT_HEARTBEAT_MS;

        // [client]
        int     connectTimeoutMs   = DEFAULT_CONNECT_TIMEOUT_MS;
        int     responseGraceMs    = DEFAULT_RESPONSE_GRACE_MS;
        int     heartbeatTimeoutMs = DEFAULT_HEARTBEAT_TIMEOUT_MS;

        // [history]
        bool    historyEnabled    = true;
        QString historyFile; // empty means historyFilePath()
        int     historyMaxRecords = MAX_HISTORY_RECORDS;

        // Loads the INI file at path (missing keys keep their defaults),
        // then applies the PARLEY_PORT environment override.
        static Config load(const QString& path);
        static Config load();
    };

    // Port file published by the daemon so clients can find an ephemeral port
    std::optional<quint16> readPortFile(const QString& path);
    bool                   writePortFile(const QString& path, quint16 port);
    void                   removePortFile(const QString& path);

    // Gateway port for the dispatcher side: explicit > PARLEY_PORT > port file > config
    quint16 resolveClientPort(const Config& config, std::optional<quint16> explicitPort, const QString& portFile);

} // namespace parley
