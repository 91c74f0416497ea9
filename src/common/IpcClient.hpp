#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace parley {

    // Blocking client for the daemon control socket, used by the CLI
    class IpcClient {
      public:
        explicit IpcClient(const QString& socketPath);

        // Send one JSON message and wait for the first reply line.
        // Returns std::nullopt on connection/timeout/parse failure; lastError() says which.
        // A negative timeout waits forever (used for the "next" long poll).
        std::optional<QJsonObject> sendRequest(const QJsonObject& request, int timeoutMs = IPC_DEFAULT_TIMEOUT_MS);

        bool                       ping();

        QString                    lastError() const;

      private:
        static constexpr int IPC_DEFAULT_TIMEOUT_MS = 5000;

        QString              m_socketPath;
        QString              m_lastError;
    };

} // namespace parley
