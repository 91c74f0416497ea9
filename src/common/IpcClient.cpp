#include "IpcClient.hpp"
#include "Constants.hpp"

#include <QJsonDocument>
#include <QLocalSocket>

namespace parley {

    IpcClient::IpcClient(const QString& socketPath) : m_socketPath(socketPath) {}

    std::optional<QJsonObject> IpcClient::sendRequest(const QJsonObject& request, int timeoutMs) {
        m_lastError.clear();

        QLocalSocket socket;
        socket.connectToServer(m_socketPath);

        if (!socket.waitForConnected(IPC_CONNECT_TIMEOUT_MS)) {
            m_lastError = QString("cannot connect to %1: %2").arg(m_socketPath, socket.errorString());
            return std::nullopt;
        }

        QByteArray data = QJsonDocument(request).toJson(QJsonDocument::Compact);
        data.append('\n');

        if (socket.write(data) == -1 || !socket.waitForBytesWritten(IPC_WRITE_TIMEOUT_MS)) {
            m_lastError = QString("write failed: %1").arg(socket.errorString());
            return std::nullopt;
        }

        // Read until we get a complete line
        while (!socket.canReadLine()) {
            if (!socket.waitForReadyRead(timeoutMs)) {
                m_lastError = socket.state() == QLocalSocket::ConnectedState ? QString("timed out waiting for reply") : QString("daemon closed the connection");
                return std::nullopt;
            }
        }

        const QByteArray replyLine = socket.readLine().trimmed();
        if (replyLine.isEmpty()) {
            m_lastError = "empty reply";
            return std::nullopt;
        }

        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(replyLine, &parseError);

        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            m_lastError = QString("invalid reply: %1").arg(parseError.errorString());
            return std::nullopt;
        }

        return doc.object();
    }

    bool IpcClient::ping() {
        auto response = sendRequest(QJsonObject{{"type", "ping"}}, IPC_READ_TIMEOUT_MS);
        return response && response->value("type").toString() == "pong";
    }

    QString IpcClient::lastError() const {
        return m_lastError;
    }

} // namespace parley
