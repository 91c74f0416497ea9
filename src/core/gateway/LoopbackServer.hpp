#pragma once

#include "../../common/Constants.hpp"

#include <QHash>
#include <QTcpServer>

class QTcpSocket;
class QTimer;

namespace parley::core {

    // TCP listener handed to QHttpServer. Keeps every accepted socket addressable
    // by its peer port so a suspended request can be tied to its connection, and
    // closes connections that stay silent for longer than the idle timeout.
    class LoopbackServer : public QTcpServer {
        Q_OBJECT

      public:
        explicit LoopbackServer(QObject* parent = nullptr);

        void        setIdleTimeout(int timeoutMs);

        QTcpSocket* connectionFor(quint16 peerPort) const;
        int         connectionCount() const;

        // A held connection is waiting for an answer and is never idle-closed
        void        hold(QTcpSocket* socket);
        void        release(QTcpSocket* socket);

      signals:
        void connectionClosed(QTcpSocket* socket);

      protected:
        void incomingConnection(qintptr socketDescriptor) override;

      private:
        struct Connection {
            QTcpSocket* socket    = nullptr;
            QTimer*     idleTimer = nullptr;
            bool        held      = false;
        };

        Connection*                 find(QTcpSocket* socket);

        QHash<quint16, Connection>  m_connections;
        int                         m_idleTimeoutMs = DEFAULT_IDLE_TIMEOUT_MS;
    };

} // namespace parley::core
