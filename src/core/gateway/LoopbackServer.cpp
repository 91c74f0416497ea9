#include "LoopbackServer.hpp"

#include <QDebug>
#include <QTcpSocket>
#include <QTimer>

namespace parley::core {

    LoopbackServer::LoopbackServer(QObject* parent) : QTcpServer(parent) {}

    void LoopbackServer::setIdleTimeout(int timeoutMs) {
        m_idleTimeoutMs = qMax(1, timeoutMs);
    }

    QTcpSocket* LoopbackServer::connectionFor(quint16 peerPort) const {
        const auto it = m_connections.constFind(peerPort);
        return it == m_connections.constEnd() ? nullptr : it->socket;
    }

    int LoopbackServer::connectionCount() const {
        return static_cast<int>(m_connections.size());
    }

    void LoopbackServer::hold(QTcpSocket* socket) {
        if (Connection* connection = find(socket)) {
            connection->held = true;
            connection->idleTimer->stop();
        }
    }

    void LoopbackServer::release(QTcpSocket* socket) {
        if (Connection* connection = find(socket)) {
            connection->held = false;
            connection->idleTimer->start();
        }
    }

    void LoopbackServer::incomingConnection(qintptr socketDescriptor) {
        auto* socket = new QTcpSocket(this);
        if (!socket->setSocketDescriptor(socketDescriptor)) {
            qWarning() << "Failed to adopt gateway connection:" << socket->errorString();
            delete socket;
            return;
        }

        const quint16 peerPort = socket->peerPort();

        auto*         timer = new QTimer(socket);
        timer->setSingleShot(true);
        timer->setInterval(m_idleTimeoutMs);
        connect(timer, &QTimer::timeout, socket, [socket, peerPort]() {
            qDebug() << "Closing idle gateway connection from port" << peerPort;
            socket->abort();
        });

        // Registered before QHttpServer sees the socket, so these run ahead of its own handlers
        connect(socket, &QTcpSocket::readyRead, this, [this, peerPort]() {
            const auto it = m_connections.find(peerPort);
            if (it != m_connections.end() && !it->held) {
                it->idleTimer->start();
            }
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket, peerPort]() {
            const auto it = m_connections.find(peerPort);
            if (it != m_connections.end() && it->socket == socket) {
                m_connections.erase(it);
            }
            emit connectionClosed(socket);
        });

        m_connections.insert(peerPort, Connection{socket, timer, false});
        timer->start();

        addPendingConnection(socket);
    }

    LoopbackServer::Connection* LoopbackServer::find(QTcpSocket* socket) {
        if (!socket) {
            return nullptr;
        }

        // peerPort() is already 0 once the socket has disconnected
        for (auto it = m_connections.begin(); it != m_connections.end(); ++it) {
            if (it->socket == socket) {
                return &it.value();
            }
        }
        return nullptr;
    }

} // namespace parley::core
