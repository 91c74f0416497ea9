#include "IpcServer.hpp"
#include "../../common/Constants.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace parley::core {

    IpcServer::IpcServer(QObject* parent) : QObject(parent) {}

    IpcServer::~IpcServer() {
        stop();
    }

    bool IpcServer::start(const QString& socketPath) {
        if (m_server) {
            return false;
        }

        QLocalServer::removeServer(socketPath);

        m_server = new QLocalServer(this);
        m_server->setSocketOptions(QLocalServer::UserAccessOption);

        if (!m_server->listen(socketPath)) {
            m_errorString = m_server->errorString();
            delete m_server;
            m_server = nullptr;
            return false;
        }

        connect(m_server, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);
        return true;
    }

    void IpcServer::stop() {
        if (!m_server) {
            return;
        }

        m_subscribers.clear();
        for (auto* socket : m_buffers.keys()) {
            socket->disconnect(this);
            socket->disconnectFromServer();
            socket->deleteLater();
        }
        m_buffers.clear();

        m_server->close();
        delete m_server;
        m_server = nullptr;
    }

    void IpcServer::setMessageHandler(MessageHandler handler) {
        m_handler = std::move(handler);
    }

    void IpcServer::sendJson(QLocalSocket* socket, const QJsonObject& json) {
        if (!socket || socket->state() != QLocalSocket::ConnectedState) {
            return;
        }

        QByteArray data = QJsonDocument(json).toJson(QJsonDocument::Compact);
        data.append('\n');

        socket->write(data);
        socket->flush();
    }

    void IpcServer::addSubscriber(QLocalSocket* socket) {
        if (socket && m_buffers.contains(socket)) {
            m_subscribers.insert(socket);
        }
    }

    void IpcServer::broadcast(const QJsonObject& json) {
        for (QLocalSocket* socket : std::as_const(m_subscribers)) {
            sendJson(socket, json);
        }
    }

    QList<QLocalSocket*> IpcServer::subscribers() const {
        return m_subscribers.values();
    }

    QString IpcServer::errorString() const {
        return m_errorString;
    }

    void IpcServer::onNewConnection() {
        while (m_server->hasPendingConnections()) {
            QLocalSocket* socket = m_server->nextPendingConnection();
            if (!socket) {
                continue;
            }

            m_buffers[socket] = QByteArray();

            connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
            connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);

            emit clientConnected(socket);
        }
    }

    void IpcServer::onReadyRead() {
        auto* socket = qobject_cast<QLocalSocket*>(sender());
        if (!socket) {
            return;
        }

        QByteArray& buffer = m_buffers[socket];
        buffer.append(socket->readAll());

        if (buffer.size() > static_cast<qsizetype>(MAX_MESSAGE_SIZE)) {
            sendJson(socket, QJsonObject{{"type", "error"}, {"message", "Message too large"}});
            socket->disconnectFromServer();
            return;
        }

        qsizetype idx;
        while ((idx = buffer.indexOf('\n')) != -1) {
            QByteArray line = buffer.left(idx).trimmed();
            buffer.remove(0, idx + 1);

            if (!line.isEmpty()) {
                handleLine(socket, line);
            }

            // The handler may have closed the socket
            if (!m_buffers.contains(socket)) {
                return;
            }
        }
    }

    void IpcServer::onDisconnected() {
        auto* socket = qobject_cast<QLocalSocket*>(sender());
        if (!socket) {
            return;
        }

        m_buffers.remove(socket);
        m_subscribers.remove(socket);
        emit clientDisconnected(socket);

        socket->deleteLater();
    }

    void IpcServer::handleLine(QLocalSocket* socket, const QByteArray& line) {
        if (!m_handler) {
            return;
        }

        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(line, &parseError);

        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            sendJson(socket, QJsonObject{{"type", "error"}, {"message", "Invalid JSON"}});
            return;
        }

        const QJsonObject obj  = doc.object();
        const QString     type = obj.value("type").toString();

        if (type.isEmpty()) {
            sendJson(socket, QJsonObject{{"type", "error"}, {"message", "Missing type field"}});
            return;
        }

        m_handler(socket, type, obj);
    }

} // namespace parley::core
