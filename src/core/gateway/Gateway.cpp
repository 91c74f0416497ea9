#include "Gateway.hpp"
#include "LoopbackServer.hpp"

#include <QDebug>
#include <QHostAddress>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponder>
#include <QHttpServerResponse>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTcpSocket>

#include <print>

namespace parley::core {

    namespace {

        using StatusCode = QHttpServerResponder::StatusCode;

        QHttpServerResponse errorResponse(const QString& message, StatusCode status) {
            return QHttpServerResponse(QJsonObject{{"status", "error"}, {"error", message}}, status);
        }

    } // namespace

    Gateway::Gateway(RequestRegistry& registry, PresentationBridge& bridge, QObject* parent) : QObject(parent), m_registry(registry), m_bridge(bridge) {
        connect(&m_sweepTimer, &QTimer::timeout, this, &Gateway::sweep);
        connect(&m_heartbeatTimer, &QTimer::timeout, this, &Gateway::sendHeartbeats);
        m_heartbeatTimer.setInterval(DEFAULT_HEARTBEAT_MS);
    }

    Gateway::~Gateway() {
        shutdown();
    }

    void Gateway::setIdleTimeout(int timeoutMs) {
        m_idleTimeoutMs = qMax(1, timeoutMs);
        if (m_tcpServer) {
            m_tcpServer->setIdleTimeout(m_idleTimeoutMs);
        }
    }

    void Gateway::setHeartbeatInterval(int intervalMs) {
        m_heartbeatTimer.setInterval(qMax(1, intervalMs));
    }

    bool Gateway::start(quint16 port, int sweepIntervalMs) {
        if (m_http) {
            return false;
        }

        auto* http      = new QHttpServer(this);
        auto* tcpServer = new LoopbackServer(http);
        tcpServer->setIdleTimeout(m_idleTimeoutMs);

        if (!tcpServer->listen(QHostAddress::LocalHost, port)) {
            m_errorString = tcpServer->errorString();
            delete http;
            return false;
        }
        if (!http->bind(tcpServer)) {
            m_errorString = "HTTP server could not take over the listener";
            delete http;
            return false;
        }

        m_http      = http;
        m_tcpServer = tcpServer;
        connect(m_tcpServer, &LoopbackServer::connectionClosed, this, &Gateway::onConnectionClosed);
        setupRoutes();

        m_shuttingDown = false;
        m_uptime.start();
        m_sweepTimer.start(qMax(1, sweepIntervalMs));
        m_heartbeatTimer.start();
        return true;
    }

    void Gateway::shutdown() {
        if (!m_http || m_shuttingDown) {
            return;
        }

        m_shuttingDown = true;
        m_sweepTimer.stop();
        m_heartbeatTimer.stop();
        m_tcpServer->close();

        const int cancelled = m_registry.cancelAll(CancelReason::ShuttingDown);
        if (cancelled > 0) {
            std::print("Gateway shutting down: cancelled {} pending request(s)\n", cancelled);
        }

        // Reply directly; the future watchers would only fire on the next event loop turn
        const Outcome               outcome = Cancellation{CancelReason::ShuttingDown};
        QList<QPointer<QTcpSocket>> sockets;
        for (auto it = m_waiting.begin(); it != m_waiting.end(); ++it) {
            sockets << it->socket;
            finishWaiter(it.value(), outcome);
        }
        m_waiting.clear();
        m_waitingBySocket.clear();

        for (const QPointer<QTcpSocket>& socket : std::as_const(sockets)) {
            if (!socket) {
                continue;
            }
            socket->flush();
            if (socket->bytesToWrite() > 0 && !socket->waitForBytesWritten(SHUTDOWN_FLUSH_TIMEOUT_MS)) {
                std::print(stderr, "Gateway: reply to port {} not flushed: {}\n", socket->peerPort(), socket->errorString().toStdString());
            }
            socket->disconnectFromHost();
        }
    }

    bool Gateway::isListening() const {
        return m_tcpServer && m_tcpServer->isListening();
    }

    quint16 Gateway::port() const {
        return m_tcpServer ? m_tcpServer->serverPort() : 0;
    }

    QString Gateway::errorString() const {
        return m_errorString;
    }

    int Gateway::waitingConnections() const {
        return static_cast<int>(m_waiting.size());
    }

    int Gateway::openConnections() const {
        return m_tcpServer ? m_tcpServer->connectionCount() : 0;
    }

    void Gateway::sweep() {
        m_registry.expireOlderThan(m_registry.now());
    }

    void Gateway::sendHeartbeats() {
        for (Waiter& waiter : m_waiting) {
            if (waiter.socket && waiter.socket->state() == QAbstractSocket::ConnectedState) {
                waiter.responder->writeChunk(QByteArrayLiteral(" "));
            }
        }
    }

    void Gateway::onConnectionClosed(QTcpSocket* socket) {
        const QString id = m_waitingBySocket.take(socket);
        if (id.isEmpty()) {
            return;
        }

        const auto it = m_waiting.find(id);
        if (it != m_waiting.end()) {
            it->watcher->disconnect(this);
            it->watcher->deleteLater();
            m_waiting.erase(it);
        }

        if (m_registry.cancel(id, CancelReason::CallerGone) == SubmitStatus::Ok) {
            std::print("> Caller for request {} disconnected, request cancelled\n", id.toStdString());
        }
    }

    void Gateway::setupRoutes() {
        m_http->route("/bridge/submit", [this](const QHttpServerRequest& request, QHttpServerResponder& responder) {
            if (request.method() != QHttpServerRequest::Method::Post) {
                responder.sendResponse(errorResponse("use POST", StatusCode::MethodNotAllowed));
                return;
            }
            handleSubmit(request, responder);
        });

        m_http->route("/health", [this](const QHttpServerRequest& request, QHttpServerResponder& responder) {
            if (request.method() != QHttpServerRequest::Method::Get) {
                responder.sendResponse(errorResponse("use GET", StatusCode::MethodNotAllowed));
                return;
            }
            handleHealth(responder);
        });

        m_http->setMissingHandler(this, [](const QHttpServerRequest& request, QHttpServerResponder& responder) {
            responder.sendResponse(errorResponse(QString("no route for %1").arg(request.url().path()), StatusCode::NotFound));
        });
    }

    void Gateway::handleSubmit(const QHttpServerRequest& request, QHttpServerResponder& responder) {
        if (m_shuttingDown) {
            responder.sendResponse(errorResponse("shutting down", StatusCode::ServiceUnavailable));
            return;
        }

        const QByteArray body = request.body();
        if (body.size() > static_cast<qsizetype>(MAX_HTTP_BODY_SIZE)) {
            responder.sendResponse(errorResponse(QString("request body exceeds %1 bytes").arg(MAX_HTTP_BODY_SIZE), StatusCode::PayloadTooLarge));
            return;
        }

        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(body, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            responder.sendResponse(errorResponse("Invalid JSON", StatusCode::BadRequest));
            return;
        }

        QString    validationError;
        const auto submit = parseSubmitRequest(doc.object(), &validationError);
        if (!submit) {
            responder.sendResponse(errorResponse(validationError, StatusCode::BadRequest));
            return;
        }

        Registration registration = m_registry.registerRequest(submit->question, submit->deadlineMs);
        if (registration.status == RegisterStatus::Full) {
            responder.sendResponse(errorResponse(QString("too many pending requests (max %1)").arg(m_registry.maxPending()), StatusCode::ServiceUnavailable));
            return;
        }

        const QString id = registration.id;

        Waiter        waiter;
        waiter.socket    = m_tcpServer->connectionFor(request.remotePort());
        waiter.responder = std::make_shared<QHttpServerResponder>(std::move(responder));
        waiter.watcher   = new QFutureWatcher<Outcome>(this);

        if (waiter.socket) {
            m_tcpServer->hold(waiter.socket);
            m_waitingBySocket.insert(waiter.socket.data(), id);
        } else {
            qWarning() << "No connection found for request" << id << "from port" << request.remotePort() << "- disconnects will go unnoticed";
        }

        // The status is fixed at registration; the outcome is the last chunk
        waiter.responder->writeBeginChunked(QByteArrayLiteral("application/json"));

        connect(waiter.watcher, &QFutureWatcher<Outcome>::finished, this, [this, id]() { onOutcomeReady(id); });
        m_waiting.insert(id, waiter);
        waiter.watcher->setFuture(registration.future);

        std::print("> Request {} registered ({} pending)\n", id.toStdString(), m_registry.size());
        m_bridge.onNewRequest(id, submit->question);
    }

    void Gateway::handleHealth(QHttpServerResponder& responder) {
        responder.sendResponse(QHttpServerResponse(QJsonObject{{"status", "healthy"},
                                                               {"version", QString::fromLatin1(VERSION)},
                                                               {"uptime_seconds", static_cast<double>(m_uptime.elapsed() / 1000)},
                                                               {"pending", m_registry.size()},
                                                               {"max_pending", m_registry.maxPending()}}));
    }

    void Gateway::onOutcomeReady(const QString& id) {
        const auto it = m_waiting.find(id);
        if (it == m_waiting.end()) {
            return;
        }

        Waiter waiter = it.value();
        m_waiting.erase(it);

        const QFuture<Outcome> future  = waiter.watcher->future();
        const Outcome          outcome = (future.isCanceled() || future.resultCount() == 0) ? Outcome{Cancellation{CancelReason::ShuttingDown}} : future.result();
        finishWaiter(waiter, outcome);
    }

    void Gateway::finishWaiter(Waiter& waiter, const Outcome& outcome) {
        if (waiter.watcher) {
            waiter.watcher->disconnect(this);
            waiter.watcher->deleteLater();
            waiter.watcher = nullptr;
        }

        if (waiter.socket) {
            m_waitingBySocket.remove(waiter.socket.data());
            if (waiter.socket->state() == QAbstractSocket::ConnectedState) {
                waiter.responder->writeEndChunked(QJsonDocument(outcomeToJson(outcome)).toJson(QJsonDocument::Compact));
                m_tcpServer->release(waiter.socket);
            }
        }
        waiter.responder.reset();
    }

} // namespace parley::core
