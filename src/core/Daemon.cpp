#include "Daemon.hpp"

#include "../common/Paths.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QLocalSocket>

#include <print>

namespace parley {

    CDaemon::CDaemon(const Config& config, QObject* parent) :
        QObject(parent), m_config(config), m_registry(config.maxPending), m_bridge(m_registry), m_gateway(m_registry, m_bridge), m_eventQueue(EVENT_BACKLOG_SIZE),
        m_history(config.historyFile.isEmpty() ? historyFilePath() : config.historyFile, config.historyMaxRecords) {
        m_registry.setMaxRequestAge(config.maxRequestAgeMs);
        m_gateway.setIdleTimeout(config.idleTimeoutMs);
        m_gateway.setHeartbeatInterval(config.heartbeatMs);

        setupHandlers();

        connect(&m_bridge, &core::PresentationBridge::requestPresented, this, &CDaemon::onRequestPresented);
        connect(&m_bridge, &core::PresentationBridge::requestClosed, this, &CDaemon::onRequestClosed);
        connect(&m_bridge, &core::PresentationBridge::requestAnswered, this, &CDaemon::onRequestAnswered);
        connect(&m_ipcServer, &core::IpcServer::clientDisconnected, this, [this](QLocalSocket* socket) { m_eventQueue.removeWaiter(socket); });
    }

    CDaemon::~CDaemon() {
        stop();
    }

    bool CDaemon::start(const QString& socketPath, const QString& portFile) {
        if (m_running) {
            return true;
        }

        if (!m_gateway.start(m_config.port, m_config.sweepIntervalMs)) {
            m_errorString = QString("Gateway failed to bind 127.0.0.1:%1: %2").arg(m_config.port).arg(m_gateway.errorString());
            std::print(stderr, "{}\n", m_errorString.toStdString());
            return false;
        }

        if (!m_ipcServer.start(socketPath)) {
            m_errorString = QString("Failed to listen on %1: %2").arg(socketPath, m_ipcServer.errorString());
            std::print(stderr, "{}\n", m_errorString.toStdString());
            m_gateway.shutdown();
            return false;
        }

        if (m_config.historyEnabled && !m_history.load()) {
            std::print(stderr, "History unavailable: {}\n", m_history.errorString().toStdString());
        }

        m_portFile = portFile;
        if (!m_portFile.isEmpty() && !writePortFile(m_portFile, m_gateway.port())) {
            std::print(stderr, "Could not write port file {}\n", m_portFile.toStdString());
        }

        std::print("Gateway listening on 127.0.0.1:{}\n", m_gateway.port());
        std::print("Control socket: {}\n", socketPath.toStdString());

        m_running = true;
        return true;
    }

    void CDaemon::stop() {
        if (!m_running) {
            return;
        }
        m_running = false;

        std::print("Shutting down, {} request(s) pending\n", m_registry.size());

        m_gateway.shutdown();
        m_ipcServer.stop();

        if (!m_portFile.isEmpty()) {
            removePortFile(m_portFile);
        }
    }

    bool CDaemon::isRunning() const {
        return m_running;
    }

    QString CDaemon::errorString() const {
        return m_errorString;
    }

    core::RequestRegistry& CDaemon::registry() {
        return m_registry;
    }

    core::PresentationBridge& CDaemon::bridge() {
        return m_bridge;
    }

    core::Gateway& CDaemon::gateway() {
        return m_gateway;
    }

    core::HistoryStore& CDaemon::history() {
        return m_history;
    }

    void CDaemon::setupHandlers() {
        using namespace std::placeholders;

        m_router.registerHandler("ping", std::bind(&CDaemon::handlePing, this, _1, _2));
        m_router.registerHandler("subscribe", std::bind(&CDaemon::handleSubscribe, this, _1, _2));
        m_router.registerHandler("pending", std::bind(&CDaemon::handlePending, this, _1, _2));
        m_router.registerHandler("next", std::bind(&CDaemon::handleNext, this, _1, _2));
        m_router.registerHandler("history", std::bind(&CDaemon::handleHistory, this, _1, _2));
        m_router.registerHandler("history.clear", std::bind(&CDaemon::handleHistoryClear, this, _1, _2));
        m_router.registerRequestHandler("request.submit", std::bind(&CDaemon::handleSubmit, this, _1, _2, _3));
        m_router.registerRequestHandler("request.dismiss", std::bind(&CDaemon::handleDismiss, this, _1, _2, _3));

        m_ipcServer.setMessageHandler([this](QLocalSocket* socket, const QString& type, const QJsonObject& msg) {
            switch (m_router.dispatch(socket, type, msg)) {
                case core::MessageRouter::DispatchStatus::Handled: break;
                case core::MessageRouter::DispatchStatus::UnknownType:
                    sendError(socket, QString("Unknown message type: %1 (expected one of %2)").arg(type, m_router.types().join(", ")));
                    break;
                case core::MessageRouter::DispatchStatus::MissingId: sendError(socket, QString("%1 requires an id").arg(type)); break;
            }
        });
    }

    void CDaemon::handlePing(QLocalSocket* socket, const QJsonObject&) {
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "pong"}, {"version", VERSION}, {"pending", m_registry.size()}});
    }

    void CDaemon::handleSubscribe(QLocalSocket* socket, const QJsonObject&) {
        m_ipcServer.addSubscriber(socket);
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "subscribed"}});

        for (const QJsonObject& event : m_bridge.pendingEvents()) {
            m_ipcServer.sendJson(socket, event);
        }
    }

    void CDaemon::handlePending(QLocalSocket* socket, const QJsonObject&) {
        QJsonArray requests;
        for (const QJsonObject& event : m_bridge.pendingEvents()) {
            requests.append(event);
        }
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "pending"}, {"requests", requests}});
    }

    void CDaemon::handleNext(QLocalSocket* socket, const QJsonObject&) {
        if (!m_eventQueue.isEmpty()) {
            m_ipcServer.sendJson(socket, m_eventQueue.takeNext());
            return;
        }
        m_eventQueue.subscribeNext(socket);
    }

    void CDaemon::handleSubmit(QLocalSocket* socket, const QString& id, const QJsonObject& msg) {
        QString     error;
        const auto  answer = core::parseAnswer(msg.value("answer").toObject(), &error);
        if (!answer) {
            sendResult(socket, id, core::SubmitStatus::InvalidAnswer, error);
            return;
        }

        const core::SubmitStatus status = m_bridge.submitAnswer(id, *answer);
        if (status != core::SubmitStatus::Ok) {
            std::print("Answer for {} rejected: {}\n", id.toStdString(), core::submitStatusToString(status).toStdString());
        }
        sendResult(socket, id, status);
    }

    void CDaemon::handleDismiss(QLocalSocket* socket, const QString& id, const QJsonObject&) {
        sendResult(socket, id, m_bridge.dismiss(id));
    }

    void CDaemon::handleHistory(QLocalSocket* socket, const QJsonObject& msg) {
        if (!m_config.historyEnabled) {
            sendError(socket, "History is disabled");
            return;
        }

        const int     limit = qBound(1, msg.value("limit").toInt(DEFAULT_HISTORY_LIMIT), m_history.maxRecords());
        const QString query = msg.value("query").toString().trimmed();

        QJsonArray    records;
        for (const core::HistoryRecord& record : query.isEmpty() ? m_history.recent(limit) : m_history.search(query, limit)) {
            records.append(core::historyRecordToJson(record));
        }
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "history"}, {"records", records}, {"total", m_history.size()}});
    }

    void CDaemon::handleHistoryClear(QLocalSocket* socket, const QJsonObject&) {
        const int removed = m_history.size();
        if (!m_history.clear()) {
            sendError(socket, QString("Could not clear history: %1").arg(m_history.errorString()));
            return;
        }
        std::print("History cleared, {} record(s) removed\n", removed);
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "history.cleared"}, {"removed", removed}});
    }

    void CDaemon::onRequestPresented(const QString&, const QJsonObject& event) {
        m_ipcServer.broadcast(event);
        m_eventQueue.enqueue(event);
        m_eventQueue.drainToWaiters([this](QLocalSocket* socket, const QJsonObject& queued) { m_ipcServer.sendJson(socket, queued); });
    }

    void CDaemon::onRequestClosed(const QString& id, const QJsonObject& event) {
        m_eventQueue.discard(id);
        m_ipcServer.broadcast(event);
    }

    void CDaemon::onRequestAnswered(const QString& id, const core::Question& question, const core::Answer& answer) {
        if (!m_config.historyEnabled) {
            return;
        }
        if (!m_history.add(core::makeHistoryRecord(id, question, answer))) {
            qWarning() << "Could not record answer for" << id << ":" << m_history.errorString();
        }
    }

    void CDaemon::sendResult(QLocalSocket* socket, const QString& id, core::SubmitStatus status, const QString& message) {
        QJsonObject reply{{"type", "result"}, {"id", id}, {"ok", status == core::SubmitStatus::Ok}};
        if (status != core::SubmitStatus::Ok) {
            reply["error"]   = core::submitStatusToString(status);
            reply["message"] = message.isEmpty() ? m_bridge.describe(id, status) : message;
        }
        m_ipcServer.sendJson(socket, reply);
    }

    void CDaemon::sendError(QLocalSocket* socket, const QString& message) {
        m_ipcServer.sendJson(socket, QJsonObject{{"type", "error"}, {"message", message}});
    }

} // namespace parley
