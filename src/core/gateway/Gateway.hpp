#pragma once

#include "../bridge/PresentationBridge.hpp"
#include "../registry/RequestRegistry.hpp"

#include <QElapsedTimer>
#include <QFutureWatcher>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QTimer>

#include <memory>

class QHttpServer;
class QHttpServerRequest;
class QHttpServerResponder;
class QTcpSocket;

namespace parley::core {

    class LoopbackServer;

    // Loopback HTTP endpoint that turns "POST /bridge/submit" into a registry
    // entry and holds the connection open until the entry is settled. While a
    // caller waits, the reply is a chunked 200 that carries a one-space
    // heartbeat chunk every heartbeat interval and ends with the outcome.
    class Gateway : public QObject {
        Q_OBJECT

      public:
        Gateway(RequestRegistry& registry, PresentationBridge& bridge, QObject* parent = nullptr);
        ~Gateway() override;

        // Both apply to connections accepted after the call
        void    setIdleTimeout(int timeoutMs);
        void    setHeartbeatInterval(int intervalMs);

        // Binds 127.0.0.1:port (0 picks a free port). Returns false if binding fails.
        bool    start(quint16 port, int sweepIntervalMs = DEFAULT_SWEEP_INTERVAL_MS);

        // Cancels every outstanding request, replies "cancelled: shutting_down"
        // to each waiting caller and stops listening.
        void    shutdown();

        bool    isListening() const;
        quint16 port() const;
        QString errorString() const;
        int     waitingConnections() const;
        int     openConnections() const;

      private slots:
        void sweep();
        void sendHeartbeats();
        void onConnectionClosed(QTcpSocket* socket);

      private:
        struct Waiter {
            QPointer<QTcpSocket>                  socket;
            std::shared_ptr<QHttpServerResponder> responder;
            QFutureWatcher<Outcome>*              watcher = nullptr;
        };

        void                        setupRoutes();
        void                        handleSubmit(const QHttpServerRequest& request, QHttpServerResponder& responder);
        void                        handleHealth(QHttpServerResponder& responder);
        void                        onOutcomeReady(const QString& id);
        void                        finishWaiter(Waiter& waiter, const Outcome& outcome);

        RequestRegistry&            m_registry;
        PresentationBridge&         m_bridge;
        QHttpServer*                m_http      = nullptr;
        LoopbackServer*             m_tcpServer = nullptr;
        QTimer                      m_sweepTimer;
        QTimer                      m_heartbeatTimer;
        QElapsedTimer               m_uptime;
        QString                     m_errorString;
        QHash<QString, Waiter>      m_waiting;
        QHash<QTcpSocket*, QString> m_waitingBySocket;
        int                         m_idleTimeoutMs = DEFAULT_IDLE_TIMEOUT_MS;
        bool                        m_shuttingDown  = false;
    };

} // namespace parley::core
