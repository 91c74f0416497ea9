#pragma once

#include "../common/Config.hpp"
#include "bridge/PresentationBridge.hpp"
#include "gateway/Gateway.hpp"
#include "history/HistoryStore.hpp"
#include "ipc/EventQueue.hpp"
#include "ipc/IpcServer.hpp"
#include "ipc/MessageRouter.hpp"
#include "registry/RequestRegistry.hpp"

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <memory>

class QLocalSocket;

namespace parley {

    // Owns the long-lived pieces of the daemon: the registry, the bridge,
    // the HTTP gateway and the control socket that UIs and the CLI talk to.
    class CDaemon : public QObject {
        Q_OBJECT

      public:
        explicit CDaemon(const Config& config, QObject* parent = nullptr);
        ~CDaemon() override;

        // Starts the gateway and the control socket. An empty portFile skips
        // publishing the bound port.
        bool                      start(const QString& socketPath, const QString& portFile);

        // Answers every waiting caller with "shutting_down" and closes both listeners
        void                      stop();

        bool                      isRunning() const;
        QString                   errorString() const;

        core::RequestRegistry&    registry();
        core::PresentationBridge& bridge();
        core::Gateway&            gateway();
        core::HistoryStore&       history();

      private:
        void                      setupHandlers();

        void                      handlePing(QLocalSocket* socket, const QJsonObject& msg);
        void                      handleSubscribe(QLocalSocket* socket, const QJsonObject& msg);
        void                      handlePending(QLocalSocket* socket, const QJsonObject& msg);
        void                      handleNext(QLocalSocket* socket, const QJsonObject& msg);
        void                      handleSubmit(QLocalSocket* socket, const QString& id, const QJsonObject& msg);
        void                      handleDismiss(QLocalSocket* socket, const QString& id, const QJsonObject& msg);
        void                      handleHistory(QLocalSocket* socket, const QJsonObject& msg);
        void                      handleHistoryClear(QLocalSocket* socket, const QJsonObject& msg);

        void                      onRequestPresented(const QString& id, const QJsonObject& event);
        void                      onRequestClosed(const QString& id, const QJsonObject& event);
        void                      onRequestAnswered(const QString& id, const core::Question& question, const core::Answer& answer);

        void                      sendResult(QLocalSocket* socket, const QString& id, core::SubmitStatus status, const QString& message = {});
        void                      sendError(QLocalSocket* socket, const QString& message);

        Config                    m_config;
        core::RequestRegistry     m_registry;
        core::PresentationBridge  m_bridge;
        core::Gateway             m_gateway;
        core::IpcServer           m_ipcServer;
        core::MessageRouter       m_router;
        core::EventQueue          m_eventQueue;
        core::HistoryStore        m_history;
        QString                   m_portFile;
        QString                   m_errorString;
        bool                      m_running = false;
    };

    inline std::unique_ptr<CDaemon> g_pDaemon;

} // namespace parley
