#pragma once

#include "../common/Constants.hpp"
#include "../core/Request.hpp"

#include <QJsonObject>
#include <QObject>
#include <QTimer>
#include <QUrl>

#include <optional>

class QNetworkAccessManager;
class QNetworkReply;

namespace parley::mcp {

    struct BridgeResult {
        enum class Kind {
            Answered,
            Cancelled,
            Unavailable,
            Rejected
        };

        Kind         kind = Kind::Unavailable;
        core::Answer answer;
        // Cancelled: "expired", "dismissed", "shutting_down", "caller_gone" or "caller_cancelled"
        QString      reason;
        // Unavailable/Rejected: what went wrong
        QString      error;
        int          httpStatus = 0;
    };

    // One outstanding POST /bridge/submit. Emits finished() exactly once.
    // Once the request is sent the gateway must produce data (headers or a
    // heartbeat chunk) at least every heartbeatTimeoutMs.
    class BridgeCall : public QObject {
        Q_OBJECT

      public:
        BridgeCall(const QUrl& submitUrl, const core::SubmitRequest& request, int connectTimeoutMs, int responseGraceMs, int heartbeatTimeoutMs,
                   QObject* parent = nullptr);
        ~BridgeCall() override;

        // Aborts the request; the gateway sees the disconnect and drops the entry
        void cancel();

        bool isFinished() const;

      signals:
        void finished(const parley::mcp::BridgeResult& result);

      private slots:
        void onReplyFinished();

      private:
        void                   finish(BridgeResult result);

        QNetworkAccessManager* m_manager = nullptr;
        QNetworkReply*         m_reply   = nullptr;
        QTimer                 m_connectTimer;
        QTimer                 m_responseTimer;
        QTimer                 m_heartbeatTimer;
        bool                   m_cancelled = false;
        bool                   m_timedOut  = false;
        bool                   m_finished  = false;
        QString                m_timeoutError;
    };

    // Dispatcher-side client for the loopback gateway
    class BridgeClient : public QObject {
        Q_OBJECT

      public:
        explicit BridgeClient(quint16 port, int connectTimeoutMs = DEFAULT_CONNECT_TIMEOUT_MS, int responseGraceMs = DEFAULT_RESPONSE_GRACE_MS,
                              int heartbeatTimeoutMs = DEFAULT_HEARTBEAT_TIMEOUT_MS, QObject* parent = nullptr);

        // The returned call is parented to this client; delete it once finished
        BridgeCall* ask(const core::Question& question, std::optional<qint64> deadlineMs = std::nullopt);

        // Blocking GET /health. On success the reply body is stored in *health.
        bool        checkHealth(int timeoutMs = HEALTH_CHECK_TIMEOUT_MS, QJsonObject* health = nullptr);

        quint16     port() const;
        QUrl        baseUrl() const;

      private:
        quint16 m_port;
        int     m_connectTimeoutMs;
        int     m_responseGraceMs;
        int     m_heartbeatTimeoutMs;
    };

} // namespace parley::mcp
