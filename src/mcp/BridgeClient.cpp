#include "BridgeClient.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <limits>

namespace parley::mcp {

    namespace {

        QNetworkRequest jsonRequest(const QUrl& url) {
            QNetworkRequest request(url);
            request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
            request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
            return request;
        }

    } // namespace

    BridgeCall::BridgeCall(const QUrl& submitUrl, const core::SubmitRequest& request, int connectTimeoutMs, int responseGraceMs, int heartbeatTimeoutMs,
                           QObject* parent) :
        QObject(parent), m_manager(new QNetworkAccessManager(this)) {
        // The gateway is always on loopback; never route it through a proxy from the environment
        m_manager->setProxy(QNetworkProxy::NoProxy);

        const QByteArray body = QJsonDocument(core::submitRequestToJson(request)).toJson(QJsonDocument::Compact);
        m_reply               = m_manager->post(jsonRequest(submitUrl), body);

        connect(m_reply, &QNetworkReply::finished, this, &BridgeCall::onReplyFinished);

        m_connectTimer.setSingleShot(true);
        m_connectTimer.setInterval(connectTimeoutMs);
        connect(&m_connectTimer, &QTimer::timeout, this, [this]() {
            m_timedOut     = true;
            m_timeoutError = "timed out connecting to the gateway";
            m_reply->abort();
        });
        m_connectTimer.start();

        // A listener that accepts but never answers would otherwise hold a call without a deadline forever
        m_heartbeatTimer.setSingleShot(true);
        m_heartbeatTimer.setInterval(qMax(1, heartbeatTimeoutMs));
        connect(&m_heartbeatTimer, &QTimer::timeout, this, [this]() {
            m_timedOut     = true;
            m_timeoutError = QString("no heartbeat from the gateway for %1 ms").arg(m_heartbeatTimer.interval());
            m_reply->abort();
        });

        connect(m_reply, &QNetworkReply::requestSent, this, [this]() {
            m_connectTimer.stop();
            m_heartbeatTimer.start();
        });
        connect(m_reply, &QNetworkReply::metaDataChanged, &m_heartbeatTimer, qOverload<>(&QTimer::start));
        connect(m_reply, &QNetworkReply::readyRead, &m_heartbeatTimer, qOverload<>(&QTimer::start));

        // Deadlines past the QTimer range leave the gateway's expiry as the only bound
        if (request.deadlineMs && *request.deadlineMs + responseGraceMs <= std::numeric_limits<int>::max()) {
            m_responseTimer.setSingleShot(true);
            m_responseTimer.setInterval(static_cast<int>(*request.deadlineMs + responseGraceMs));
            connect(&m_responseTimer, &QTimer::timeout, this, [this]() {
                m_timedOut     = true;
                m_timeoutError = "no reply from the gateway after the deadline";
                m_reply->abort();
            });
            m_responseTimer.start();
        }
    }

    BridgeCall::~BridgeCall() {
        if (m_reply && !m_finished) {
            m_reply->disconnect(this);
            m_reply->abort();
        }
    }

    void BridgeCall::cancel() {
        if (m_finished || m_cancelled) {
            return;
        }

        m_cancelled = true;
        m_reply->abort();
    }

    bool BridgeCall::isFinished() const {
        return m_finished;
    }

    void BridgeCall::onReplyFinished() {
        m_connectTimer.stop();
        m_responseTimer.stop();
        m_heartbeatTimer.stop();

        BridgeResult result;

        if (m_cancelled) {
            result.kind   = BridgeResult::Kind::Cancelled;
            result.reason = "caller_cancelled";
            finish(std::move(result));
            return;
        }

        if (m_timedOut) {
            result.kind  = BridgeResult::Kind::Unavailable;
            result.error = m_timeoutError;
            finish(std::move(result));
            return;
        }

        result.httpStatus = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (result.httpStatus == 0) {
            result.kind  = BridgeResult::Kind::Unavailable;
            result.error = m_reply->errorString();
            finish(std::move(result));
            return;
        }

        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(m_reply->readAll(), &parseError);

        if (result.httpStatus != 200) {
            result.kind  = BridgeResult::Kind::Rejected;
            result.error = doc.isObject() ? doc.object().value("error").toString() : QString();
            if (result.error.isEmpty()) {
                result.error = QString("gateway returned HTTP %1").arg(result.httpStatus);
            }
            finish(std::move(result));
            return;
        }

        QString    error;
        const auto outcome = doc.isObject() ? core::parseOutcome(doc.object(), &error) : std::nullopt;
        if (!outcome) {
            result.kind  = BridgeResult::Kind::Unavailable;
            result.error = QString("malformed reply from the gateway: %1").arg(doc.isObject() ? error : parseError.errorString());
            finish(std::move(result));
            return;
        }

        if (const auto* answer = std::get_if<core::Answer>(&*outcome)) {
            result.kind   = BridgeResult::Kind::Answered;
            result.answer = *answer;
        } else {
            result.kind   = BridgeResult::Kind::Cancelled;
            result.reason = core::cancelReasonToString(std::get<core::Cancellation>(*outcome).reason);
        }
        finish(std::move(result));
    }

    void BridgeCall::finish(BridgeResult result) {
        if (m_finished) {
            return;
        }
        m_finished = true;

        m_reply->deleteLater();
        m_reply = nullptr;

        emit finished(result);
    }

    BridgeClient::BridgeClient(quint16 port, int connectTimeoutMs, int responseGraceMs, int heartbeatTimeoutMs, QObject* parent) :
        QObject(parent), m_port(port), m_connectTimeoutMs(connectTimeoutMs), m_responseGraceMs(responseGraceMs), m_heartbeatTimeoutMs(heartbeatTimeoutMs) {}

    BridgeCall* BridgeClient::ask(const core::Question& question, std::optional<qint64> deadlineMs) {
        QUrl url = baseUrl();
        url.setPath("/bridge/submit");
        return new BridgeCall(url, core::SubmitRequest{question, deadlineMs}, m_connectTimeoutMs, m_responseGraceMs, m_heartbeatTimeoutMs, this);
    }

    bool BridgeClient::checkHealth(int timeoutMs, QJsonObject* health) {
        QNetworkAccessManager manager;
        manager.setProxy(QNetworkProxy::NoProxy);

        QUrl url = baseUrl();
        url.setPath("/health");

        QNetworkReply* reply = manager.get(jsonRequest(url));

        QEventLoop loop;
        QTimer     timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, reply, &QNetworkReply::abort);
        connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        timer.start(timeoutMs);
        loop.exec();

        const int  status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const auto doc    = QJsonDocument::fromJson(reply->readAll());
        if (status != 200) {
            qDebug() << "Health check of" << url.toString() << "failed:" << reply->errorString();
        }
        reply->deleteLater();

        const bool healthy = status == 200 && doc.isObject() && doc.object().value("status").toString() == "healthy";
        if (healthy && health) {
            *health = doc.object();
        }
        return healthy;
    }

    quint16 BridgeClient::port() const {
        return m_port;
    }

    QUrl BridgeClient::baseUrl() const {
        QUrl url;
        url.setScheme("http");
        url.setHost("127.0.0.1");
        url.setPort(m_port);
        return url;
    }

} // namespace parley::mcp
