#include "PresentationBridge.hpp"

#include <QDebug>
#include <QMetaObject>

namespace parley::core {

    PresentationBridge::PresentationBridge(RequestRegistry& registry, QObject* parent) : QObject(parent), m_registry(registry) {
        m_registry.setClosedHandler([this](const QString& id, TerminalState state) {
            const QJsonObject event = closedEvent(id, state);
            QMetaObject::invokeMethod(this, [this, id, event]() { emit requestClosed(id, event); }, Qt::QueuedConnection);
        });
    }

    PresentationBridge::~PresentationBridge() {
        m_registry.setClosedHandler(nullptr);
    }

    void PresentationBridge::onNewRequest(const QString& id, const Question& payload) {
        auto info = m_registry.pendingInfo(id);
        if (!info) {
            // Settled before it could be presented
            return;
        }
        info->question = payload;

        const QJsonObject event = createdEvent(*info);
        QMetaObject::invokeMethod(this, [this, id, event]() { emit requestPresented(id, event); }, Qt::QueuedConnection);
    }

    SubmitStatus PresentationBridge::submitAnswer(const QString& id, const Answer& answer) {
        const auto         info   = m_registry.pendingInfo(id);
        const SubmitStatus status = m_registry.complete(id, answer);
        if (status != SubmitStatus::Ok) {
            qDebug() << "Submission for" << id << "rejected:" << submitStatusToString(status);
            return status;
        }

        if (info) {
            emit requestAnswered(id, info->question, answer);
        }
        return status;
    }

    SubmitStatus PresentationBridge::dismiss(const QString& id) {
        return m_registry.cancel(id, CancelReason::Dismissed);
    }

    QList<QJsonObject> PresentationBridge::pendingEvents() const {
        QList<QJsonObject> events;
        for (const PendingInfo& info : m_registry.snapshot()) {
            events << createdEvent(info);
        }
        return events;
    }

    QString PresentationBridge::describe(const QString& id, SubmitStatus status) const {
        switch (status) {
            case SubmitStatus::Ok: return "Response delivered.";
            case SubmitStatus::InvalidAnswer: return "The selected options are not part of this request.";
            case SubmitStatus::AlreadyCompleted:
            case SubmitStatus::NotFound: break;
        }

        if (auto state = m_registry.terminalState(id)) {
            return describeTerminal(*state);
        }
        return "This request is no longer active.";
    }

    QJsonObject PresentationBridge::createdEvent(const PendingInfo& info) {
        return QJsonObject{{"type", "request.created"},
                           {"id", info.id},
                           {"payload", questionToJson(info.question)},
                           {"created_at", static_cast<double>(info.createdAtMs)},
                           {"deadline", info.deadlineAtMs ? QJsonValue(static_cast<double>(*info.deadlineAtMs)) : QJsonValue(QJsonValue::Null)}};
    }

    QJsonObject PresentationBridge::closedEvent(const QString& id, TerminalState state) {
        return QJsonObject{{"type", "request.closed"}, {"id", id}, {"result", terminalStateToString(state)}};
    }

    QString PresentationBridge::describeTerminal(TerminalState state) const {
        switch (state) {
            case TerminalState::Answered: return "This request was already answered.";
            case TerminalState::Expired: return "Too late: this request expired before your answer arrived.";
            case TerminalState::Dismissed: return "This request was dismissed.";
            case TerminalState::ShuttingDown: return "This request was cancelled because Parley is shutting down.";
            case TerminalState::CallerGone: return "Too late: the tool call that asked this question was cancelled.";
        }
        return "This request is no longer active.";
    }

} // namespace parley::core
