#pragma once

#include "../registry/RequestRegistry.hpp"

#include <QJsonObject>
#include <QList>
#include <QObject>

namespace parley::core {

    // Boundary between the registry and the interactive surfaces. Notifications
    // go out as queued signals; answers and dismissals come back through
    // submitAnswer()/dismiss(), which always consult the registry.
    class PresentationBridge : public QObject {
        Q_OBJECT

      public:
        explicit PresentationBridge(RequestRegistry& registry, QObject* parent = nullptr);
        ~PresentationBridge() override;

        // Called by the gateway after registration. Never blocks.
        void                       onNewRequest(const QString& id, const Question& payload);

        SubmitStatus               submitAnswer(const QString& id, const Answer& answer);
        SubmitStatus               dismiss(const QString& id);

        // request.created events for everything still pending, oldest first
        QList<QJsonObject>         pendingEvents() const;

        // Text for the human explaining the result of submitAnswer()/dismiss()
        QString                    describe(const QString& id, SubmitStatus status) const;

        [[nodiscard]] static QJsonObject createdEvent(const PendingInfo& info);
        [[nodiscard]] static QJsonObject closedEvent(const QString& id, TerminalState state);

      signals:
        void requestPresented(const QString& id, const QJsonObject& event);
        void requestClosed(const QString& id, const QJsonObject& event);

        // Emitted synchronously once an answer has been accepted
        void requestAnswered(const QString& id, const parley::core::Question& question, const parley::core::Answer& answer);

      private:
        QString          describeTerminal(TerminalState state) const;

        RequestRegistry& m_registry;
    };

} // namespace parley::core
