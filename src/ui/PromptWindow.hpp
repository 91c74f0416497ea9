#pragma once

#include "../core/bridge/PresentationBridge.hpp"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QWidget>

class QCheckBox;
class QLabel;
class QListWidget;
class QPlainTextEdit;
class QPushButton;
class QTextBrowser;
class QTimer;
class QVBoxLayout;

namespace parley::ui {

    // Desktop surface for pending questions. Lives in the daemon process and
    // talks to the registry only through the presentation bridge.
    class PromptWindow : public QWidget {
        Q_OBJECT

      public:
        explicit PromptWindow(core::PresentationBridge* bridge, QWidget* parent = nullptr);

        QString currentRequestId() const;
        int     pendingCount() const;

      protected:
        // Closing the window only hides it; pending questions stay open
        void closeEvent(QCloseEvent* event) override;

      private:
        void        addRequest(const QJsonObject& event);
        void        removeRequest(const QString& id);
        void        showRequest(const QString& id);
        void        clearRequest();
        void        submitCurrent();
        void        dismissCurrent();
        void        attachFiles();
        void        updateCountdown();
        void        setBusy(bool busy);
        void        setErrorText(const QString& text);
        void        setStatusText(const QString& text);

        core::PresentationBridge*   m_bridge = nullptr;

        QListWidget*                m_pendingList      = nullptr;
        QTextBrowser*               m_questionView     = nullptr;
        QWidget*                    m_choicesBox       = nullptr;
        QVBoxLayout*                m_choicesLayout    = nullptr;
        QPlainTextEdit*             m_replyEdit        = nullptr;
        QLabel*                     m_attachmentsLabel = nullptr;
        QLabel*                     m_deadlineLabel    = nullptr;
        QLabel*                     m_errorLabel       = nullptr;
        QLabel*                     m_statusLabel      = nullptr;
        QPushButton*                m_attachButton     = nullptr;
        QPushButton*                m_clearAttachButton = nullptr;
        QPushButton*                m_submitButton     = nullptr;
        QPushButton*                m_dismissButton    = nullptr;
        QTimer*                     m_countdownTimer   = nullptr;

        QHash<QString, QJsonObject> m_requests;
        QList<QCheckBox*>           m_choiceBoxes;
        QList<core::Attachment>     m_attachments;
        QString                     m_currentId;
        bool                        m_settledHere = false;
    };

} // namespace parley::ui
