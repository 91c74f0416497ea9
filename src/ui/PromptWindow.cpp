#include "PromptWindow.hpp"

#include <QCheckBox>
#include <QCloseEvent>
#include <QDateTime>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QJsonArray>
#include <QKeySequence>
#include <QLabel>
#include <QListWidget>
#include <QMimeDatabase>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSplitter>
#include <QTextBrowser>
#include <QTimer>
#include <QVBoxLayout>

namespace {

    QString summaryLine(const QString& text) {
        for (const QString& line : text.split('\n')) {
            QString simplified = line.simplified();
            while (simplified.startsWith('#')) {
                simplified.remove(0, 1);
            }
            simplified = simplified.trimmed();
            if (!simplified.isEmpty()) {
                return simplified.length() > 80 ? simplified.left(77) + "..." : simplified;
            }
        }
        return QStringLiteral("(empty question)");
    }

    QString formatRemaining(qint64 ms) {
        const qint64 seconds = qMax<qint64>(0, (ms + 999) / 1000);
        if (seconds >= 3600) {
            return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
        }
        if (seconds >= 60) {
            return QString("%1m %2s").arg(seconds / 60).arg(seconds % 60);
        }
        return QString("%1s").arg(seconds);
    }

    qint64 attachmentBytes(const QList<parley::core::Attachment>& attachments) {
        qint64 total = 0;
        for (const auto& attachment : attachments) {
            total += attachment.data.size();
        }
        return total;
    }

} // namespace

namespace parley::ui {

    PromptWindow::PromptWindow(core::PresentationBridge* bridge, QWidget* parent) : QWidget(parent), m_bridge(bridge) {
        setWindowTitle("Parley");
        setObjectName("ParleyPromptWindow");
        setWindowFlags(Qt::Window | Qt::WindowTitleHint | Qt::WindowCloseButtonHint);
        resize(820, 540);

        auto* rootLayout = new QVBoxLayout(this);
        rootLayout->setContentsMargins(16, 16, 16, 16);
        rootLayout->setSpacing(10);

        auto* splitter = new QSplitter(Qt::Horizontal, this);
        m_pendingList  = new QListWidget(splitter);
        m_pendingList->setMinimumWidth(200);

        auto* detail       = new QWidget(splitter);
        auto* detailLayout = new QVBoxLayout(detail);
        detailLayout->setContentsMargins(0, 0, 0, 0);
        detailLayout->setSpacing(8);

        m_questionView = new QTextBrowser(detail);
        m_questionView->setOpenExternalLinks(true);
        m_deadlineLabel = new QLabel(detail);
        m_deadlineLabel->setStyleSheet("color: #aeb6b1;");
        m_deadlineLabel->hide();

        m_choicesBox    = new QWidget(detail);
        m_choicesLayout = new QVBoxLayout(m_choicesBox);
        m_choicesLayout->setContentsMargins(0, 0, 0, 0);
        m_choicesLayout->setSpacing(4);
        m_choicesBox->hide();

        m_replyEdit = new QPlainTextEdit(detail);
        m_replyEdit->setPlaceholderText("Type your reply");
        m_replyEdit->setMaximumHeight(140);

        auto* attachRow     = new QHBoxLayout();
        m_attachButton      = new QPushButton("Attach files...", detail);
        m_clearAttachButton = new QPushButton("Clear", detail);
        m_clearAttachButton->setFlat(true);
        m_clearAttachButton->hide();
        m_attachmentsLabel = new QLabel(detail);
        m_attachmentsLabel->setStyleSheet("color: #999;");
        attachRow->addWidget(m_attachButton);
        attachRow->addWidget(m_attachmentsLabel, 1);
        attachRow->addWidget(m_clearAttachButton);

        m_errorLabel = new QLabel(detail);
        m_errorLabel->setWordWrap(true);
        m_errorLabel->setStyleSheet("color: #cc4a4a;");
        m_errorLabel->hide();
        m_statusLabel = new QLabel(detail);
        m_statusLabel->setWordWrap(true);
        m_statusLabel->setStyleSheet("color: #999;");
        m_statusLabel->hide();

        auto* buttonRow = new QHBoxLayout();
        buttonRow->setSpacing(8);
        m_dismissButton = new QPushButton("Dismiss", detail);
        m_submitButton  = new QPushButton("Send", detail);
        m_submitButton->setDefault(true);
        m_submitButton->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Return));
        m_dismissButton->setMinimumHeight(34);
        m_submitButton->setMinimumHeight(34);
        buttonRow->addWidget(m_dismissButton, 1);
        buttonRow->addWidget(m_submitButton, 1);

        detailLayout->addWidget(m_questionView, 1);
        detailLayout->addWidget(m_deadlineLabel);
        detailLayout->addWidget(m_choicesBox);
        detailLayout->addWidget(m_replyEdit);
        detailLayout->addLayout(attachRow);
        detailLayout->addWidget(m_errorLabel);
        detailLayout->addWidget(m_statusLabel);
        detailLayout->addLayout(buttonRow);

        splitter->setStretchFactor(1, 1);
        rootLayout->addWidget(splitter);

        m_countdownTimer = new QTimer(this);
        m_countdownTimer->setInterval(1000);
        connect(m_countdownTimer, &QTimer::timeout, this, &PromptWindow::updateCountdown);

        connect(m_pendingList, &QListWidget::currentItemChanged, this, [this](QListWidgetItem* current) {
            if (current) {
                showRequest(current->data(Qt::UserRole).toString());
            }
        });
        connect(m_submitButton, &QPushButton::clicked, this, &PromptWindow::submitCurrent);
        connect(m_dismissButton, &QPushButton::clicked, this, &PromptWindow::dismissCurrent);
        connect(m_attachButton, &QPushButton::clicked, this, &PromptWindow::attachFiles);
        connect(m_clearAttachButton, &QPushButton::clicked, this, [this]() {
            m_attachments.clear();
            m_attachmentsLabel->clear();
            m_clearAttachButton->hide();
        });

        connect(m_bridge, &core::PresentationBridge::requestPresented, this, [this](const QString&, const QJsonObject& event) { addRequest(event); });
        connect(m_bridge, &core::PresentationBridge::requestClosed, this,
                [this](const QString& id, const QJsonObject&) { removeRequest(id); });

        clearRequest();
        hide();

        // Questions that arrived before the window existed
        for (const QJsonObject& event : m_bridge->pendingEvents()) {
            addRequest(event);
        }
    }

    QString PromptWindow::currentRequestId() const {
        return m_currentId;
    }

    int PromptWindow::pendingCount() const {
        return static_cast<int>(m_requests.size());
    }

    void PromptWindow::closeEvent(QCloseEvent* event) {
        event->ignore();
        hide();
    }

    void PromptWindow::addRequest(const QJsonObject& event) {
        const QString id = event.value("id").toString();
        if (id.isEmpty() || m_requests.contains(id)) {
            return;
        }

        m_requests.insert(id, event);

        auto* item = new QListWidgetItem(summaryLine(event.value("payload").toObject().value("text").toString()), m_pendingList);
        item->setData(Qt::UserRole, id);

        if (m_currentId.isEmpty()) {
            m_pendingList->setCurrentItem(item);
        }

        show();
        raise();
        activateWindow();
    }

    void PromptWindow::removeRequest(const QString& id) {
        if (!m_requests.remove(id)) {
            return;
        }

        for (int i = 0; i < m_pendingList->count(); ++i) {
            if (m_pendingList->item(i)->data(Qt::UserRole).toString() == id) {
                delete m_pendingList->takeItem(i);
                break;
            }
        }

        if (id != m_currentId) {
            return;
        }

        const bool settledHere = m_settledHere;
        clearRequest();
        if (!settledHere) {
            // Closed elsewhere while the human was looking at it
            setStatusText(m_bridge->describe(id, core::SubmitStatus::NotFound));
        }

        if (m_pendingList->count() > 0) {
            m_pendingList->setCurrentRow(0);
        } else if (settledHere) {
            hide();
        }
    }

    void PromptWindow::showRequest(const QString& id) {
        const auto it = m_requests.constFind(id);
        if (it == m_requests.constEnd()) {
            return;
        }

        m_currentId   = id;
        m_settledHere = false;

        const QJsonObject payload = it->value("payload").toObject();
        const QString     text    = payload.value("text").toString();
        if (core::renderHintFromString(payload.value("render_hint").toString()) == core::RenderHint::Plain) {
            m_questionView->setPlainText(text);
        } else {
            m_questionView->setMarkdown(text);
        }

        qDeleteAll(m_choiceBoxes);
        m_choiceBoxes.clear();
        for (const QJsonValue& choice : payload.value("choices").toArray()) {
            auto* box = new QCheckBox(choice.toString(), m_choicesBox);
            m_choicesLayout->addWidget(box);
            m_choiceBoxes << box;
        }
        m_choicesBox->setVisible(!m_choiceBoxes.isEmpty());

        m_replyEdit->clear();
        m_attachments.clear();
        m_attachmentsLabel->clear();
        m_clearAttachButton->hide();

        setErrorText("");
        setStatusText("");
        setBusy(false);
        updateCountdown();
        m_countdownTimer->start();
        m_replyEdit->setFocus();
    }

    void PromptWindow::clearRequest() {
        m_currentId.clear();
        m_settledHere = false;
        m_countdownTimer->stop();
        m_questionView->clear();
        qDeleteAll(m_choiceBoxes);
        m_choiceBoxes.clear();
        m_choicesBox->hide();
        m_replyEdit->clear();
        m_attachments.clear();
        m_attachmentsLabel->clear();
        m_clearAttachButton->hide();
        m_deadlineLabel->hide();
        setErrorText("");
        setStatusText("");
        setBusy(true);
    }

    void PromptWindow::submitCurrent() {
        if (m_currentId.isEmpty()) {
            return;
        }

        core::Answer  answer;
        const QString reply = m_replyEdit->toPlainText();
        if (!reply.trimmed().isEmpty()) {
            answer.text = reply;
        }
        for (QCheckBox* box : std::as_const(m_choiceBoxes)) {
            if (box->isChecked()) {
                answer.selectedChoices << box->text();
            }
        }
        answer.attachments = m_attachments;

        if (!answer.text && answer.selectedChoices.isEmpty() && answer.attachments.isEmpty()) {
            setErrorText("Type a reply, pick an option or attach a file.");
            return;
        }

        const QString            id     = m_currentId;
        const core::SubmitStatus status = m_bridge->submitAnswer(id, answer);
        if (status == core::SubmitStatus::Ok) {
            m_settledHere = true;
            setErrorText("");
            setStatusText(m_bridge->describe(id, status));
            setBusy(true);
            return;
        }

        setErrorText(m_bridge->describe(id, status));
        if (status != core::SubmitStatus::InvalidAnswer) {
            setBusy(true);
        }
    }

    void PromptWindow::dismissCurrent() {
        if (m_currentId.isEmpty()) {
            hide();
            return;
        }

        const QString            id     = m_currentId;
        const core::SubmitStatus status = m_bridge->dismiss(id);
        if (status == core::SubmitStatus::Ok) {
            m_settledHere = true;
        } else {
            setErrorText(m_bridge->describe(id, status));
            setBusy(true);
        }
    }

    void PromptWindow::attachFiles() {
        const QStringList files = QFileDialog::getOpenFileNames(this, "Attach files");
        if (files.isEmpty()) {
            return;
        }

        QMimeDatabase mimeDb;
        qint64        total = attachmentBytes(m_attachments);
        for (const QString& path : files) {
            QFile file(path);
            if (!file.open(QIODevice::ReadOnly)) {
                setErrorText(QString("Could not read %1: %2").arg(QFileInfo(path).fileName(), file.errorString()));
                return;
            }

            core::Attachment attachment;
            attachment.data = file.readAll();
            total += attachment.data.size();
            if (total > static_cast<qint64>(MAX_ANSWER_SIZE)) {
                setErrorText(QString("Attachments are limited to %1 MiB in total.").arg(MAX_ANSWER_SIZE / (1024 * 1024)));
                return;
            }

            attachment.mediaType = mimeDb.mimeTypeForFileNameAndData(path, attachment.data).name();
            attachment.filename  = QFileInfo(path).fileName();
            m_attachments << attachment;
        }

        QStringList names;
        for (const auto& attachment : std::as_const(m_attachments)) {
            names << attachment.filename.value_or(QStringLiteral("file"));
        }
        m_attachmentsLabel->setText(names.join(", "));
        m_clearAttachButton->show();
        setErrorText("");
    }

    void PromptWindow::updateCountdown() {
        const auto it = m_requests.constFind(m_currentId);
        if (it == m_requests.constEnd() || it->value("deadline").isNull()) {
            m_deadlineLabel->hide();
            return;
        }

        const qint64 remaining = static_cast<qint64>(it->value("deadline").toDouble()) - QDateTime::currentMSecsSinceEpoch();
        m_deadlineLabel->setText(QString("Expires in %1").arg(formatRemaining(remaining)));
        m_deadlineLabel->show();
    }

    void PromptWindow::setBusy(bool busy) {
        m_submitButton->setEnabled(!busy);
        m_dismissButton->setEnabled(!busy);
        m_replyEdit->setEnabled(!busy);
        m_attachButton->setEnabled(!busy);
        m_choicesBox->setEnabled(!busy);
    }

    void PromptWindow::setErrorText(const QString& text) {
        m_errorLabel->setText(text);
        m_errorLabel->setVisible(!text.isEmpty());
    }

    void PromptWindow::setStatusText(const QString& text) {
        m_statusLabel->setText(text);
        m_statusLabel->setVisible(!text.isEmpty());
    }

} // namespace parley::ui
