#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

namespace parley::core {

    // How the surface should interpret Question::text
    enum class RenderHint {
        Markdown,
        Plain
    };

    struct Question {
        QString     text;
        QStringList choices;
        RenderHint  renderHint = RenderHint::Markdown;
    };

    struct Attachment {
        QByteArray             data;
        QString                mediaType;
        std::optional<QString> filename;
    };

    struct Answer {
        std::optional<QString> text;
        QStringList            selectedChoices;
        QList<Attachment>      attachments;
        qint64                 submittedAtMs = 0;
    };

    enum class CancelReason {
        Expired,
        Dismissed,
        ShuttingDown,
        CallerGone
    };

    struct Cancellation {
        CancelReason reason = CancelReason::Expired;
    };

    using Outcome = std::variant<Answer, Cancellation>;

    // How a dead request ended, remembered after its entry is removed
    enum class TerminalState {
        Answered,
        Expired,
        Dismissed,
        ShuttingDown,
        CallerGone
    };

    // Body of POST /bridge/submit
    struct SubmitRequest {
        Question              question;
        std::optional<qint64> deadlineMs;
    };

    [[nodiscard]] QString                     renderHintToString(RenderHint hint);
    [[nodiscard]] std::optional<RenderHint>   renderHintFromString(const QString& value);
    [[nodiscard]] QString                     cancelReasonToString(CancelReason reason);
    [[nodiscard]] std::optional<CancelReason> cancelReasonFromString(const QString& value);
    [[nodiscard]] QString                     terminalStateToString(TerminalState state);
    [[nodiscard]] TerminalState               terminalStateFor(const Outcome& outcome);

    // Wire codec. Parsers validate required fields and limits; on failure they
    // return std::nullopt and describe the problem in *error.
    std::optional<Question>      parseQuestion(const QJsonObject& obj, QString* error);
    QJsonObject                  questionToJson(const Question& question);

    std::optional<SubmitRequest> parseSubmitRequest(const QJsonObject& obj, QString* error);
    QJsonObject                  submitRequestToJson(const SubmitRequest& request);

    std::optional<Answer>        parseAnswer(const QJsonObject& obj, QString* error);
    QJsonObject                  answerToJson(const Answer& answer);

    // {"status":"answered","answer":{...}} or {"status":"cancelled","reason":...}
    QJsonObject                  outcomeToJson(const Outcome& outcome);
    std::optional<Outcome>       parseOutcome(const QJsonObject& obj, QString* error);

} // namespace parley::core
