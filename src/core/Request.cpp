#include "Request.hpp"
#include "../common/Constants.hpp"

#include <QJsonArray>
#include <QJsonValue>

namespace parley::core {

    namespace {

        // Largest integer a JSON double carries exactly
        inline constexpr double MAX_DEADLINE_MS = 9007199254740992.0;

        void setError(QString* error, const QString& message) {
            if (error) {
                *error = message;
            }
        }

        std::optional<QStringList> parseStringArray(const QJsonValue& value, const QString& field, QString* error) {
            if (value.isUndefined() || value.isNull()) {
                return QStringList{};
            }

            if (!value.isArray()) {
                setError(error, QString("'%1' must be an array of strings").arg(field));
                return std::nullopt;
            }

            QStringList result;
            const auto  array = value.toArray();
            result.reserve(array.size());
            for (const QJsonValue& item : array) {
                if (!item.isString()) {
                    setError(error, QString("'%1' must contain only strings").arg(field));
                    return std::nullopt;
                }
                result << item.toString();
            }

            result.removeDuplicates();
            return result;
        }

        std::optional<Attachment> parseAttachment(const QJsonValue& value, QString* error) {
            if (!value.isObject()) {
                setError(error, "attachment must be an object");
                return std::nullopt;
            }

            const QJsonObject obj = value.toObject();
            if (!obj.value("data_base64").isString()) {
                setError(error, "attachment 'data_base64' is required");
                return std::nullopt;
            }

            const QString mediaType = obj.value("media_type").toString();
            if (mediaType.isEmpty()) {
                setError(error, "attachment 'media_type' is required");
                return std::nullopt;
            }

            const auto decoded = QByteArray::fromBase64Encoding(obj.value("data_base64").toString().toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
            if (!decoded) {
                setError(error, "attachment 'data_base64' is not valid base64");
                return std::nullopt;
            }

            Attachment attachment;
            attachment.data      = *decoded;
            attachment.mediaType = mediaType;

            const QJsonValue filename = obj.value("filename");
            if (filename.isString()) {
                attachment.filename = filename.toString();
            } else if (!filename.isUndefined() && !filename.isNull()) {
                setError(error, "attachment 'filename' must be a string or null");
                return std::nullopt;
            }

            return attachment;
        }

    } // namespace

    QString renderHintToString(RenderHint hint) {
        switch (hint) {
            case RenderHint::Markdown: return "markdown";
            case RenderHint::Plain: return "plain";
        }
        return "markdown";
    }

    std::optional<RenderHint> renderHintFromString(const QString& value) {
        if (value == "markdown") {
            return RenderHint::Markdown;
        }
        if (value == "plain") {
            return RenderHint::Plain;
        }
        return std::nullopt;
    }

    QString cancelReasonToString(CancelReason reason) {
        switch (reason) {
            case CancelReason::Expired: return "expired";
            case CancelReason::Dismissed: return "dismissed";
            case CancelReason::ShuttingDown: return "shutting_down";
            case CancelReason::CallerGone: return "caller_gone";
        }
        return "unknown";
    }

    std::optional<CancelReason> cancelReasonFromString(const QString& value) {
        for (CancelReason reason : {CancelReason::Expired, CancelReason::Dismissed, CancelReason::ShuttingDown, CancelReason::CallerGone}) {
            if (cancelReasonToString(reason) == value) {
                return reason;
            }
        }
        return std::nullopt;
    }

    QString terminalStateToString(TerminalState state) {
        switch (state) {
            case TerminalState::Answered: return "answered";
            case TerminalState::Expired: return "expired";
            case TerminalState::Dismissed: return "dismissed";
            case TerminalState::ShuttingDown: return "shutting_down";
            case TerminalState::CallerGone: return "caller_gone";
        }
        return "unknown";
    }

    TerminalState terminalStateFor(const Outcome& outcome) {
        if (std::holds_alternative<Answer>(outcome)) {
            return TerminalState::Answered;
        }

        switch (std::get<Cancellation>(outcome).reason) {
            case CancelReason::Expired: return TerminalState::Expired;
            case CancelReason::Dismissed: return TerminalState::Dismissed;
            case CancelReason::ShuttingDown: return TerminalState::ShuttingDown;
            case CancelReason::CallerGone: return TerminalState::CallerGone;
        }
        return TerminalState::Expired;
    }

    std::optional<Question> parseQuestion(const QJsonObject& obj, QString* error) {
        const QJsonValue text = obj.value("text");
        if (!text.isString() || text.toString().trimmed().isEmpty()) {
            setError(error, "'text' is required and must be a non-empty string");
            return std::nullopt;
        }

        Question question;
        question.text = text.toString();
        if (static_cast<std::size_t>(question.text.toUtf8().size()) > MAX_QUESTION_TEXT_SIZE) {
            setError(error, QString("'text' exceeds the maximum size of %1 bytes").arg(MAX_QUESTION_TEXT_SIZE));
            return std::nullopt;
        }

        auto choices = parseStringArray(obj.value("choices"), "choices", error);
        if (!choices) {
            return std::nullopt;
        }
        if (choices->size() > MAX_CHOICES) {
            setError(error, QString("number of choices (%1) exceeds the maximum of %2").arg(choices->size()).arg(MAX_CHOICES));
            return std::nullopt;
        }
        question.choices = *choices;

        const QJsonValue hint = obj.value("render_hint");
        if (!hint.isUndefined() && !hint.isNull()) {
            auto parsed = hint.isString() ? renderHintFromString(hint.toString()) : std::nullopt;
            if (!parsed) {
                setError(error, "'render_hint' must be \"markdown\" or \"plain\"");
                return std::nullopt;
            }
            question.renderHint = *parsed;
        }

        return question;
    }

    QJsonObject questionToJson(const Question& question) {
        return QJsonObject{{"text", question.text}, {"choices", QJsonArray::fromStringList(question.choices)}, {"render_hint", renderHintToString(question.renderHint)}};
    }

    std::optional<SubmitRequest> parseSubmitRequest(const QJsonObject& obj, QString* error) {
        const QJsonValue payload = obj.value("payload");
        if (!payload.isObject()) {
            setError(error, "'payload' is required and must be an object");
            return std::nullopt;
        }

        auto question = parseQuestion(payload.toObject(), error);
        if (!question) {
            return std::nullopt;
        }

        SubmitRequest request;
        request.question = std::move(*question);

        const QJsonValue deadline = obj.value("deadline_ms");
        if (!deadline.isUndefined() && !deadline.isNull()) {
            const double value = deadline.toDouble(-1);
            if (!deadline.isDouble() || value <= 0 || value > MAX_DEADLINE_MS || value != static_cast<double>(static_cast<qint64>(value))) {
                setError(error, "'deadline_ms' must be a positive integer or null");
                return std::nullopt;
            }
            request.deadlineMs = static_cast<qint64>(value);
        }

        return request;
    }

    QJsonObject submitRequestToJson(const SubmitRequest& request) {
        QJsonObject obj{{"payload", questionToJson(request.question)}};
        obj["deadline_ms"] = request.deadlineMs ? QJsonValue(static_cast<double>(*request.deadlineMs)) : QJsonValue(QJsonValue::Null);
        return obj;
    }

    std::optional<Answer> parseAnswer(const QJsonObject& obj, QString* error) {
        Answer answer;

        const QJsonValue text = obj.value("text");
        if (text.isString()) {
            answer.text = text.toString();
        } else if (!text.isUndefined() && !text.isNull()) {
            setError(error, "'text' must be a string or null");
            return std::nullopt;
        }

        auto choices = parseStringArray(obj.value("choices"), "choices", error);
        if (!choices) {
            return std::nullopt;
        }
        answer.selectedChoices = *choices;

        const QJsonValue attachments = obj.value("attachments");
        if (!attachments.isUndefined() && !attachments.isNull()) {
            if (!attachments.isArray()) {
                setError(error, "'attachments' must be an array");
                return std::nullopt;
            }

            std::size_t total = 0;
            for (const QJsonValue& item : attachments.toArray()) {
                auto attachment = parseAttachment(item, error);
                if (!attachment) {
                    return std::nullopt;
                }

                total += static_cast<std::size_t>(attachment->data.size());
                if (total > MAX_ANSWER_SIZE) {
                    setError(error, QString("attachments exceed the maximum size of %1 bytes").arg(MAX_ANSWER_SIZE));
                    return std::nullopt;
                }
                answer.attachments << std::move(*attachment);
            }
        }

        return answer;
    }

    QJsonObject answerToJson(const Answer& answer) {
        QJsonArray attachments;
        for (const Attachment& attachment : answer.attachments) {
            attachments.append(QJsonObject{{"data_base64", QString::fromLatin1(attachment.data.toBase64())},
                                           {"media_type", attachment.mediaType},
                                           {"filename", attachment.filename ? QJsonValue(*attachment.filename) : QJsonValue(QJsonValue::Null)}});
        }

        return QJsonObject{{"text", answer.text ? QJsonValue(*answer.text) : QJsonValue(QJsonValue::Null)},
                           {"choices", QJsonArray::fromStringList(answer.selectedChoices)},
                           {"attachments", attachments}};
    }

    QJsonObject outcomeToJson(const Outcome& outcome) {
        if (const auto* answer = std::get_if<Answer>(&outcome)) {
            return QJsonObject{{"status", "answered"}, {"answer", answerToJson(*answer)}};
        }

        return QJsonObject{{"status", "cancelled"}, {"reason", cancelReasonToString(std::get<Cancellation>(outcome).reason)}};
    }

    std::optional<Outcome> parseOutcome(const QJsonObject& obj, QString* error) {
        const QString status = obj.value("status").toString();

        if (status == "answered") {
            auto answer = parseAnswer(obj.value("answer").toObject(), error);
            if (!answer) {
                return std::nullopt;
            }
            return Outcome{std::move(*answer)};
        }

        if (status == "cancelled") {
            // Unknown reasons from a newer daemon still mean "no answer"
            const auto reason = cancelReasonFromString(obj.value("reason").toString());
            return Outcome{Cancellation{reason.value_or(CancelReason::Expired)}};
        }

        setError(error, QString("unexpected status '%1'").arg(status));
        return std::nullopt;
    }

} // namespace parley::core
