#include "McpServer.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

namespace parley::mcp {

    namespace {

        const QStringList SUPPORTED_PROTOCOL_VERSIONS = {"2025-06-18", "2025-03-26", "2024-11-05"};

        QString formatSize(qsizetype bytes) {
            if (bytes < 1024) {
                return QString("%1 B").arg(bytes);
            }
            if (bytes < 1024 * 1024) {
                return QString("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
            }
            return QString("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
        }

        QJsonObject textContent(const QString& text) {
            return QJsonObject{{"type", "text"}, {"text", text}};
        }

    } // namespace

    McpServer::McpServer(BridgeClient* client, QObject* parent) : QObject(parent), m_client(client) {}

    McpServer::~McpServer() {
        cancelAll();
    }

    void McpServer::setSendFunction(SendFn send) {
        m_send = std::move(send);
    }

    void McpServer::handleLine(const QByteArray& line) {
        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(line, &parseError);

        if (parseError.error != QJsonParseError::NoError) {
            sendError(QJsonValue::Null, JSONRPC_PARSE_ERROR, QString("Parse error: %1").arg(parseError.errorString()));
            return;
        }
        if (!doc.isObject()) {
            sendError(QJsonValue::Null, JSONRPC_INVALID_REQUEST, "Batch requests are not supported");
            return;
        }

        handleMessage(doc.object());
    }

    void McpServer::handleMessage(const QJsonObject& message) {
        const QString    method = message.value("method").toString();
        const QJsonValue id     = message.value("id");
        const bool       isNotification = !message.contains("id");
        const QJsonObject params = message.value("params").toObject();

        if (method.isEmpty()) {
            // Responses to requests we never make
            if (!isNotification && (message.contains("result") || message.contains("error"))) {
                return;
            }
            sendError(id, JSONRPC_INVALID_REQUEST, "Missing method");
            return;
        }

        if (isNotification) {
            if (method == "notifications/cancelled") {
                handleCancelled(params);
            } else if (method == "notifications/initialized") {
                m_initialized = true;
            }
            return;
        }

        if (method == "initialize") {
            sendResult(id, handleInitialize(params));
        } else if (method == "ping") {
            sendResult(id, QJsonObject{});
        } else if (method == "tools/list") {
            sendResult(id, QJsonObject{{"tools", QJsonArray{toolDefinition()}}});
        } else if (method == "tools/call") {
            handleToolsCall(id, params);
        } else {
            sendError(id, JSONRPC_METHOD_NOT_FOUND, QString("Method not found: %1").arg(method));
        }
    }

    void McpServer::cancelAll() {
        const auto calls = m_inFlight;
        for (auto it = calls.constBegin(); it != calls.constEnd(); ++it) {
            m_cancelledByPeer.insert(it.key());
            it.value()->cancel();
        }
    }

    int McpServer::inFlightCount() const {
        return static_cast<int>(m_inFlight.size());
    }

    QJsonObject McpServer::toolDefinition() {
        const QJsonObject properties{
            {"message", QJsonObject{{"type", "string"}, {"description", "The question or message to show the user."}}},
            {"predefined_options",
             QJsonObject{{"type", "array"}, {"items", QJsonObject{{"type", "string"}}}, {"description", "Options the user can pick from, in addition to a free-form reply."}}},
            {"is_markdown", QJsonObject{{"type", "boolean"}, {"default", true}, {"description", "Render the message as Markdown."}}},
            {"timeout_seconds",
             QJsonObject{{"type", "integer"}, {"minimum", 1}, {"description", "Give up waiting after this many seconds. Waits indefinitely when omitted."}}},
        };

        return QJsonObject{
            {"name", INTERACT_TOOL_NAME},
            {"description",
             "Ask the user a question and wait for their reply. Use this to request decisions, clarification or confirmation "
             "instead of guessing. The reply may contain selected options, free text and attached files."},
            {"inputSchema", QJsonObject{{"type", "object"}, {"properties", properties}, {"required", QJsonArray{"message"}}}},
        };
    }

    QJsonObject McpServer::resultForAnswer(const core::Answer& answer) {
        QJsonArray  content;
        QStringList textParts;
        QStringList fileParts;

        if (!answer.selectedChoices.isEmpty()) {
            textParts << QString("Selected options: %1").arg(answer.selectedChoices.join(", "));
        }
        if (answer.text && !answer.text->isEmpty()) {
            textParts << *answer.text;
        }

        for (const core::Attachment& attachment : answer.attachments) {
            const QString name = attachment.filename.value_or(QStringLiteral("unnamed"));
            if (attachment.mediaType.startsWith("image/")) {
                content.append(QJsonObject{{"type", "image"}, {"data", QString::fromLatin1(attachment.data.toBase64())}, {"mimeType", attachment.mediaType}});
                fileParts << QString("Attached image: %1 (%2, %3)").arg(name, attachment.mediaType, formatSize(attachment.data.size()));
            } else {
                fileParts << QString("Attached file: %1 (%2, %3)").arg(name, attachment.mediaType, formatSize(attachment.data.size()));
            }
        }

        textParts << fileParts;
        if (textParts.isEmpty()) {
            textParts << "The user did not provide any content.";
        }
        content.append(textContent(textParts.join("\n\n")));

        return QJsonObject{{"content", content}, {"isError", false}};
    }

    QJsonObject McpServer::resultForCancellation(const QString& reason) {
        return QJsonObject{{"content", QJsonArray{textContent(QString("No response from the user (%1).").arg(reason))}},
                           {"isError", false},
                           {"_meta", QJsonObject{{"parley", QJsonObject{{"status", "cancelled"}, {"reason", reason}}}}}};
    }

    QJsonObject McpServer::handleInitialize(const QJsonObject& params) const {
        const QString requested = params.value("protocolVersion").toString();
        const QString version   = SUPPORTED_PROTOCOL_VERSIONS.contains(requested) ? requested : SUPPORTED_PROTOCOL_VERSIONS.last();

        return QJsonObject{
            {"protocolVersion", version},
            {"capabilities", QJsonObject{{"tools", QJsonObject{{"listChanged", false}}}}},
            {"serverInfo", QJsonObject{{"name", "parley-mcp"}, {"version", VERSION}}},
            {"instructions", "Use the interact tool whenever you need input from the user; it blocks until they answer."},
        };
    }

    void McpServer::handleToolsCall(const QJsonValue& id, const QJsonObject& params) {
        const QString key = idKey(id);
        if (m_inFlight.contains(key)) {
            sendError(id, JSONRPC_INVALID_REQUEST, "A request with this id is already in progress");
            return;
        }

        const QString name = params.value("name").toString();
        if (name != INTERACT_TOOL_NAME) {
            sendError(id, JSONRPC_INVALID_PARAMS, QString("Unknown tool: %1").arg(name));
            return;
        }

        const QJsonObject args    = params.value("arguments").toObject();
        const QJsonValue  message = args.value("message");
        if (!message.isString() || message.toString().trimmed().isEmpty()) {
            sendError(id, JSONRPC_INVALID_PARAMS, "'message' is required and must be a non-empty string");
            return;
        }

        core::Question question;
        question.text = message.toString();

        const QJsonValue options = args.value("predefined_options");
        if (!options.isUndefined() && !options.isNull()) {
            if (!options.isArray()) {
                sendError(id, JSONRPC_INVALID_PARAMS, "'predefined_options' must be an array of strings");
                return;
            }
            for (const QJsonValue& option : options.toArray()) {
                if (!option.isString()) {
                    sendError(id, JSONRPC_INVALID_PARAMS, "'predefined_options' must be an array of strings");
                    return;
                }
                question.choices << option.toString();
            }
        }

        const QJsonValue markdown = args.value("is_markdown");
        if (!markdown.isUndefined() && !markdown.isNull() && !markdown.isBool()) {
            sendError(id, JSONRPC_INVALID_PARAMS, "'is_markdown' must be a boolean");
            return;
        }
        question.renderHint = markdown.toBool(true) ? core::RenderHint::Markdown : core::RenderHint::Plain;

        std::optional<qint64> deadlineMs;
        const QJsonValue      timeout = args.value("timeout_seconds");
        if (!timeout.isUndefined() && !timeout.isNull()) {
            const double seconds = timeout.toDouble(-1);
            if (!timeout.isDouble() || seconds < 1 || seconds != static_cast<double>(static_cast<qint64>(seconds)) || seconds > 1e9) {
                sendError(id, JSONRPC_INVALID_PARAMS, "'timeout_seconds' must be a positive integer");
                return;
            }
            deadlineMs = static_cast<qint64>(seconds) * 1000;
        }

        BridgeCall* call = m_client->ask(question, deadlineMs);
        m_inFlight.insert(key, call);

        connect(call, &BridgeCall::finished, this, [this, key, id, call](const BridgeResult& result) {
            call->deleteLater();
            onCallFinished(key, id, result);
        });
    }

    void McpServer::handleCancelled(const QJsonObject& params) {
        const QString key = idKey(params.value("requestId"));
        auto          it  = m_inFlight.constFind(key);
        if (it == m_inFlight.constEnd()) {
            return;
        }

        qDebug() << "Peer cancelled request" << key << params.value("reason").toString();
        m_cancelledByPeer.insert(key);
        it.value()->cancel();
    }

    void McpServer::onCallFinished(const QString& key, const QJsonValue& id, const BridgeResult& result) {
        m_inFlight.remove(key);

        // The peer has already given up on this id
        if (m_cancelledByPeer.remove(key)) {
            if (m_inFlight.isEmpty()) {
                emit idle();
            }
            return;
        }

        switch (result.kind) {
            case BridgeResult::Kind::Answered: sendResult(id, resultForAnswer(result.answer)); break;
            case BridgeResult::Kind::Cancelled: sendResult(id, resultForCancellation(result.reason)); break;
            case BridgeResult::Kind::Rejected:
                sendError(id, result.httpStatus == 503 ? JSONRPC_BRIDGE_BUSY : JSONRPC_INVALID_PARAMS, result.error);
                break;
            case BridgeResult::Kind::Unavailable:
                qWarning() << "Bridge unavailable:" << result.error;
                sendError(id, JSONRPC_BRIDGE_UNAVAILABLE, QString("bridge unavailable: %1").arg(result.error));
                break;
        }

        if (m_inFlight.isEmpty()) {
            emit idle();
        }
    }

    void McpServer::send(const QJsonObject& message) const {
        if (m_send) {
            m_send(message);
        }
    }

    void McpServer::sendResult(const QJsonValue& id, const QJsonObject& result) const {
        send(QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
    }

    void McpServer::sendError(const QJsonValue& id, int code, const QString& message) const {
        send(QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"error", QJsonObject{{"code", code}, {"message", message}}}});
    }

    QString McpServer::idKey(const QJsonValue& id) {
        if (id.isString()) {
            return "s:" + id.toString();
        }
        return "n:" + QString::number(id.toDouble(), 'g', 17);
    }

} // namespace parley::mcp
