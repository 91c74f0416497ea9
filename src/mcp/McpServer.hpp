#pragma once

#include "BridgeClient.hpp"

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QSet>

#include <functional>

namespace parley::mcp {

    inline constexpr int JSONRPC_PARSE_ERROR          = -32700;
    inline constexpr int JSONRPC_INVALID_REQUEST      = -32600;
    inline constexpr int JSONRPC_METHOD_NOT_FOUND     = -32601;
    inline constexpr int JSONRPC_INVALID_PARAMS       = -32602;
    inline constexpr int JSONRPC_BRIDGE_UNAVAILABLE   = -32001;
    // Gateway answered 503: registry full or shutting down
    inline constexpr int JSONRPC_BRIDGE_BUSY          = -32002;

    inline constexpr const char* INTERACT_TOOL_NAME   = "interact";

    // Line-delimited JSON-RPC 2.0 tool server exposing the "interact" tool.
    // Each tools/call becomes one BridgeCall; replies go out through the send function.
    class McpServer : public QObject {
        Q_OBJECT

      public:
        using SendFn = std::function<void(const QJsonObject&)>;

        explicit McpServer(BridgeClient* client, QObject* parent = nullptr);
        ~McpServer() override;

        void        setSendFunction(SendFn send);

        void        handleLine(const QByteArray& line);
        void        handleMessage(const QJsonObject& message);

        // Cancels every in-flight call without replying (stdin closed)
        void        cancelAll();

        int         inFlightCount() const;

        static QJsonObject toolDefinition();

        // tools/call results for a finished bridge call
        static QJsonObject resultForAnswer(const core::Answer& answer);
        static QJsonObject resultForCancellation(const QString& reason);

      signals:
        void idle();

      private:
        QJsonObject handleInitialize(const QJsonObject& params) const;
        void        handleToolsCall(const QJsonValue& id, const QJsonObject& params);
        void        handleCancelled(const QJsonObject& params);
        void        onCallFinished(const QString& key, const QJsonValue& id, const BridgeResult& result);

        void        send(const QJsonObject& message) const;
        void        sendResult(const QJsonValue& id, const QJsonObject& result) const;
        void        sendError(const QJsonValue& id, int code, const QString& message) const;

        static QString idKey(const QJsonValue& id);

        BridgeClient*               m_client = nullptr;
        SendFn                      m_send;
        QHash<QString, BridgeCall*> m_inFlight;
        QSet<QString>               m_cancelledByPeer;
        bool                        m_initialized = false;
    };

} // namespace parley::mcp
