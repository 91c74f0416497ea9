#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <functional>

class QLocalSocket;

namespace parley::core {

    // Control-socket dispatch by message "type". Request routes only run when
    // the message carries a non-empty string "id"; the handler gets it trimmed.
    class MessageRouter {
      public:
        using HandlerFn        = std::function<void(QLocalSocket*, const QJsonObject&)>;
        using RequestHandlerFn = std::function<void(QLocalSocket*, const QString& id, const QJsonObject&)>;

        enum class DispatchStatus {
            Handled,
            UnknownType,
            MissingId
        };

        void           registerHandler(const QString& type, HandlerFn handler);
        void           registerRequestHandler(const QString& type, RequestHandlerFn handler);

        DispatchStatus dispatch(QLocalSocket* socket, const QString& type, const QJsonObject& msg) const;

        bool           requiresId(const QString& type) const;
        QStringList    types() const;

      private:
        struct Route {
            bool             needsId = false;
            RequestHandlerFn handler;
        };

        QHash<QString, Route> m_routes;
    };

} // namespace parley::core
