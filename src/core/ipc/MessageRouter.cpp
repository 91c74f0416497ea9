#include "MessageRouter.hpp"

#include <algorithm>

namespace parley::core {

    void MessageRouter::registerHandler(const QString& type, HandlerFn handler) {
        m_routes.insert(type, Route{false, [handler = std::move(handler)](QLocalSocket* socket, const QString&, const QJsonObject& msg) { handler(socket, msg); }});
    }

    void MessageRouter::registerRequestHandler(const QString& type, RequestHandlerFn handler) {
        m_routes.insert(type, Route{true, std::move(handler)});
    }

    MessageRouter::DispatchStatus MessageRouter::dispatch(QLocalSocket* socket, const QString& type, const QJsonObject& msg) const {
        const auto it = m_routes.constFind(type);
        if (it == m_routes.constEnd()) {
            return DispatchStatus::UnknownType;
        }

        QString id;
        if (it->needsId) {
            const QJsonValue value = msg.value("id");
            id                     = value.isString() ? value.toString().trimmed() : QString();
            if (id.isEmpty()) {
                return DispatchStatus::MissingId;
            }
        }

        it->handler(socket, id, msg);
        return DispatchStatus::Handled;
    }

    bool MessageRouter::requiresId(const QString& type) const {
        const auto it = m_routes.constFind(type);
        return it != m_routes.constEnd() && it->needsId;
    }

    QStringList MessageRouter::types() const {
        QStringList types = m_routes.keys();
        std::sort(types.begin(), types.end());
        return types;
    }

} // namespace parley::core
