#pragma once

#include <QJsonObject>
#include <QList>
#include <QQueue>

class QLocalSocket;

namespace parley::core {

    // Backlog of request.created events for "next" long polls. Events for
    // requests that closed before anyone took them are discarded.
    class EventQueue {
      public:
        explicit EventQueue(int maxSize = 256);

        bool        isEmpty() const;
        int         size() const;
        QJsonObject takeNext();

        void        enqueue(const QJsonObject& event);
        bool        discard(const QString& id);
        void        subscribeNext(QLocalSocket* socket);
        void        removeWaiter(QLocalSocket* socket);

        template <typename SendFn>
        void drainToWaiters(SendFn sendFn) {
            while (!m_nextWaiters.isEmpty() && !m_eventQueue.isEmpty()) {
                QLocalSocket* socket = m_nextWaiters.takeFirst();
                sendFn(socket, m_eventQueue.takeFirst());
            }
        }

      private:
        int                  m_maxSize;
        QQueue<QJsonObject>  m_eventQueue;
        QList<QLocalSocket*> m_nextWaiters;
    };

} // namespace parley::core
