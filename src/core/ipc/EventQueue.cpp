#include "EventQueue.hpp"

namespace parley::core {

    EventQueue::EventQueue(int maxSize) : m_maxSize(maxSize) {}

    bool EventQueue::isEmpty() const {
        return m_eventQueue.isEmpty();
    }

    int EventQueue::size() const {
        return static_cast<int>(m_eventQueue.size());
    }

    QJsonObject EventQueue::takeNext() {
        return m_eventQueue.isEmpty() ? QJsonObject{} : m_eventQueue.takeFirst();
    }

    void EventQueue::enqueue(const QJsonObject& event) {
        if (m_eventQueue.size() >= m_maxSize) {
            m_eventQueue.dequeue();
        }
        m_eventQueue.enqueue(event);
    }

    bool EventQueue::discard(const QString& id) {
        return m_eventQueue.removeIf([&id](const QJsonObject& event) { return event.value("id").toString() == id; }) > 0;
    }

    void EventQueue::subscribeNext(QLocalSocket* socket) {
        if (!m_nextWaiters.contains(socket)) {
            m_nextWaiters.append(socket);
        }
    }

    void EventQueue::removeWaiter(QLocalSocket* socket) {
        m_nextWaiters.removeAll(socket);
    }

} // namespace parley::core
