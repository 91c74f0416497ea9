#include "StdioTransport.hpp"
#include "../common/Constants.hpp"

#include <QJsonDocument>
#include <QSocketNotifier>

#include <cerrno>
#include <print>
#include <unistd.h>

namespace parley::mcp {

    StdioTransport::StdioTransport(int readFd, int writeFd, QObject* parent) : QObject(parent), m_readFd(readFd), m_writeFd(writeFd) {}

    void StdioTransport::start() {
        if (m_notifier) {
            return;
        }

        m_notifier = new QSocketNotifier(m_readFd, QSocketNotifier::Read, this);
        connect(m_notifier, &QSocketNotifier::activated, this, &StdioTransport::onReadable);
    }

    bool StdioTransport::send(const QJsonObject& message) {
        QByteArray data = QJsonDocument(message).toJson(QJsonDocument::Compact);
        data.append('\n');

        const char* ptr       = data.constData();
        qsizetype   remaining = data.size();
        while (remaining > 0) {
            const ssize_t written = ::write(m_writeFd, ptr, static_cast<size_t>(remaining));
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                std::print(stderr, "parley-mcp: write to stdout failed: {}\n", errno);
                return false;
            }
            ptr += written;
            remaining -= written;
        }
        return true;
    }

    void StdioTransport::onReadable() {
        char          chunk[64 * 1024];
        const ssize_t n = ::read(m_readFd, chunk, sizeof(chunk));

        if (n < 0 && errno == EINTR) {
            return;
        }

        if (n <= 0) {
            m_notifier->setEnabled(false);
            // A final line without a trailing newline still counts
            const QByteArray rest = m_buffer.trimmed();
            m_buffer.clear();
            if (!rest.isEmpty()) {
                emit lineReceived(rest);
            }
            emit closed();
            return;
        }

        m_buffer.append(chunk, n);

        qsizetype idx;
        while ((idx = m_buffer.indexOf('\n')) != -1) {
            const QByteArray line = m_buffer.left(idx).trimmed();
            m_buffer.remove(0, idx + 1);
            if (!line.isEmpty()) {
                emit lineReceived(line);
            }
        }

        if (m_buffer.size() > static_cast<qsizetype>(MAX_MESSAGE_SIZE)) {
            std::print(stderr, "parley-mcp: dropping oversized message ({} bytes)\n", m_buffer.size());
            m_buffer.clear();
        }
    }

} // namespace parley::mcp
