#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QObject>

class QSocketNotifier;

namespace parley::mcp {

    // Newline-delimited messages over a pair of file descriptors (stdin/stdout by default)
    class StdioTransport : public QObject {
        Q_OBJECT

      public:
        explicit StdioTransport(int readFd = 0, int writeFd = 1, QObject* parent = nullptr);

        void start();
        bool send(const QJsonObject& message);

      signals:
        void lineReceived(const QByteArray& line);
        void closed();

      private slots:
        void onReadable();

      private:
        int              m_readFd;
        int              m_writeFd;
        QSocketNotifier* m_notifier = nullptr;
        QByteArray       m_buffer;
    };

} // namespace parley::mcp
