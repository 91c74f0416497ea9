#pragma once

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>

#include <functional>

namespace parley::core {

    // Callback type for handling parsed JSON messages
    // Parameters: socket, message type, full JSON object
    using MessageHandler = std::function<void(QLocalSocket*, const QString&, const QJsonObject&)>;

    // Newline-delimited JSON server on the daemon control socket
    class IpcServer : public QObject {
        Q_OBJECT

      public:
        explicit IpcServer(QObject* parent = nullptr);
        ~IpcServer() override;

        // Start listening on the given socket path; a stale socket file is replaced.
        // Returns false if binding fails
        bool                 start(const QString& socketPath);

        // Stop the server and disconnect all clients
        void                 stop();

        void                 setMessageHandler(MessageHandler handler);

        void                 sendJson(QLocalSocket* socket, const QJsonObject& json);

        // Event stream subscribers; a socket is dropped when it disconnects
        void                 addSubscriber(QLocalSocket* socket);
        void                 broadcast(const QJsonObject& json);
        QList<QLocalSocket*> subscribers() const;

        QString              errorString() const;

      signals:
        void clientConnected(QLocalSocket* socket);
        void clientDisconnected(QLocalSocket* socket);

      private slots:
        void onNewConnection();
        void onReadyRead();
        void onDisconnected();

      private:
        void                             handleLine(QLocalSocket* socket, const QByteArray& line);

        QLocalServer*                    m_server = nullptr;
        MessageHandler                   m_handler;
        QHash<QLocalSocket*, QByteArray> m_buffers;
        QSet<QLocalSocket*>              m_subscribers;
        QString                          m_errorString;
    };

} // namespace parley::core
