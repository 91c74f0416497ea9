#include "../common/Config.hpp"
#include "../common/Paths.hpp"
#include "BridgeClient.hpp"
#include "McpServer.hpp"
#include "StdioTransport.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

#include <print>

// stdout carries the protocol; every log line goes to stderr
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("parley-mcp");
    app.setApplicationVersion(parley::VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Parley tool server: lets an agent ask the user questions over MCP stdio.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption optPort(QStringList{"port", "p"}, "Gateway port of the running parley daemon.", "port");
    QCommandLineOption optConfig(QStringList{"config", "c"}, "Configuration file.", "path");
    parser.addOption(optPort);
    parser.addOption(optConfig);
    parser.process(app);

    const parley::Config config = parser.isSet(optConfig) ? parley::Config::load(parser.value(optConfig)) : parley::Config::load();

    std::optional<quint16> explicitPort;
    if (parser.isSet(optPort)) {
        bool       ok   = false;
        const uint port = parser.value(optPort).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            std::print(stderr, "parley-mcp: invalid port '{}'\n", parser.value(optPort).toStdString());
            return 2;
        }
        explicitPort = static_cast<quint16>(port);
    }

    const quint16              port = parley::resolveClientPort(config, explicitPort, parley::portFilePath());
    parley::mcp::BridgeClient  client(port, config.connectTimeoutMs, config.responseGraceMs, config.heartbeatTimeoutMs);

    // Not fatal: the daemon may be started after the agent
    if (!client.checkHealth()) {
        std::print(stderr, "parley-mcp: no parley daemon answering on 127.0.0.1:{}; questions will fail until it is started\n", port);
    }

    parley::mcp::McpServer      server(&client);
    parley::mcp::StdioTransport transport;

    server.setSendFunction([&transport](const QJsonObject& message) { transport.send(message); });
    QObject::connect(&transport, &parley::mcp::StdioTransport::lineReceived, &server, &parley::mcp::McpServer::handleLine);
    QObject::connect(&transport, &parley::mcp::StdioTransport::closed, &app, [&server, &app]() {
        // Aborting the HTTP requests lets the gateway drop the orphaned questions
        server.cancelAll();
        QTimer::singleShot(0, &app, &QCoreApplication::quit);
    });

    transport.start();
    return app.exec();
}
