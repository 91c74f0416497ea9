#include "common/Config.hpp"
#include "common/IpcClient.hpp"
#include "common/Paths.hpp"
#include "core/Request.hpp"
#include "mcp/BridgeClient.hpp"
#include "modes/daemon.hpp"

#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <cstring>
#include <memory>
#include <print>

namespace {

    // Commands that talk to a running daemon and never need a display
    constexpr const char* CLI_FLAGS[] = {"--ping", "--pending", "--next", "--respond", "--dismiss", "--health", "--history", "--clear-history", "--headless", "--help", "-h", "--version", "-v"};

    bool needsGui(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            for (const char* flag : CLI_FLAGS) {
                const std::size_t len = std::strlen(flag);
                if (std::strncmp(argv[i], flag, len) == 0 && (argv[i][len] == '\0' || argv[i][len] == '=')) {
                    return false;
                }
            }
        }
        return true;
    }

    void printJson(const QJsonObject& obj) {
        std::print("{}\n", QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString());
    }

    // stdin holds either an answer object or plain reply text
    std::optional<parley::core::Answer> readAnswerFromStdin(QString* error) {
        QFile input;
        if (!input.open(stdin, QIODevice::ReadOnly)) {
            *error = "cannot read stdin";
            return std::nullopt;
        }

        const QByteArray data = input.readAll();
        const auto       doc  = QJsonDocument::fromJson(data);
        if (doc.isObject()) {
            return parley::core::parseAnswer(doc.object(), error);
        }

        parley::core::Answer answer;
        QString              text = QString::fromUtf8(data);
        if (text.endsWith('\n')) {
            text.chop(1);
        }
        answer.text = text;
        return answer;
    }

    int printResult(const std::optional<QJsonObject>& response, const parley::IpcClient& client) {
        if (!response) {
            std::print(stderr, "parley: {}\n", client.lastError().toStdString());
            return 1;
        }
        if (!response->value("ok").toBool()) {
            std::print(stderr, "parley: {}\n", response->value("message").toString().toStdString());
            return 1;
        }
        return 0;
    }

    int runCli(QCoreApplication& app) {
        QCommandLineParser parser;
        parser.setApplicationDescription("Parley - lets coding agents ask you questions and wait for the answer");
        parser.addHelpOption();
        parser.addVersionOption();

        // Daemon options
        QCommandLineOption optDaemon(QStringList{"daemon", "d"}, "Run the daemon (gateway + control socket + prompt window).");
        QCommandLineOption optHeadless(QStringList{"headless"}, "Run the daemon without the prompt window.");
        QCommandLineOption optPort(QStringList{"port", "p"}, "Gateway port (0 picks a free port).", "port");
        QCommandLineOption optConfig(QStringList{"config", "c"}, "Configuration file.", "path");
        QCommandLineOption optSocket(QStringList{"socket", "s"}, "Override control socket path.", "path");

        // CLI options (for interacting with running daemon)
        QCommandLineOption optPing(QStringList{"ping"}, "Check if the daemon is reachable.");
        QCommandLineOption optPending(QStringList{"pending"}, "List pending questions.");
        QCommandLineOption optNext(QStringList{"next"}, "Wait for the next new question and print it.");
        QCommandLineOption optRespond(QStringList{"respond"}, "Answer a question; the answer (JSON object or text) is read from stdin.", "id");
        QCommandLineOption optDismiss(QStringList{"dismiss"}, "Dismiss a question.", "id");
        QCommandLineOption optHealth(QStringList{"health"}, "Query the gateway health endpoint.");
        QCommandLineOption optHistory(QStringList{"history"}, "Show recently answered questions, newest first.");
        QCommandLineOption optLimit(QStringList{"limit"}, "Number of history records to show.", "n");
        QCommandLineOption optSearch(QStringList{"search"}, "Only show history records whose question or reply contains text.", "text");
        QCommandLineOption optClearHistory(QStringList{"clear-history"}, "Delete the answer history.");

        parser.addOptions({optDaemon, optHeadless, optPort, optConfig, optSocket, optPing, optPending, optNext, optRespond, optDismiss, optHealth, optHistory, optLimit, optSearch,
                           optClearHistory});
        parser.process(app);

        parley::Config config = parser.isSet(optConfig) ? parley::Config::load(parser.value(optConfig)) : parley::Config::load();

        std::optional<quint16> explicitPort;
        if (parser.isSet(optPort)) {
            bool       ok   = false;
            const uint port = parser.value(optPort).toUInt(&ok);
            if (!ok || port > 65535) {
                std::print(stderr, "parley: invalid port '{}'\n", parser.value(optPort).toStdString());
                return 2;
            }
            explicitPort = static_cast<quint16>(port);
            config.port  = *explicitPort;
        }

        const QString     socketPath = parser.isSet(optSocket) ? parser.value(optSocket) : parley::socketPath();
        parley::IpcClient client(socketPath);

        if (parser.isSet(optPing)) {
            const bool ok = client.ping();
            if (!ok) {
                std::print(stderr, "parley: {}\n", client.lastError().toStdString());
            }
            return ok ? 0 : 1;
        }

        if (parser.isSet(optHealth)) {
            parley::mcp::BridgeClient bridge(parley::resolveClientPort(config, explicitPort, parley::portFilePath()), config.connectTimeoutMs, config.responseGraceMs,
                                                      config.heartbeatTimeoutMs);
            QJsonObject               health;
            if (!bridge.checkHealth(parley::HEALTH_CHECK_TIMEOUT_MS, &health)) {
                std::print(stderr, "parley: gateway on port {} is not healthy\n", bridge.port());
                return 1;
            }
            printJson(health);
            return 0;
        }

        if (parser.isSet(optPending)) {
            auto response = client.sendRequest(QJsonObject{{"type", "pending"}});
            if (!response) {
                std::print(stderr, "parley: {}\n", client.lastError().toStdString());
                return 1;
            }
            printJson(*response);
            return 0;
        }

        if (parser.isSet(optNext)) {
            auto response = client.sendRequest(QJsonObject{{"type", "next"}}, -1);
            if (!response) {
                std::print(stderr, "parley: {}\n", client.lastError().toStdString());
                return 1;
            }
            printJson(*response);
            return 0;
        }

        if (parser.isSet(optHistory)) {
            QJsonObject request{{"type", "history"}};
            if (parser.isSet(optLimit)) {
                bool      ok    = false;
                const int limit = parser.value(optLimit).toInt(&ok);
                if (!ok || limit < 1) {
                    std::print(stderr, "parley: invalid limit '{}'\n", parser.value(optLimit).toStdString());
                    return 2;
                }
                request["limit"] = limit;
            }
            if (parser.isSet(optSearch)) {
                request["query"] = parser.value(optSearch);
            }

            auto response = client.sendRequest(request);
            if (!response || response->value("type").toString() == "error") {
                std::print(stderr, "parley: {}\n", response ? response->value("message").toString().toStdString() : client.lastError().toStdString());
                return 1;
            }
            printJson(*response);
            return 0;
        }

        if (parser.isSet(optClearHistory)) {
            auto response = client.sendRequest(QJsonObject{{"type", "history.clear"}});
            if (!response || response->value("type").toString() == "error") {
                std::print(stderr, "parley: {}\n", response ? response->value("message").toString().toStdString() : client.lastError().toStdString());
                return 1;
            }
            std::print("Removed {} record(s)\n", response->value("removed").toInt());
            return 0;
        }

        if (parser.isSet(optRespond)) {
            QString    error;
            const auto answer = readAnswerFromStdin(&error);
            if (!answer) {
                std::print(stderr, "parley: invalid answer: {}\n", error.toStdString());
                return 2;
            }

            auto response = client.sendRequest(QJsonObject{{"type", "request.submit"}, {"id", parser.value(optRespond)}, {"answer", parley::core::answerToJson(*answer)}});
            return printResult(response, client);
        }

        if (parser.isSet(optDismiss)) {
            auto response = client.sendRequest(QJsonObject{{"type", "request.dismiss"}, {"id", parser.value(optDismiss)}});
            return printResult(response, client);
        }

        // No CLI command - run the daemon
        const bool headless = parser.isSet(optHeadless) || !qobject_cast<QApplication*>(&app);
        return modes::runDaemon(app, config, socketPath, headless);
    }

} // namespace

int main(int argc, char* argv[]) {
    std::unique_ptr<QCoreApplication> app;
    if (needsGui(argc, argv)) {
        app = std::make_unique<QApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }
    app->setApplicationName("parley");
    app->setApplicationVersion(parley::VERSION);

    return runCli(*app);
}
