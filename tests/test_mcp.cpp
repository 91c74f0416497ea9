#include "../src/core/bridge/PresentationBridge.hpp"
#include "../src/core/gateway/Gateway.hpp"
#include "../src/core/registry/RequestRegistry.hpp"
#include "../src/mcp/BridgeClient.hpp"
#include "../src/mcp/McpServer.hpp"
#include "../src/mcp/StdioTransport.hpp"

#include <QtTest/QtTest>

#include <QJsonArray>
#include <QTcpServer>

#include <memory>
#include <unistd.h>

namespace parley::mcp {

    namespace {

        struct McpFixture {
            explicit McpFixture(int maxPending = DEFAULT_MAX_PENDING) : registry(maxPending), bridge(registry), gateway(registry, bridge) {
                QObject::connect(&bridge, &core::PresentationBridge::requestPresented, [this](const QString& id, const QJsonObject&) { presented << id; });
                started = gateway.start(0, 20);
                client  = std::make_unique<BridgeClient>(gateway.port(), 1000, 1000);
                server  = std::make_unique<McpServer>(client.get());
                server->setSendFunction([this](const QJsonObject& message) { sent << message; });
            }

            ~McpFixture() {
                server.reset();
                client.reset();
            }

            void call(int id, const QJsonObject& arguments, const QString& tool = INTERACT_TOOL_NAME) {
                server->handleMessage(QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", QJsonObject{{"name", tool}, {"arguments", arguments}}}});
            }

            core::RequestRegistry         registry;
            core::PresentationBridge      bridge;
            core::Gateway                 gateway;
            std::unique_ptr<BridgeClient> client;
            std::unique_ptr<McpServer>    server;
            QStringList                   presented;
            QList<QJsonObject>            sent;
            bool                          started = false;
        };

        QString firstText(const QJsonObject& result) {
            for (const QJsonValue& item : result.value("content").toArray()) {
                if (item.toObject().value("type").toString() == "text") {
                    return item.toObject().value("text").toString();
                }
            }
            return {};
        }

    } // namespace

    class McpServerTest : public QObject {
        Q_OBJECT

      private slots:
        void initialize_negotiatesProtocolVersion();
        void toolsList_describesInteract();
        void protocolErrors();
        void toolsCall_rejectsBadArguments();
        void toolsCall_returnsAnswer();
        void toolsCall_timeoutBecomesCancelledResult();
        void toolsCall_dismissIsNotAnError();
        void toolsCall_unreachableBridgeIsDistinctError();
        void toolsCall_fullRegistryIsBridgeBusy();
        void toolsCall_gatewayValidationIsInvalidParams();
        void cancelledNotification_abortsCallWithoutReply();
        void resultForAnswer_mapsAttachments();
        void stdioTransport_splitsLinesAndReportsEof();
    };

    void McpServerTest::initialize_negotiatesProtocolVersion() {
        McpFixture fixture;

        fixture.server->handleLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{}}})");
        fixture.server->handleLine(R"({"jsonrpc":"2.0","id":2,"method":"initialize","params":{"protocolVersion":"1999-01-01"}})");
        fixture.server->handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

        QCOMPARE(fixture.sent.size(), 2);
        const QJsonObject result = fixture.sent[0].value("result").toObject();
        QCOMPARE(fixture.sent[0].value("id").toInt(), 1);
        QCOMPARE(result.value("protocolVersion").toString(), QString("2025-03-26"));
        QCOMPARE(result.value("serverInfo").toObject().value("name").toString(), QString("parley-mcp"));
        QVERIFY(result.value("capabilities").toObject().contains("tools"));

        QCOMPARE(fixture.sent[1].value("result").toObject().value("protocolVersion").toString(), QString("2024-11-05"));
    }

    void McpServerTest::toolsList_describesInteract() {
        McpFixture fixture;
        fixture.server->handleLine(R"({"jsonrpc":"2.0","id":"list","method":"tools/list"})");

        QCOMPARE(fixture.sent.size(), 1);
        QCOMPARE(fixture.sent[0].value("id").toString(), QString("list"));

        const QJsonArray tools = fixture.sent[0].value("result").toObject().value("tools").toArray();
        QCOMPARE(tools.size(), 1);

        const QJsonObject tool = tools[0].toObject();
        QCOMPARE(tool.value("name").toString(), QString("interact"));
        const QJsonObject schema = tool.value("inputSchema").toObject();
        QCOMPARE(schema.value("required").toArray(), QJsonArray{"message"});
        for (const char* property : {"message", "predefined_options", "is_markdown", "timeout_seconds"}) {
            QVERIFY2(schema.value("properties").toObject().contains(property), property);
        }
    }

    void McpServerTest::protocolErrors() {
        McpFixture fixture;

        fixture.server->handleLine("{oops");
        fixture.server->handleLine(R"({"jsonrpc":"2.0","id":7,"method":"resources/list"})");
        fixture.server->handleLine(R"({"jsonrpc":"2.0","id":8,"method":"ping"})");
        fixture.server->handleLine(R"({"jsonrpc":"2.0","method":"notifications/unknown"})");

        QCOMPARE(fixture.sent.size(), 3);
        QCOMPARE(fixture.sent[0].value("error").toObject().value("code").toInt(), JSONRPC_PARSE_ERROR);
        QVERIFY(fixture.sent[0].value("id").isNull());
        QCOMPARE(fixture.sent[1].value("error").toObject().value("code").toInt(), JSONRPC_METHOD_NOT_FOUND);
        QCOMPARE(fixture.sent[2].value("id").toInt(), 8);
        QVERIFY(fixture.sent[2].value("result").isObject());
    }

    void McpServerTest::toolsCall_rejectsBadArguments() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        fixture.call(1, QJsonObject{});
        fixture.call(2, QJsonObject{{"message", "hi"}, {"predefined_options", "not an array"}});
        fixture.call(3, QJsonObject{{"message", "hi"}, {"timeout_seconds", 0}});
        fixture.call(4, QJsonObject{{"message", "hi"}, {"is_markdown", "yes"}});
        fixture.call(5, QJsonObject{{"message", "hi"}}, "delete_everything");

        QCOMPARE(fixture.sent.size(), 5);
        for (const QJsonObject& reply : std::as_const(fixture.sent)) {
            QCOMPARE(reply.value("error").toObject().value("code").toInt(), JSONRPC_INVALID_PARAMS);
        }
        QCOMPARE(fixture.registry.size(), 0);
    }

    void McpServerTest::toolsCall_returnsAnswer() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        fixture.call(10, QJsonObject{{"message", "# Plan\nWhich **database**?"}, {"predefined_options", QJsonArray{"postgres", "sqlite"}}, {"is_markdown", false}});
        QTRY_COMPARE(fixture.presented.size(), 1);
        QCOMPARE(fixture.server->inFlightCount(), 1);

        const auto info = fixture.registry.pendingInfo(fixture.presented.first());
        QVERIFY(info.has_value());
        QCOMPARE(info->question.renderHint, core::RenderHint::Plain);
        QCOMPARE(info->question.choices, QStringList({"postgres", "sqlite"}));

        core::Answer answer;
        answer.text            = "sqlite is enough for now";
        answer.selectedChoices = {"sqlite"};
        QCOMPARE(fixture.bridge.submitAnswer(fixture.presented.first(), answer), core::SubmitStatus::Ok);

        QTRY_COMPARE(fixture.sent.size(), 1);
        const QJsonObject reply = fixture.sent[0];
        QCOMPARE(reply.value("id").toInt(), 10);
        const QJsonObject result = reply.value("result").toObject();
        QCOMPARE(result.value("isError").toBool(true), false);
        QCOMPARE(firstText(result), QString("Selected options: sqlite\n\nsqlite is enough for now"));
        QCOMPARE(fixture.server->inFlightCount(), 0);
    }

    void McpServerTest::toolsCall_timeoutBecomesCancelledResult() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        fixture.call(11, QJsonObject{{"message", "Still there?"}, {"timeout_seconds", 1}});

        QTRY_VERIFY_WITH_TIMEOUT(fixture.sent.size() == 1, 5000);
        const QJsonObject result = fixture.sent[0].value("result").toObject();
        QCOMPARE(result.value("isError").toBool(true), false);
        QCOMPARE(firstText(result), QString("No response from the user (expired)."));
        QCOMPARE(result.value("_meta").toObject().value("parley").toObject().value("status").toString(), QString("cancelled"));
    }

    void McpServerTest::toolsCall_dismissIsNotAnError() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        fixture.call(12, QJsonObject{{"message", "Optional question"}});
        QTRY_COMPARE(fixture.presented.size(), 1);
        QCOMPARE(fixture.bridge.dismiss(fixture.presented.first()), core::SubmitStatus::Ok);

        QTRY_COMPARE(fixture.sent.size(), 1);
        QVERIFY(!fixture.sent[0].contains("error"));
        QCOMPARE(firstText(fixture.sent[0].value("result").toObject()), QString("No response from the user (dismissed)."));
    }

    void McpServerTest::toolsCall_unreachableBridgeIsDistinctError() {
        quint16 port = 0;
        {
            QTcpServer placeholder;
            QVERIFY(placeholder.listen(QHostAddress::LocalHost, 0));
            port = placeholder.serverPort();
        }

        BridgeClient       client(port, 1000, 1000);
        McpServer          server(&client);
        QList<QJsonObject> sent;
        server.setSendFunction([&sent](const QJsonObject& message) { sent << message; });

        server.handleMessage(QJsonObject{{"jsonrpc", "2.0"}, {"id", 13}, {"method", "tools/call"}, {"params", QJsonObject{{"name", "interact"}, {"arguments", QJsonObject{{"message", "hello?"}}}}}});

        QTRY_VERIFY_WITH_TIMEOUT(sent.size() == 1, 3000);
        QCOMPARE(sent[0].value("error").toObject().value("code").toInt(), JSONRPC_BRIDGE_UNAVAILABLE);
        QVERIFY(sent[0].value("error").toObject().value("message").toString().startsWith("bridge unavailable"));
    }

    void McpServerTest::toolsCall_fullRegistryIsBridgeBusy() {
        McpFixture fixture(1);
        QVERIFY(fixture.started);

        fixture.call(14, QJsonObject{{"message", "first"}});
        QTRY_COMPARE(fixture.registry.size(), 1);

        fixture.call(15, QJsonObject{{"message", "second"}});
        QTRY_COMPARE(fixture.sent.size(), 1);
        QCOMPARE(fixture.sent[0].value("id").toInt(), 15);
        QCOMPARE(fixture.sent[0].value("error").toObject().value("code").toInt(), JSONRPC_BRIDGE_BUSY);
        QVERIFY(fixture.sent[0].value("error").toObject().value("message").toString().contains("too many pending"));
    }

    void McpServerTest::toolsCall_gatewayValidationIsInvalidParams() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        QJsonArray options;
        for (int i = 0; i <= MAX_CHOICES; ++i) {
            options.append(QString("option %1").arg(i));
        }

        fixture.call(17, QJsonObject{{"message", "Pick one"}, {"predefined_options", options}});
        QTRY_COMPARE(fixture.sent.size(), 1);
        QCOMPARE(fixture.sent[0].value("id").toInt(), 17);
        QCOMPARE(fixture.sent[0].value("error").toObject().value("code").toInt(), JSONRPC_INVALID_PARAMS);
        QVERIFY(fixture.sent[0].value("error").toObject().value("message").toString().contains("choices"));
        QCOMPARE(fixture.registry.size(), 0);
    }

    void McpServerTest::cancelledNotification_abortsCallWithoutReply() {
        McpFixture fixture;
        QVERIFY(fixture.started);

        fixture.call(16, QJsonObject{{"message", "Long question"}});
        QTRY_COMPARE(fixture.presented.size(), 1);
        const QString id = fixture.presented.first();

        fixture.server->handleMessage(QJsonObject{{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", QJsonObject{{"requestId", 16}, {"reason", "user pressed escape"}}}});

        QTRY_COMPARE(fixture.server->inFlightCount(), 0);
        QTRY_COMPARE(fixture.registry.size(), 0);
        QCOMPARE(fixture.registry.terminalState(id).value_or(core::TerminalState::Answered), core::TerminalState::CallerGone);

        QTest::qWait(50);
        QVERIFY(fixture.sent.isEmpty());
    }

    void McpServerTest::resultForAnswer_mapsAttachments() {
        core::Answer answer;
        answer.attachments << core::Attachment{QByteArray("\x89PNG"), "image/png", QString("shot.png")};
        answer.attachments << core::Attachment{QByteArray(2048, 'a'), "text/plain", std::nullopt};

        const QJsonObject result  = McpServer::resultForAnswer(answer);
        const QJsonArray  content = result.value("content").toArray();

        QCOMPARE(content.size(), 2);
        QCOMPARE(content[0].toObject().value("type").toString(), QString("image"));
        QCOMPARE(content[0].toObject().value("mimeType").toString(), QString("image/png"));
        QCOMPARE(QByteArray::fromBase64(content[0].toObject().value("data").toString().toLatin1()), QByteArray("\x89PNG"));

        const QString text = content[1].toObject().value("text").toString();
        QVERIFY(text.contains("Attached image: shot.png (image/png, 4 B)"));
        QVERIFY(text.contains("Attached file: unnamed (text/plain, 2.0 KB)"));

        QCOMPARE(firstText(McpServer::resultForAnswer(core::Answer{})), QString("The user did not provide any content."));
    }

    void McpServerTest::stdioTransport_splitsLinesAndReportsEof() {
        int input[2];
        int output[2];
        QVERIFY(::pipe(input) == 0);
        QVERIFY(::pipe(output) == 0);

        StdioTransport transport(input[0], output[1]);
        QList<QByteArray> lines;
        bool              closed = false;
        connect(&transport, &StdioTransport::lineReceived, [&lines](const QByteArray& line) { lines << line; });
        connect(&transport, &StdioTransport::closed, [&closed]() { closed = true; });
        transport.start();

        const QByteArray data = "{\"a\":1}\n\n  {\"b\":2}\r\n{\"c\":3}";
        QCOMPARE(::write(input[1], data.constData(), data.size()), static_cast<ssize_t>(data.size()));
        QTRY_COMPARE(lines.size(), 2);
        QCOMPARE(lines[0], QByteArray("{\"a\":1}"));
        QCOMPARE(lines[1], QByteArray("{\"b\":2}"));

        ::close(input[1]);
        QTRY_VERIFY(closed);
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines[2], QByteArray("{\"c\":3}"));

        QVERIFY(transport.send(QJsonObject{{"jsonrpc", "2.0"}, {"id", 1}}));
        char          buffer[256];
        const ssize_t n = ::read(output[0], buffer, sizeof(buffer));
        QVERIFY(n > 0);
        QCOMPARE(QByteArray(buffer, n), QByteArray("{\"id\":1,\"jsonrpc\":\"2.0\"}\n"));

        ::close(input[0]);
        ::close(output[0]);
        ::close(output[1]);
    }

} // namespace parley::mcp

int runMcpTests(int argc, char** argv) {
    parley::mcp::McpServerTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_mcp.moc"
