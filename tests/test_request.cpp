#include "../src/common/Config.hpp"
#include "../src/core/Request.hpp"

#include <QtTest/QtTest>

#include <QJsonArray>
#include <QTemporaryDir>

namespace parley {

    class RequestCodecTest : public QObject {
        Q_OBJECT

      private slots:
        void submitRequest_acceptsMinimalPayload();
        void submitRequest_parsesChoicesHintAndDeadline();
        void submitRequest_removesDuplicateChoices();
        void submitRequest_rejectsMissingOrEmptyText();
        void submitRequest_rejectsOversizedText();
        void submitRequest_rejectsTooManyChoices();
        void submitRequest_rejectsUnknownRenderHint();
        void submitRequest_rejectsBadDeadline_data();
        void submitRequest_rejectsBadDeadline();
        void answer_decodesAttachments();
        void answer_rejectsInvalidBase64();
        void answer_rejectsNonStringText();
        void outcome_unknownCancelReasonStillCancels();

        void config_readsIniGroups();
        void config_portFileOverridesConfiguredPort();
    };

    void RequestCodecTest::submitRequest_acceptsMinimalPayload() {
        QString    error;
        const auto request = core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "Deploy now?"}}}}, &error);

        QVERIFY2(request.has_value(), qPrintable(error));
        QCOMPARE(request->question.text, QString("Deploy now?"));
        QVERIFY(request->question.choices.isEmpty());
        QCOMPARE(request->question.renderHint, core::RenderHint::Markdown);
        QVERIFY(!request->deadlineMs.has_value());
    }

    void RequestCodecTest::submitRequest_parsesChoicesHintAndDeadline() {
        const QJsonObject body{{"payload", QJsonObject{{"text", "Pick one"}, {"choices", QJsonArray{"red", "green"}}, {"render_hint", "plain"}}}, {"deadline_ms", 1500}};

        QString    error;
        const auto request = core::parseSubmitRequest(body, &error);

        QVERIFY2(request.has_value(), qPrintable(error));
        QCOMPARE(request->question.choices, QStringList({"red", "green"}));
        QCOMPARE(request->question.renderHint, core::RenderHint::Plain);
        QCOMPARE(request->deadlineMs.value_or(0), qint64(1500));
    }

    void RequestCodecTest::submitRequest_removesDuplicateChoices() {
        const QJsonObject body{{"payload", QJsonObject{{"text", "Pick"}, {"choices", QJsonArray{"a", "b", "a"}}}}};

        const auto        request = core::parseSubmitRequest(body, nullptr);
        QVERIFY(request.has_value());
        QCOMPARE(request->question.choices, QStringList({"a", "b"}));
    }

    void RequestCodecTest::submitRequest_rejectsMissingOrEmptyText() {
        QString error;
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{}}}, &error));
        QVERIFY(error.contains("text"));

        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "   "}}}}, &error));
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", 42}}}}, &error));
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"text", "no payload wrapper"}}, &error));
        QVERIFY(error.contains("payload"));
    }

    void RequestCodecTest::submitRequest_rejectsOversizedText() {
        const QString atLimit(static_cast<qsizetype>(MAX_QUESTION_TEXT_SIZE), QChar('x'));
        QVERIFY(core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", atLimit}}}}, nullptr));

        const QString tooLong = atLimit + "x";
        QString       error;
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", tooLong}}}}, &error));
        QVERIFY(error.contains("maximum size"));
    }

    void RequestCodecTest::submitRequest_rejectsTooManyChoices() {
        QJsonArray choices;
        for (int i = 0; i < MAX_CHOICES; ++i) {
            choices.append(QString("option %1").arg(i));
        }
        QVERIFY(core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "q"}, {"choices", choices}}}}, nullptr));

        choices.append("one too many");
        QString error;
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "q"}, {"choices", choices}}}}, &error));
        QVERIFY(error.contains("choices"));
    }

    void RequestCodecTest::submitRequest_rejectsUnknownRenderHint() {
        QString error;
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "q"}, {"render_hint", "html"}}}}, &error));
        QVERIFY(error.contains("render_hint"));
    }

    void RequestCodecTest::submitRequest_rejectsBadDeadline_data() {
        QTest::addColumn<QJsonValue>("deadline");

        QTest::newRow("zero") << QJsonValue(0);
        QTest::newRow("negative") << QJsonValue(-5);
        QTest::newRow("fraction") << QJsonValue(1.5);
        QTest::newRow("string") << QJsonValue("100");
        QTest::newRow("huge") << QJsonValue(1e300);
    }

    void RequestCodecTest::submitRequest_rejectsBadDeadline() {
        QFETCH(QJsonValue, deadline);

        QString error;
        QVERIFY(!core::parseSubmitRequest(QJsonObject{{"payload", QJsonObject{{"text", "q"}}}, {"deadline_ms", deadline}}, &error));
        QVERIFY(error.contains("deadline_ms"));
    }

    void RequestCodecTest::answer_decodesAttachments() {
        const QJsonObject obj{{"text", "see attached"},
                              {"choices", QJsonArray{"yes"}},
                              {"attachments", QJsonArray{QJsonObject{{"data_base64", "aGVsbG8="}, {"media_type", "text/plain"}, {"filename", "hello.txt"}},
                                                         QJsonObject{{"data_base64", ""}, {"media_type", "application/octet-stream"}, {"filename", QJsonValue::Null}}}}};

        QString    error;
        const auto answer = core::parseAnswer(obj, &error);

        QVERIFY2(answer.has_value(), qPrintable(error));
        QCOMPARE(answer->text.value_or(QString()), QString("see attached"));
        QCOMPARE(answer->selectedChoices, QStringList({"yes"}));
        QCOMPARE(answer->attachments.size(), 2);
        QCOMPARE(answer->attachments[0].data, QByteArray("hello"));
        QCOMPARE(answer->attachments[0].filename.value_or(QString()), QString("hello.txt"));
        QVERIFY(answer->attachments[1].data.isEmpty());
        QVERIFY(!answer->attachments[1].filename.has_value());
    }

    void RequestCodecTest::answer_rejectsInvalidBase64() {
        const QJsonObject obj{{"attachments", QJsonArray{QJsonObject{{"data_base64", "not base64!!"}, {"media_type", "text/plain"}}}}};

        QString           error;
        QVERIFY(!core::parseAnswer(obj, &error));
        QVERIFY(error.contains("base64"));
    }

    void RequestCodecTest::answer_rejectsNonStringText() {
        QString error;
        QVERIFY(!core::parseAnswer(QJsonObject{{"text", 12}}, &error));

        const auto empty = core::parseAnswer(QJsonObject{{"text", QJsonValue::Null}}, &error);
        QVERIFY(empty.has_value());
        QVERIFY(!empty->text.has_value());
    }

    void RequestCodecTest::outcome_unknownCancelReasonStillCancels() {
        const auto outcome = core::parseOutcome(QJsonObject{{"status", "cancelled"}, {"reason", "something_new"}}, nullptr);
        QVERIFY(outcome.has_value());
        QVERIFY(std::holds_alternative<core::Cancellation>(*outcome));

        QString error;
        QVERIFY(!core::parseOutcome(QJsonObject{{"status", "pending"}}, &error));
    }

    void RequestCodecTest::config_readsIniGroups() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString path = dir.filePath("parley.conf");
        {
            QFile file(path);
            QVERIFY(file.open(QIODevice::WriteOnly));
            file.write("[gateway]\nport=18000\nsweep_interval_ms=50\nmax_pending=3\nmax_request_age_ms=60000\nheartbeat_interval_ms=2500\n"
                       "[client]\nresponse_grace_ms=750\nheartbeat_timeout_ms=0\n"
                       "[history]\nenabled=false\nfile=/tmp/parley-history.json\nmax_records=500\n");
        }

        qunsetenv("PARLEY_PORT");
        const Config config = Config::load(path);
        QCOMPARE(config.port, quint16(18000));
        QCOMPARE(config.sweepIntervalMs, 50);
        QCOMPARE(config.maxPending, 3);
        QCOMPARE(config.maxRequestAgeMs, qint64(60000));
        QCOMPARE(config.responseGraceMs, 750);
        QCOMPARE(config.connectTimeoutMs, DEFAULT_CONNECT_TIMEOUT_MS);
        QCOMPARE(config.heartbeatMs, 2500);
        QCOMPARE(config.idleTimeoutMs, DEFAULT_IDLE_TIMEOUT_MS);
        QCOMPARE(config.heartbeatTimeoutMs, DEFAULT_HEARTBEAT_TIMEOUT_MS);
        QVERIFY(!config.historyEnabled);
        QCOMPARE(config.historyFile, QString("/tmp/parley-history.json"));
        QCOMPARE(config.historyMaxRecords, MAX_HISTORY_RECORDS);

        qputenv("PARLEY_PORT", "18001");
        QCOMPARE(Config::load(path).port, quint16(18001));
        qunsetenv("PARLEY_PORT");
    }

    void RequestCodecTest::config_portFileOverridesConfiguredPort() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString portFile = dir.filePath("parley.port");
        Config        config;
        config.port = 16000;

        qunsetenv("PARLEY_PORT");
        QCOMPARE(resolveClientPort(config, std::nullopt, portFile), quint16(16000));

        QVERIFY(writePortFile(portFile, 43210));
        QCOMPARE(readPortFile(portFile).value_or(0), quint16(43210));
        QCOMPARE(resolveClientPort(config, std::nullopt, portFile), quint16(43210));
        QCOMPARE(resolveClientPort(config, quint16(12345), portFile), quint16(12345));

        removePortFile(portFile);
        QVERIFY(!readPortFile(portFile).has_value());
    }

} // namespace parley

int runRequestTests(int argc, char** argv) {
    parley::RequestCodecTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_request.moc"
