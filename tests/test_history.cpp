#include "../src/core/history/HistoryStore.hpp"

#include <QtTest/QtTest>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

namespace parley::core {

    namespace {

        HistoryRecord makeRecord(int n, const QString& response = {}) {
            Question question;
            question.text    = QString("question %1").arg(n);
            question.choices = {"yes", "no"};

            Answer answer;
            if (!response.isEmpty()) {
                answer.text = response;
            }
            answer.selectedChoices = {"yes"};
            answer.submittedAtMs   = 1700000000000 + n;
            return makeHistoryRecord(QString("id-%1").arg(n), question, answer);
        }

        QJsonObject readFile(const QString& path) {
            QFile file(path);
            if (!file.open(QIODevice::ReadOnly)) {
                return {};
            }
            return QJsonDocument::fromJson(file.readAll()).object();
        }

    } // namespace

    class HistoryStoreTest : public QObject {
        Q_OBJECT

      private slots:
        void init();
        void cleanup();

        void load_missingFileIsEmpty();
        void load_corruptFileReportsError();
        void add_keepsNewestFirstAndPersists();
        void add_capsAtMaxRecords();
        void load_truncatesOversizedFile();
        void search_matchesMessageAndResponse();
        void clear_removesEverything();
        void record_describesAttachmentsWithoutData();
        void record_rejectsMissingIdOrTimestamp();

      private:
        QString                        path() const;

        std::unique_ptr<QTemporaryDir> m_dir;
    };

    void HistoryStoreTest::init() {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
    }

    void HistoryStoreTest::cleanup() {
        m_dir.reset();
    }

    QString HistoryStoreTest::path() const {
        return m_dir->filePath("nested/history.json");
    }

    void HistoryStoreTest::load_missingFileIsEmpty() {
        HistoryStore store(path());
        QVERIFY(store.load());
        QCOMPARE(store.size(), 0);
        QVERIFY(store.errorString().isEmpty());
        QVERIFY(!QFile::exists(path()));
    }

    void HistoryStoreTest::load_corruptFileReportsError() {
        const QString corrupt = m_dir->filePath("history.json");
        QFile         file(corrupt);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{not json");
        file.close();

        HistoryStore store(corrupt);
        QVERIFY(!store.load());
        QVERIFY(store.errorString().contains(corrupt));
        QCOMPARE(store.size(), 0);

        QVERIFY(store.add(makeRecord(1, "ok")));
        HistoryStore reloaded(corrupt);
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.size(), 1);
    }

    void HistoryStoreTest::add_keepsNewestFirstAndPersists() {
        HistoryStore store(path());
        QVERIFY(store.load());
        QVERIFY(store.add(makeRecord(1, "first")));
        QVERIFY(store.add(makeRecord(2, "second")));

        const QJsonArray records = readFile(path()).value("records").toArray();
        QCOMPARE(records.size(), 2);
        QCOMPARE(records[0].toObject().value("id").toString(), QString("id-2"));
        QCOMPARE(records[0].toObject().value("timestamp").toString(), QString("2023-11-14T22:13:20.002Z"));

        HistoryStore reloaded(path());
        QVERIFY(reloaded.load());
        const QList<HistoryRecord> recent = reloaded.recent(10);
        QCOMPARE(recent.size(), 2);
        QCOMPARE(recent[0].id, QString("id-2"));
        QCOMPARE(recent[0].response, std::optional<QString>("second"));
        QCOMPARE(recent[0].choices, QStringList({"yes", "no"}));
        QCOMPARE(recent[0].selectedChoices, QStringList({"yes"}));
        QCOMPARE(recent[1].id, QString("id-1"));
        QCOMPARE(recent[1].timestamp, QDateTime::fromMSecsSinceEpoch(1700000000001, QTimeZone::UTC));
    }

    void HistoryStoreTest::add_capsAtMaxRecords() {
        HistoryStore store(path());
        QCOMPARE(store.maxRecords(), MAX_HISTORY_RECORDS);
        QVERIFY(store.load());

        for (int i = 1; i <= MAX_HISTORY_RECORDS + 5; ++i) {
            QVERIFY(store.add(makeRecord(i)));
        }
        QCOMPARE(store.size(), MAX_HISTORY_RECORDS);
        QCOMPARE(store.recent(1).first().id, QString("id-%1").arg(MAX_HISTORY_RECORDS + 5));

        HistoryStore reloaded(path());
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.size(), MAX_HISTORY_RECORDS);

        // Oldest five were dropped
        const QList<HistoryRecord> all = reloaded.recent(MAX_HISTORY_RECORDS);
        QCOMPARE(all.last().id, QString("id-6"));
        QCOMPARE(readFile(path()).value("records").toArray().size(), MAX_HISTORY_RECORDS);
    }

    void HistoryStoreTest::load_truncatesOversizedFile() {
        {
            HistoryStore store(path(), 10);
            QVERIFY(store.load());
            for (int i = 1; i <= 10; ++i) {
                QVERIFY(store.add(makeRecord(i)));
            }
        }

        HistoryStore smaller(path(), 3);
        QVERIFY(smaller.load());
        QCOMPARE(smaller.size(), 3);
        QCOMPARE(smaller.recent(3).last().id, QString("id-8"));
    }

    void HistoryStoreTest::search_matchesMessageAndResponse() {
        HistoryStore store(path());
        QVERIFY(store.load());
        QVERIFY(store.add(makeRecord(1, "Rebase onto MAIN")));
        QVERIFY(store.add(makeRecord(2, "skip it")));
        QVERIFY(store.add(makeRecord(3)));

        QCOMPARE(store.search("main", 10).size(), 1);
        QCOMPARE(store.search("QUESTION", 10).size(), 3);
        QCOMPARE(store.search("question", 2).size(), 2);
        QCOMPARE(store.search("question 2", 10).first().id, QString("id-2"));
        QVERIFY(store.search("absent", 10).isEmpty());
    }

    void HistoryStoreTest::clear_removesEverything() {
        HistoryStore store(path());
        QVERIFY(store.load());
        QVERIFY(store.add(makeRecord(1)));
        QVERIFY(store.clear());
        QCOMPARE(store.size(), 0);

        HistoryStore reloaded(path());
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.size(), 0);
    }

    void HistoryStoreTest::record_describesAttachmentsWithoutData() {
        Question question;
        question.text = "Screenshot?";

        Answer answer;
        answer.attachments << Attachment{QByteArray("\x89PNG"), "image/png", QString("shot.png")};
        answer.attachments << Attachment{QByteArray("x"), "text/plain", std::nullopt};

        const HistoryRecord record = makeHistoryRecord("id", question, answer);
        QCOMPARE(record.attachments, QStringList({"shot.png (image/png)", "unnamed (text/plain)"}));
        QVERIFY(!record.response.has_value());
        QVERIFY(record.timestamp.isValid());

        const QJsonObject json = historyRecordToJson(record);
        QVERIFY(json.value("user_response").isNull());
        QVERIFY(!json.contains("data_base64"));
    }

    void HistoryStoreTest::record_rejectsMissingIdOrTimestamp() {
        QVERIFY(!parseHistoryRecord(QJsonObject{{"timestamp", "2024-01-01T00:00:00.000Z"}}).has_value());
        QVERIFY(!parseHistoryRecord(QJsonObject{{"id", "x"}, {"timestamp", "yesterday"}}).has_value());

        const auto record = parseHistoryRecord(QJsonObject{{"id", "x"}, {"timestamp", "2024-01-01T00:00:00.000Z"}, {"request_message", "hi"}});
        QVERIFY(record.has_value());
        QCOMPARE(record->message, QString("hi"));
        QVERIFY(record->choices.isEmpty());
    }

} // namespace parley::core

int runHistoryTests(int argc, char** argv) {
    parley::core::HistoryStoreTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_history.moc"
