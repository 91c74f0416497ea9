#include "HistoryStore.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTimeZone>

namespace parley::core {

    namespace {

        QJsonArray toArray(const QStringList& list) {
            return QJsonArray::fromStringList(list);
        }

        QStringList toStringList(const QJsonValue& value) {
            QStringList list;
            for (const QJsonValue& item : value.toArray()) {
                if (item.isString()) {
                    list << item.toString();
                }
            }
            return list;
        }

    } // namespace

    HistoryRecord makeHistoryRecord(const QString& id, const Question& question, const Answer& answer) {
        HistoryRecord record;
        record.id              = id;
        record.timestamp       = answer.submittedAtMs > 0 ? QDateTime::fromMSecsSinceEpoch(answer.submittedAtMs, QTimeZone::UTC) : QDateTime::currentDateTimeUtc();
        record.message         = question.text;
        record.choices         = question.choices;
        record.response        = answer.text;
        record.selectedChoices = answer.selectedChoices;
        for (const Attachment& attachment : answer.attachments) {
            record.attachments << QString("%1 (%2)").arg(attachment.filename.value_or(QStringLiteral("unnamed")), attachment.mediaType);
        }
        return record;
    }

    QJsonObject historyRecordToJson(const HistoryRecord& record) {
        return QJsonObject{{"id", record.id},
                           {"timestamp", record.timestamp.toString(Qt::ISODateWithMs)},
                           {"request_message", record.message},
                           {"predefined_options", toArray(record.choices)},
                           {"user_response", record.response ? QJsonValue(*record.response) : QJsonValue(QJsonValue::Null)},
                           {"selected_options", toArray(record.selectedChoices)},
                           {"attachments", toArray(record.attachments)}};
    }

    std::optional<HistoryRecord> parseHistoryRecord(const QJsonObject& obj) {
        HistoryRecord record;
        record.id        = obj.value("id").toString();
        record.timestamp = QDateTime::fromString(obj.value("timestamp").toString(), Qt::ISODateWithMs);
        record.message   = obj.value("request_message").toString();
        if (record.id.isEmpty() || !record.timestamp.isValid()) {
            return std::nullopt;
        }

        record.choices = toStringList(obj.value("predefined_options"));
        if (obj.value("user_response").isString()) {
            record.response = obj.value("user_response").toString();
        }
        record.selectedChoices = toStringList(obj.value("selected_options"));
        record.attachments     = toStringList(obj.value("attachments"));
        return record;
    }

    HistoryStore::HistoryStore(QString path, int maxRecords) : m_path(std::move(path)), m_maxRecords(qMax(1, maxRecords)) {}

    bool HistoryStore::load() {
        m_records.clear();
        m_errorString.clear();

        QFile file(m_path);
        if (!file.exists()) {
            return true;
        }
        if (!file.open(QIODevice::ReadOnly)) {
            m_errorString = QString("cannot read %1: %2").arg(m_path, file.errorString());
            return false;
        }

        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            m_errorString = QString("%1 is not a history file: %2").arg(m_path, parseError.errorString());
            return false;
        }

        int skipped = 0;
        for (const QJsonValue& value : doc.object().value("records").toArray()) {
            if (auto record = parseHistoryRecord(value.toObject())) {
                m_records << *record;
            } else {
                ++skipped;
            }
        }
        if (skipped > 0) {
            qWarning() << "Skipped" << skipped << "malformed record(s) in" << m_path;
        }

        if (m_records.size() > m_maxRecords) {
            m_records.resize(m_maxRecords);
        }
        return true;
    }

    bool HistoryStore::add(HistoryRecord record) {
        m_records.prepend(std::move(record));
        if (m_records.size() > m_maxRecords) {
            m_records.resize(m_maxRecords);
        }
        return save();
    }

    bool HistoryStore::clear() {
        m_records.clear();
        return save();
    }

    QList<HistoryRecord> HistoryStore::recent(int count) const {
        return m_records.mid(0, qMax(0, count));
    }

    QList<HistoryRecord> HistoryStore::search(const QString& query, int count) const {
        QList<HistoryRecord> matches;
        for (const HistoryRecord& record : m_records) {
            if (matches.size() >= count) {
                break;
            }
            if (record.message.contains(query, Qt::CaseInsensitive) || (record.response && record.response->contains(query, Qt::CaseInsensitive))) {
                matches << record;
            }
        }
        return matches;
    }

    int HistoryStore::size() const {
        return static_cast<int>(m_records.size());
    }

    int HistoryStore::maxRecords() const {
        return m_maxRecords;
    }

    QString HistoryStore::path() const {
        return m_path;
    }

    QString HistoryStore::errorString() const {
        return m_errorString;
    }

    bool HistoryStore::save() {
        const QFileInfo info(m_path);
        if (!QDir().mkpath(info.absolutePath())) {
            m_errorString = QString("cannot create %1").arg(info.absolutePath());
            return false;
        }

        QJsonArray records;
        for (const HistoryRecord& record : std::as_const(m_records)) {
            records.append(historyRecordToJson(record));
        }

        QSaveFile file(m_path);
        if (!file.open(QIODevice::WriteOnly)) {
            m_errorString = QString("cannot write %1: %2").arg(m_path, file.errorString());
            return false;
        }

        file.write(QJsonDocument(QJsonObject{{"records", records}}).toJson(QJsonDocument::Indented));
        if (!file.commit()) {
            m_errorString = QString("cannot write %1: %2").arg(m_path, file.errorString());
            return false;
        }

        m_errorString.clear();
        return true;
    }

} // namespace parley::core
