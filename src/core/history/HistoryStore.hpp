#pragma once

#include "../../common/Constants.hpp"
#include "../Request.hpp"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace parley::core {

    // One answered question
    struct HistoryRecord {
        QString                id;
        QDateTime              timestamp;
        QString                message;
        QStringList            choices;
        std::optional<QString> response;
        QStringList            selectedChoices;
        // "name (media/type)" per attachment; the data itself is not kept
        QStringList            attachments;
    };

    [[nodiscard]] HistoryRecord makeHistoryRecord(const QString& id, const Question& question, const Answer& answer);

    [[nodiscard]] QJsonObject                  historyRecordToJson(const HistoryRecord& record);
    [[nodiscard]] std::optional<HistoryRecord> parseHistoryRecord(const QJsonObject& obj);

    // Bounded list of answered questions, newest first, persisted as a JSON
    // file that is rewritten atomically on every change.
    class HistoryStore {
      public:
        explicit HistoryStore(QString path, int maxRecords = MAX_HISTORY_RECORDS);

        // A missing file is an empty history. On a read or parse error the
        // store stays empty and the file is left untouched until the next add().
        bool                 load();

        // Prepends, drops the oldest beyond maxRecords and saves
        bool                 add(HistoryRecord record);
        bool                 clear();

        QList<HistoryRecord> recent(int count) const;

        // Case-insensitive match on the message and the typed response
        QList<HistoryRecord> search(const QString& query, int count) const;

        int                  size() const;
        int                  maxRecords() const;
        QString              path() const;
        QString              errorString() const;

      private:
        bool                 save();

        QString              m_path;
        int                  m_maxRecords;
        QList<HistoryRecord> m_records;
        QString              m_errorString;
    };

} // namespace parley::core
