#pragma once

#include "../Request.hpp"
#include "../../common/Constants.hpp"

#include <QFuture>
#include <QHash>
#include <QMutex>
#include <QPromise>
#include <QQueue>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

namespace parley::core {

    enum class RegisterStatus {
        Ok,
        Full
    };

    enum class SubmitStatus {
        Ok,
        NotFound,
        AlreadyCompleted,
        InvalidAnswer
    };

    // "ok", "not_found", "already_completed", "invalid_answer"
    [[nodiscard]] QString submitStatusToString(SubmitStatus status);

    struct PendingInfo {
        QString               id;
        Question              question;
        qint64                createdAtMs = 0;
        std::optional<qint64> deadlineAtMs;
    };

    struct Registration {
        RegisterStatus   status = RegisterStatus::Ok;
        QString          id;
        QFuture<Outcome> future;
    };

    // Process-wide table of outstanding questions. Each entry owns a single-use
    // completion slot; the first of complete/cancel/expiry settles it and
    // removes the entry, every later attempt is rejected.
    //
    // Thread-safe. Entries are spread over independently locked shards and no
    // lock is held while a waiter is notified.
    class RequestRegistry {
      public:
        using NowFn         = std::function<qint64()>;
        using ClosedHandler = std::function<void(const QString& id, TerminalState state)>;

        explicit RequestRegistry(int maxPending = DEFAULT_MAX_PENDING);
        RequestRegistry(int maxPending, NowFn nowFn);
        ~RequestRegistry();

        RequestRegistry(const RequestRegistry&)            = delete;
        RequestRegistry& operator=(const RequestRegistry&) = delete;

        // Mints a fresh id; deadlineMs is relative to now
        Registration                 registerRequest(Question question, std::optional<qint64> deadlineMs = std::nullopt);

        SubmitStatus                 complete(const QString& id, Answer answer);
        SubmitStatus                 cancel(const QString& id, CancelReason reason);

        // Cancels (reason Expired) every entry past its deadline or past the
        // maximum age. Returns the number of entries expired by this call.
        int                          expireOlderThan(qint64 nowMs);
        int                          cancelAll(CancelReason reason);

        void                         setMaxRequestAge(qint64 maxAgeMs);

        // Must be set before the registry is shared between threads
        void                         setClosedHandler(ClosedHandler handler);

        std::optional<TerminalState> terminalState(const QString& id) const;
        std::optional<PendingInfo>   pendingInfo(const QString& id) const;
        QList<PendingInfo>           snapshot() const;
        bool                         contains(const QString& id) const;
        int                          size() const;
        int                          maxPending() const;
        qint64                       now() const;

      private:
        struct Entry {
            PendingInfo       info;
            QPromise<Outcome> promise;
        };

        struct Shard {
            mutable QMutex                                          mutex;
            std::unordered_map<QString, std::unique_ptr<Entry>>     entries;
            QHash<QString, TerminalState>                           tombstones;
            QQueue<QString>                                         tombstoneOrder;
        };

        Shard&                               shardFor(const QString& id);
        const Shard&                         shardFor(const QString& id) const;
        static void                          buryLocked(Shard& shard, const QString& id, TerminalState state);
        void                                 settle(std::unique_ptr<Entry> entry, Outcome outcome);
        bool                                 isStale(const PendingInfo& info, qint64 nowMs) const;

        NowFn                                m_nowFn;
        int                                  m_maxPending;
        std::atomic<qint64>                  m_maxRequestAgeMs{0};
        std::atomic<int>                     m_size{0};
        ClosedHandler                        m_closedHandler;
        std::array<Shard, REGISTRY_SHARDS>   m_shards;
    };

} // namespace parley::core
