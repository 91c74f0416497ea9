#include "RequestRegistry.hpp"

#include <QDateTime>
#include <QDebug>
#include <QMutexLocker>
#include <QUuid>

#include <algorithm>
#include <utility>
#include <vector>

namespace parley::core {

    QString submitStatusToString(SubmitStatus status) {
        switch (status) {
            case SubmitStatus::Ok: return "ok";
            case SubmitStatus::NotFound: return "not_found";
            case SubmitStatus::AlreadyCompleted: return "already_completed";
            case SubmitStatus::InvalidAnswer: return "invalid_answer";
        }
        return "unknown";
    }

    RequestRegistry::RequestRegistry(int maxPending) : RequestRegistry(maxPending, [] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    RequestRegistry::RequestRegistry(int maxPending, NowFn nowFn) : m_nowFn(std::move(nowFn)), m_maxPending(maxPending > 0 ? maxPending : DEFAULT_MAX_PENDING) {}

    RequestRegistry::~RequestRegistry() {
        m_closedHandler = nullptr;
        cancelAll(CancelReason::ShuttingDown);
    }

    Registration RequestRegistry::registerRequest(Question question, std::optional<qint64> deadlineMs) {
        if (m_size.fetch_add(1) >= m_maxPending) {
            m_size.fetch_sub(1);
            return Registration{RegisterStatus::Full, {}, {}};
        }

        auto entry                = std::make_unique<Entry>();
        entry->info.id            = QUuid::createUuid().toString(QUuid::WithoutBraces);
        entry->info.question      = std::move(question);
        entry->info.createdAtMs   = m_nowFn();
        if (deadlineMs) {
            entry->info.deadlineAtMs = entry->info.createdAtMs + *deadlineMs;
        }

        entry->promise.start();

        Registration registration;
        registration.id     = entry->info.id;
        registration.future = entry->promise.future();

        Shard&       shard = shardFor(registration.id);
        QMutexLocker lock(&shard.mutex);
        shard.entries.emplace(registration.id, std::move(entry));
        return registration;
    }

    SubmitStatus RequestRegistry::complete(const QString& id, Answer answer) {
        std::unique_ptr<Entry> entry;
        {
            Shard&       shard = shardFor(id);
            QMutexLocker lock(&shard.mutex);

            auto         it = shard.entries.find(id);
            if (it == shard.entries.end()) {
                return shard.tombstones.contains(id) ? SubmitStatus::AlreadyCompleted : SubmitStatus::NotFound;
            }

            answer.selectedChoices.removeDuplicates();
            const QStringList& offered = it->second->info.question.choices;
            const bool         valid   = std::all_of(answer.selectedChoices.cbegin(), answer.selectedChoices.cend(), [&offered](const QString& c) { return offered.contains(c); });
            if (!valid) {
                return SubmitStatus::InvalidAnswer;
            }

            entry = std::move(it->second);
            shard.entries.erase(it);
            buryLocked(shard, id, TerminalState::Answered);
        }

        answer.submittedAtMs = m_nowFn();
        settle(std::move(entry), Outcome{std::move(answer)});
        return SubmitStatus::Ok;
    }

    SubmitStatus RequestRegistry::cancel(const QString& id, CancelReason reason) {
        std::unique_ptr<Entry> entry;
        {
            Shard&       shard = shardFor(id);
            QMutexLocker lock(&shard.mutex);

            auto         it = shard.entries.find(id);
            if (it == shard.entries.end()) {
                return SubmitStatus::NotFound;
            }

            entry = std::move(it->second);
            shard.entries.erase(it);
            buryLocked(shard, id, terminalStateFor(Cancellation{reason}));
        }

        settle(std::move(entry), Outcome{Cancellation{reason}});
        return SubmitStatus::Ok;
    }

    int RequestRegistry::expireOlderThan(qint64 nowMs) {
        std::vector<std::unique_ptr<Entry>> expired;

        for (Shard& shard : m_shards) {
            QMutexLocker lock(&shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end();) {
                if (!isStale(it->second->info, nowMs)) {
                    ++it;
                    continue;
                }

                buryLocked(shard, it->first, TerminalState::Expired);
                expired.push_back(std::move(it->second));
                it = shard.entries.erase(it);
            }
        }

        for (auto& entry : expired) {
            qDebug() << "Request" << entry->info.id << "expired";
            settle(std::move(entry), Outcome{Cancellation{CancelReason::Expired}});
        }

        return static_cast<int>(expired.size());
    }

    int RequestRegistry::cancelAll(CancelReason reason) {
        std::vector<std::unique_ptr<Entry>> cancelled;

        for (Shard& shard : m_shards) {
            QMutexLocker lock(&shard.mutex);
            for (auto& [id, entry] : shard.entries) {
                buryLocked(shard, id, terminalStateFor(Cancellation{reason}));
                cancelled.push_back(std::move(entry));
            }
            shard.entries.clear();
        }

        for (auto& entry : cancelled) {
            settle(std::move(entry), Outcome{Cancellation{reason}});
        }

        return static_cast<int>(cancelled.size());
    }

    void RequestRegistry::setMaxRequestAge(qint64 maxAgeMs) {
        m_maxRequestAgeMs = qMax<qint64>(0, maxAgeMs);
    }

    void RequestRegistry::setClosedHandler(ClosedHandler handler) {
        m_closedHandler = std::move(handler);
    }

    std::optional<TerminalState> RequestRegistry::terminalState(const QString& id) const {
        const Shard& shard = shardFor(id);
        QMutexLocker lock(&shard.mutex);

        auto         it = shard.tombstones.constFind(id);
        if (it == shard.tombstones.constEnd()) {
            return std::nullopt;
        }
        return it.value();
    }

    std::optional<PendingInfo> RequestRegistry::pendingInfo(const QString& id) const {
        const Shard& shard = shardFor(id);
        QMutexLocker lock(&shard.mutex);

        auto         it = shard.entries.find(id);
        if (it == shard.entries.end()) {
            return std::nullopt;
        }
        return it->second->info;
    }

    QList<PendingInfo> RequestRegistry::snapshot() const {
        QList<PendingInfo> result;
        for (const Shard& shard : m_shards) {
            QMutexLocker lock(&shard.mutex);
            for (const auto& [id, entry] : shard.entries) {
                result << entry->info;
            }
        }

        std::sort(result.begin(), result.end(), [](const PendingInfo& a, const PendingInfo& b) { return a.createdAtMs < b.createdAtMs; });
        return result;
    }

    bool RequestRegistry::contains(const QString& id) const {
        const Shard& shard = shardFor(id);
        QMutexLocker lock(&shard.mutex);
        return shard.entries.find(id) != shard.entries.end();
    }

    int RequestRegistry::size() const {
        return m_size.load();
    }

    int RequestRegistry::maxPending() const {
        return m_maxPending;
    }

    qint64 RequestRegistry::now() const {
        return m_nowFn();
    }

    RequestRegistry::Shard& RequestRegistry::shardFor(const QString& id) {
        return m_shards[qHash(id) % m_shards.size()];
    }

    const RequestRegistry::Shard& RequestRegistry::shardFor(const QString& id) const {
        return m_shards[qHash(id) % m_shards.size()];
    }

    void RequestRegistry::buryLocked(Shard& shard, const QString& id, TerminalState state) {
        shard.tombstones.insert(id, state);
        shard.tombstoneOrder.enqueue(id);

        while (shard.tombstoneOrder.size() > TOMBSTONES_PER_SHARD) {
            shard.tombstones.remove(shard.tombstoneOrder.dequeue());
        }
    }

    void RequestRegistry::settle(std::unique_ptr<Entry> entry, Outcome outcome) {
        const QString       id    = entry->info.id;
        const TerminalState state = terminalStateFor(outcome);

        entry->promise.addResult(std::move(outcome));
        entry->promise.finish();
        m_size.fetch_sub(1);

        if (m_closedHandler) {
            m_closedHandler(id, state);
        }
    }

    bool RequestRegistry::isStale(const PendingInfo& info, qint64 nowMs) const {
        if (info.deadlineAtMs && *info.deadlineAtMs <= nowMs) {
            return true;
        }

        const qint64 maxAge = m_maxRequestAgeMs.load();
        return maxAge > 0 && (nowMs - info.createdAtMs) >= maxAge;
    }

} // namespace parley::core
