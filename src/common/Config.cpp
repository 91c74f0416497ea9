#include "Config.hpp"
#include "Paths.hpp"

#include <QDebug>
#include <QFile>
#include <QSaveFile>
#include <QSettings>

namespace parley {

    namespace {

        std::optional<quint16> parsePort(const QString& text) {
            bool      ok   = false;
            const int port = text.trimmed().toInt(&ok);
            if (!ok || port < 0 || port > 65535) {
                return std::nullopt;
            }
            return static_cast<quint16>(port);
        }

        std::optional<quint16> envPort() {
            const QByteArray value = qgetenv("PARLEY_PORT");
            if (value.isEmpty()) {
                return std::nullopt;
            }

            auto port = parsePort(QString::fromLatin1(value));
            if (!port) {
                qWarning() << "Ignoring invalid PARLEY_PORT" << value;
            }
            return port;
        }

        int positiveOr(const QVariant& value, int fallback) {
            bool      ok     = false;
            const int parsed = value.toInt(&ok);
            return (ok && parsed > 0) ? parsed : fallback;
        }

    } // namespace

    Config Config::load(const QString& path) {
        Config config;

        if (QFile::exists(path)) {
            QSettings settings(path, QSettings::IniFormat);

            settings.beginGroup("gateway");
            if (settings.contains("port")) {
                if (auto port = parsePort(settings.value("port").toString())) {
                    config.port = *port;
                } else {
                    qWarning() << "Ignoring invalid gateway/port in" << path;
                }
            }
            config.sweepIntervalMs = positiveOr(settings.value("sweep_interval_ms"), config.sweepIntervalMs);
            config.maxPending      = positiveOr(settings.value("max_pending"), config.maxPending);
            config.maxRequestAgeMs = qMax<qint64>(0, settings.value("max_request_age_ms", 0).toLongLong());
            config.idleTimeoutMs   = positiveOr(settings.value("idle_timeout_ms"), config.idleTimeoutMs);
            config.heartbeatMs     = positiveOr(settings.value("heartbeat_interval_ms"), config.heartbeatMs);
            settings.endGroup();

            settings.beginGroup("client");
            config.connectTimeoutMs   = positiveOr(settings.value("connect_timeout_ms"), config.connectTimeoutMs);
            config.responseGraceMs    = positiveOr(settings.value("response_grace_ms"), config.responseGraceMs);
            config.heartbeatTimeoutMs = positiveOr(settings.value("heartbeat_timeout_ms"), config.heartbeatTimeoutMs);
            settings.endGroup();

            settings.beginGroup("history");
            config.historyEnabled    = settings.value("enabled", config.historyEnabled).toBool();
            config.historyFile       = settings.value("file", config.historyFile).toString();
            config.historyMaxRecords = qMin(MAX_HISTORY_RECORDS, positiveOr(settings.value("max_records"), config.historyMaxRecords));
            settings.endGroup();

            if (settings.status() != QSettings::NoError) {
                qWarning() << "Failed to parse config" << path << "- using defaults where unreadable";
            }
        }

        if (auto port = envPort()) {
            config.port = *port;
        }

        return config;
    }

    Config Config::load() {
        return load(configFilePath());
    }

    std::optional<quint16> readPortFile(const QString& path) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            return std::nullopt;
        }

        auto port = parsePort(QString::fromLatin1(file.readAll()));
        if (port && *port == 0) {
            return std::nullopt;
        }
        return port;
    }

    bool writePortFile(const QString& path, quint16 port) {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            return false;
        }

        file.write(QByteArray::number(port) + '\n');
        return file.commit();
    }

    void removePortFile(const QString& path) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qWarning() << "Failed to remove port file" << path;
        }
    }

    quint16 resolveClientPort(const Config& config, std::optional<quint16> explicitPort, const QString& portFile) {
        if (explicitPort) {
            return *explicitPort;
        }

        if (auto port = envPort()) {
            return *port;
        }

        if (auto port = readPortFile(portFile)) {
            return *port;
        }

        return config.port;
    }

} // namespace parley
