#include "Paths.hpp"

#include <QStandardPaths>

namespace parley {

    namespace {

        QString runtimeDir() {
            return QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
        }

    } // namespace

    QString socketPath() {
        return runtimeDir() + QStringLiteral("/parley.sock");
    }

    QString portFilePath() {
        return runtimeDir() + QStringLiteral("/parley.port");
    }

    QString configFilePath() {
        return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QStringLiteral("/parley/parley.conf");
    }

    QString historyFilePath() {
        return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QStringLiteral("/parley/history.json");
    }

} // namespace parley
