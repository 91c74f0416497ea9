#pragma once

#include "../common/Config.hpp"

#include <QCoreApplication>
#include <QString>

namespace modes {

    // Runs the daemon until SIGINT/SIGTERM or QCoreApplication::quit().
    // headless skips the prompt window; app must be a QApplication otherwise.
    int runDaemon(QCoreApplication& app, const parley::Config& config, const QString& socketPath, bool headless);

} // namespace modes
