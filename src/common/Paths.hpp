#pragma once

#include <QString>

namespace parley {

    // $XDG_RUNTIME_DIR/parley.sock
    QString socketPath();

    // $XDG_RUNTIME_DIR/parley.port, holds the gateway port of the running daemon
    QString portFilePath();

    // $XDG_CONFIG_HOME/parley/parley.conf
    QString configFilePath();

    // $XDG_DATA_HOME/parley/history.json
    QString historyFilePath();

} // namespace parley
