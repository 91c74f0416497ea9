#include "daemon.hpp"
#include "../common/Paths.hpp"
#include "../core/Daemon.hpp"
#include "../ui/PromptWindow.hpp"

#include <QApplication>
#include <QSocketNotifier>

#include <csignal>
#include <memory>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

namespace {

    int g_signalFds[2] = {-1, -1};

    void onTerminationSignal(int) {
        const char byte = 1;
        // Nothing useful can be done about a failed write inside a signal handler
        [[maybe_unused]] const auto written = ::write(g_signalFds[0], &byte, sizeof(byte));
    }

    bool installSignalHandlers() {
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
            return false;
        }

        struct sigaction action{};
        action.sa_handler = onTerminationSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
    }

} // namespace

namespace modes {

    int runDaemon(QCoreApplication& app, const parley::Config& config, const QString& socketPath, bool headless) {
        std::print("Starting parley daemon {}\n", parley::VERSION);

        parley::g_pDaemon = std::make_unique<parley::CDaemon>(config);
        if (!parley::g_pDaemon->start(socketPath, parley::portFilePath())) {
            parley::g_pDaemon.reset();
            return 1;
        }

        std::unique_ptr<QSocketNotifier> signalNotifier;
        if (installSignalHandlers()) {
            signalNotifier = std::make_unique<QSocketNotifier>(g_signalFds[1], QSocketNotifier::Read);
            QObject::connect(signalNotifier.get(), &QSocketNotifier::activated, &app, [&app]() {
                char byte = 0;
                [[maybe_unused]] const auto readBytes = ::read(g_signalFds[1], &byte, sizeof(byte));
                std::print("Termination signal received\n");
                app.quit();
            });
        } else {
            std::print(stderr, "Could not install signal handlers; SIGTERM will not shut down cleanly\n");
        }

        // Waiting callers must get their "shutting_down" reply before the loop ends
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, []() {
            if (parley::g_pDaemon) {
                parley::g_pDaemon->stop();
            }
        });

        std::unique_ptr<parley::ui::PromptWindow> window;
        if (!headless) {
            QApplication::setQuitOnLastWindowClosed(false);
            window = std::make_unique<parley::ui::PromptWindow>(&parley::g_pDaemon->bridge());
        }

        const int rc = app.exec();

        window.reset();
        parley::g_pDaemon.reset();
        return rc;
    }

} // namespace modes
