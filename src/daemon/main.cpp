#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/focus_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("focusguard-daemon"));

    focusguard::FocusConfig config = focusguard::FocusConfig::load();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        }
    }
    focusguard::logging::LogSettings logSettings;
    logSettings.processName = QStringLiteral("focusguard-daemon");
    logSettings.directory = QString::fromStdString(config.logDirectory());
    logSettings.traceEnabled = config.traceEnabled;
    focusguard::logging::initLogging(logSettings);
    FGLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config_loaded"),
               focusguard::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"configFile", focusguard::defaultConfigFilePath().toStdString()},
                              {"logFile", focusguard::logging::logFilePath().toStdString()},
                              {"socket", config.socketName.toStdString()}}));

    try {
        // The daemon lives for the lifetime of the process.
        focusguard::FocusDaemon daemon(config);
        if (!daemon.start()) {
            return 1;
        }
        return app.exec();
    } catch (const focusguard::BlockingError &ex) {
        FGLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QString::fromStdString(focusguard::toErrorKindString(ex.kind())),
                    QStringLiteral("config_loaded"),
                    focusguard::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }
}
