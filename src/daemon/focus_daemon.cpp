#include "daemon/focus_daemon.hpp"

#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/focus_api_server.hpp"
#include "engine/focus_engine.hpp"

namespace focusguard {

FocusDaemon::FocusDaemon(const FocusConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_engine(std::make_unique<FocusEngine>(config))
{
    m_tickTimer.setInterval(static_cast<int>(m_config.tickInterval.count()));
    connect(&m_tickTimer, &QTimer::timeout, this, &FocusDaemon::runTick);
}

FocusDaemon::~FocusDaemon()
{
    stop();
}

bool FocusDaemon::start()
{
    FGLOG_INFO(QStringLiteral("FocusDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_starting"),
               QStringLiteral("daemon_start"),
               QStringLiteral("qt_event_loop"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"dataDir", m_config.dataDir},
                              {"tickIntervalMs", m_config.tickInterval.count()}}));

    if (!m_apiServer) {
        m_apiServer = std::make_unique<FocusApiServer>(*m_engine, m_config.socketName);
        if (!m_apiServer->start()) {
            m_apiServer.reset();
            return false;
        }
    }

    m_tickTimer.start();
    runTick();
    return true;
}

void FocusDaemon::stop()
{
    m_tickTimer.stop();
}

void FocusDaemon::runTick()
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    try {
        if (m_engine->tick()) {
            FGLOG_INFO(QStringLiteral("FocusDaemon"),
                       QStringLiteral("runTick"),
                       QStringLiteral("nuclear_lock_expired"),
                       QStringLiteral("timer_tick"),
                       QStringLiteral("expiry_check"),
                       logging::defaultWho(),
                       corrId,
                       nlohmann::json::object());
        }
    } catch (const BlockingError &ex) {
        FGLOG_ERROR(QStringLiteral("FocusDaemon"),
                    QStringLiteral("runTick"),
                    QStringLiteral("tick_failed"),
                    QString::fromStdString(toErrorKindString(ex.kind())),
                    QStringLiteral("expiry_check"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

} // namespace focusguard
