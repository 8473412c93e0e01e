#pragma once

#include <memory>

#include <QObject>
#include <QTimer>

#include "common/config.hpp"

namespace focusguard {

class FocusApiServer;
class FocusEngine;

/**
 * FocusDaemon owns the engine and its socket front end. A periodic tick
 * commits nuclear expiry so clients see the unlock without querying first;
 * correctness does not depend on the tick running.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class FocusDaemon : public QObject
{
    Q_OBJECT
public:
    explicit FocusDaemon(const FocusConfig &config, QObject *parent = nullptr);
    ~FocusDaemon() override;

    // Starts the API server and the tick timer. Returns false when the socket
    // could not be opened.
    bool start();
    void stop();

    FocusEngine &engine() { return *m_engine; }

private slots:
    void runTick();

private:
    FocusConfig m_config;
    std::unique_ptr<FocusEngine> m_engine;
    std::unique_ptr<FocusApiServer> m_apiServer;
    QTimer m_tickTimer;
};

} // namespace focusguard
