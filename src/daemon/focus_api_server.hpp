#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "engine/focus_engine.hpp"

namespace focusguard {

/**
 * FocusApiServer exposes the FocusEngine over a local UNIX socket. Each
 * request is one JSON object {"id", "method", "params"}; the reply is
 * {"id", "result"} or {"id", "error", "kind"}.
 */
class FocusApiServer : public QObject
{
    Q_OBJECT
public:
    FocusApiServer(FocusEngine &engine, QString socketName, QObject *parent = nullptr);
    ~FocusApiServer() override;

    bool start();
    QString socketName() const { return m_socketName; }

    // Process a single request payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, const QString &kind,
                                 const nlohmann::json &id) const;
    QByteArray makeResultResponse(const nlohmann::json &result, const nlohmann::json &id) const;

    FocusEngine &m_engine;
    QString m_socketName;
    QLocalServer m_server;
};

} // namespace focusguard
