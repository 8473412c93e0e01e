#include "daemon/focus_api_server.hpp"

#include <chrono>
#include <limits>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/category_expander.hpp"

namespace focusguard {

namespace {

const QString kComponent = QStringLiteral("FocusApiServer");

std::string requireString(const nlohmann::json &params, const char *key)
{
    if (!params.contains(key) || !params.at(key).is_string()) {
        throw BlockingError::validation(key, std::string("Missing string parameter: ") + key);
    }
    return params.at(key).get<std::string>();
}

bool requireBool(const nlohmann::json &params, const char *key)
{
    if (!params.contains(key) || !params.at(key).is_boolean()) {
        throw BlockingError::validation(key, std::string("Missing boolean parameter: ") + key);
    }
    return params.at(key).get<bool>();
}

int requireInt(const nlohmann::json &params, const char *key)
{
    if (!params.contains(key) || !params.at(key).is_number_integer()) {
        throw BlockingError::validation(key, std::string("Missing integer parameter: ") + key);
    }
    const nlohmann::json &value = params.at(key);
    if (value.is_number_unsigned()) {
        if (value.get<unsigned long long>()
            > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw BlockingError::validation(key, std::string("Integer parameter out of range: ") + key);
        }
        return static_cast<int>(value.get<unsigned long long>());
    }
    const long long wide = value.get<long long>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw BlockingError::validation(key, std::string("Integer parameter out of range: ") + key);
    }
    return static_cast<int>(wide);
}

nlohmann::json ruleList(const std::vector<BlockRule> &rules)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto &rule : rules) {
        list.push_back(rule);
    }
    return list;
}

long long elapsedMs(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace

FocusApiServer::FocusApiServer(FocusEngine &engine, QString socketName, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_socketName(std::move(socketName))
{
}

FocusApiServer::~FocusApiServer() = default;

bool FocusApiServer::start()
{
    if (m_socketName.contains('/')) {
        const QFileInfo socketInfo(m_socketName);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            FGLOG_ERROR(kComponent, QStringLiteral("start"),
                        QStringLiteral("api_server_start_failed"),
                        QStringLiteral("mkpath_failed"),
                        QStringLiteral("local_socket"),
                        logging::defaultWho(), QString(),
                        (nlohmann::json{{"dir", socketInfo.absolutePath().toStdString()}}));
            return false;
        }

        if (QFile::exists(m_socketName) && !QLocalServer::removeServer(m_socketName)) {
            FGLOG_ERROR(kComponent, QStringLiteral("start"),
                        QStringLiteral("api_server_start_failed"),
                        QStringLiteral("stale_socket"),
                        QStringLiteral("local_socket"),
                        logging::defaultWho(), QString(),
                        (nlohmann::json{{"socket", m_socketName.toStdString()}}));
            return false;
        }
    } else {
        QLocalServer::removeServer(m_socketName);
    }

    m_server.setSocketOptions(QLocalServer::UserAccessOption);
    if (!m_server.listen(m_socketName)) {
        FGLOG_ERROR(kComponent, QStringLiteral("start"),
                    QStringLiteral("api_server_start_failed"),
                    QStringLiteral("listen_failed"),
                    QStringLiteral("local_socket"),
                    logging::defaultWho(), QString(),
                    (nlohmann::json{{"socket", m_socketName.toStdString()},
                                   {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &FocusApiServer::handleNewConnection);

    FGLOG_INFO(kComponent, QStringLiteral("start"),
               QStringLiteral("api_server_listening"),
               QStringLiteral("daemon_start"),
               QStringLiteral("local_socket"),
               logging::defaultWho(), QString(),
               (nlohmann::json{{"socket", m_socketName.toStdString()}}));
    return true;
}

void FocusApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &FocusApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void FocusApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void FocusApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray FocusApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        FGLOG_WARN(kComponent, QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(), corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"),
                                 QStringLiteral("validation"), nullptr);
    }

    const nlohmann::json id = parsed.contains("id") ? parsed.at("id") : nlohmann::json();

    if (!parsed.contains("method") || !parsed.at("method").is_string()) {
        FGLOG_WARN(kComponent, QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(), corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"),
                                 QStringLiteral("validation"), id);
    }

    const std::string method = parsed.at("method").get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params") && !parsed.at("params").is_null()) {
        if (!parsed.at("params").is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"),
                                     QStringLiteral("validation"), id);
        }
        params = parsed.at("params");
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    FGLOG_INFO(kComponent, QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_request"),
               logging::defaultWho(), corrId,
               (nlohmann::json{{"method", method}, {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        FGLOG_INFO(kComponent, QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_request"),
                   logging::defaultWho(), corrId,
                   (nlohmann::json{{"method", method}, {"durationMs", elapsedMs(start)}}));
        return makeResultResponse(result, id);
    } catch (const BlockingError &ex) {
        const QString kind = QString::fromStdString(toErrorKindString(ex.kind()));
        FGLOG_WARN(kComponent, QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_rejected"),
                   kind,
                   QStringLiteral("json_request"),
                   logging::defaultWho(), corrId,
                   (nlohmann::json{{"method", method},
                                  {"error", ex.what()},
                                  {"field", ex.field()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), kind, id);
    } catch (const nlohmann::json::exception &ex) {
        FGLOG_WARN(kComponent, QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_rejected"),
                   QStringLiteral("malformed_params"),
                   QStringLiteral("json_request"),
                   logging::defaultWho(), corrId,
                   (nlohmann::json{{"method", method}, {"error", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()),
                                 QStringLiteral("validation"), id);
    } catch (const std::exception &ex) {
        FGLOG_ERROR(kComponent, QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_request"),
                    logging::defaultWho(), corrId,
                    (nlohmann::json{{"method", method}, {"error", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()),
                                 QStringLiteral("system_error"), id);
    }
}

nlohmann::json FocusApiServer::dispatch(const std::string &method, const nlohmann::json &params)
{
    if (method == "create_rule") {
        const auto request = params.get<CreateRuleRequest>();
        return nlohmann::json{{"rule", m_engine.createRule(request)}};
    }
    if (method == "remove_rule") {
        m_engine.removeRule(RuleId(requireString(params, "id")));
        return nlohmann::json{{"removed", true}};
    }
    if (method == "set_enabled") {
        const RuleId id(requireString(params, "id"));
        return nlohmann::json{{"rule", m_engine.setEnabled(id, requireBool(params, "enabled"))}};
    }
    if (method == "set_strictness") {
        const RuleId id(requireString(params, "id"));
        if (!params.contains("strictness")) {
            throw BlockingError::validation("strictness", "Missing strictness");
        }
        const auto strictness = params.at("strictness").get<Strictness>();
        return nlohmann::json{{"rule", m_engine.setStrictness(id, strictness)}};
    }
    if (method == "list_rules") {
        return nlohmann::json{{"rules", ruleList(m_engine.listRules(params.get<RuleFilter>()))}};
    }
    if (method == "list_categories") {
        return nlohmann::json{{"categories", CategoryExpander::knownCategories()}};
    }
    if (method == "expand_categories") {
        if (!params.contains("categories") || !params.at("categories").is_array()) {
            throw BlockingError::validation("categories", "Missing categories array");
        }
        const auto categories = params.at("categories").get<std::vector<std::string>>();
        nlohmann::json targets = nlohmann::json::array();
        for (const auto &target : m_engine.expandCategories(categories)) {
            targets.push_back(target);
        }
        return nlohmann::json{{"targets", targets}};
    }
    if (method == "is_blocking_active_for") {
        const std::string target = requireString(params, "target");
        if (params.contains("at")) {
            const std::string at = requireString(params, "at");
            const TimePoint when = fromIso8601Utc(at);
            if (when == TimePoint{}) {
                throw BlockingError::validation("at", "Invalid timestamp: " + at);
            }
            return nlohmann::json{{"active", m_engine.isBlockingActiveFor(target, when)}};
        }
        return nlohmann::json{{"active", m_engine.isBlockingActiveFor(target)}};
    }
    if (method == "notify_session_started") {
        m_engine.notifySessionStarted(requireString(params, "sessionId"));
        return nlohmann::json{{"ok", true}};
    }
    if (method == "notify_session_ended") {
        m_engine.notifySessionEnded(requireString(params, "sessionId"));
        return nlohmann::json{{"ok", true}};
    }
    if (method == "enable_strict_mode") {
        return nlohmann::json(m_engine.enableStrictMode(requireString(params, "sessionId")));
    }
    if (method == "disable_strict_mode") {
        m_engine.disableStrictMode();
        return nlohmann::json(m_engine.getStrictModeStatus());
    }
    if (method == "get_strict_mode_status") {
        return nlohmann::json(m_engine.getStrictModeStatus());
    }
    if (method == "activate_nuclear_option") {
        return nlohmann::json(m_engine.activateNuclearOption(requireInt(params, "durationMinutes")));
    }
    if (method == "get_nuclear_option_status") {
        return nlohmann::json(m_engine.getNuclearOptionStatus());
    }
    if (method == "set_blocking_enabled") {
        m_engine.setBlockingEnabled(requireBool(params, "enabled"));
        return nlohmann::json{{"enabled", m_engine.isBlockingEnabled()}};
    }
    if (method == "is_blocking_enabled") {
        return nlohmann::json{{"enabled", m_engine.isBlockingEnabled()}};
    }
    if (method == "check_permissions") {
        return nlohmann::json(m_engine.checkPermissions());
    }
    if (method == "get_permission_instructions") {
        return nlohmann::json(m_engine.getPermissionInstructions(params.value("platform", "")));
    }
    if (method == "record_block_attempt") {
        return nlohmann::json{{"event", m_engine.recordBlockAttempt(params.get<BlockAttempt>())}};
    }
    if (method == "get_rule_stats") {
        return nlohmann::json(m_engine.getRuleStats(RuleId(requireString(params, "ruleId"))));
    }
    if (method == "get_block_statistics") {
        return nlohmann::json(m_engine.getBlockStatistics());
    }
    if (method == "get_session_blocks") {
        return nlohmann::json{{"events", m_engine.getSessionBlocks(requireString(params, "sessionId"))}};
    }
    if (method == "record_bypass_request") {
        return nlohmann::json{{"request", m_engine.recordBypassRequest(params.get<BypassRequest>())}};
    }
    if (method == "list_bypass_requests") {
        const RuleId ruleId(requireString(params, "ruleId"));
        return nlohmann::json{{"requests", m_engine.listBypassRequests(ruleId)}};
    }

    throw BlockingError::validation("method", "Unknown method: " + method);
}

QByteArray FocusApiServer::makeErrorResponse(const QString &message,
                                             const QString &kind,
                                             const nlohmann::json &id) const
{
    nlohmann::json response;
    response["id"] = id;
    response["error"] = message.toStdString();
    response["kind"] = kind.toStdString();
    return QByteArray::fromStdString(response.dump());
}

QByteArray FocusApiServer::makeResultResponse(const nlohmann::json &result,
                                              const nlohmann::json &id) const
{
    nlohmann::json response;
    response["id"] = id;
    response["result"] = result;
    return QByteArray::fromStdString(response.dump());
}

} // namespace focusguard
