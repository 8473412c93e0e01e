#include "engine/focus_store.hpp"

#include <cstdint>
#include <filesystem>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace focusguard {

namespace {

constexpr const char *kCreateRulesTable =
    "CREATE TABLE IF NOT EXISTS rules ("
    "    id TEXT PRIMARY KEY,"
    "    rule_type TEXT NOT NULL,"
    "    target TEXT NOT NULL,"
    "    enabled INTEGER NOT NULL DEFAULT 1,"
    "    strictness TEXT NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    schedule_type TEXT NOT NULL,"
    "    schedule_cron TEXT,"
    "    UNIQUE (rule_type, target)"
    ");";

constexpr const char *kCreateBlockEventsTable =
    "CREATE TABLE IF NOT EXISTS block_events ("
    "    id TEXT PRIMARY KEY,"
    "    rule_id TEXT NOT NULL,"
    "    blocked_at INTEGER NOT NULL,"
    "    target TEXT NOT NULL,"
    "    was_bypassed INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL,"
    "    session_id TEXT,"
    "    process_name TEXT"
    ");";

constexpr const char *kCreateBlockEventsIndex =
    "CREATE INDEX IF NOT EXISTS idx_block_events_rule "
    "ON block_events (rule_id, blocked_at DESC);";

constexpr const char *kCreateBypassRequestsTable =
    "CREATE TABLE IF NOT EXISTS bypass_requests ("
    "    id TEXT PRIMARY KEY,"
    "    rule_id TEXT NOT NULL,"
    "    requested_at INTEGER NOT NULL,"
    "    bypass_code TEXT,"
    "    reason TEXT"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kSelectEventColumns =
    "SELECT id, rule_id, blocked_at, target, was_bypassed, created_at, "
    "session_id, process_name FROM block_events";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw BlockingError::systemError(
                std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(TimePoint timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

TimePoint fromEpochSeconds(int64_t value)
{
    return TimePoint{std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw BlockingError::systemError(message);
    }
}

void stepDone(sqlite3 *db, const Statement &stmt, const char *what)
{
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw BlockingError::systemError(
            std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

BlockEvent readEvent(sqlite3_stmt *stmt)
{
    BlockEvent event{
        columnText(stmt, 0),
        RuleId(columnText(stmt, 1)),
        fromEpochSeconds(sqlite3_column_int64(stmt, 2)),
        columnText(stmt, 3),
        sqlite3_column_int(stmt, 4) != 0,
        fromEpochSeconds(sqlite3_column_int64(stmt, 5)),
        columnOptionalText(stmt, 6),
        columnOptionalText(stmt, 7)
    };
    return event;
}

void bindRuleFields(sqlite3_stmt *stmt, const BlockRule &rule)
{
    bindText(stmt, 1, rule.id.value());
    bindText(stmt, 2, toRuleTypeString(rule.type()));
    bindText(stmt, 3, rule.targetValue());
    sqlite3_bind_int(stmt, 4, rule.enabled ? 1 : 0);
    bindText(stmt, 5, toStrictnessString(rule.strictness));
    sqlite3_bind_int64(stmt, 6, toEpochSeconds(rule.createdAt));
    bindText(stmt, 7, toScheduleTypeString(rule.scheduleType));
    if (rule.scheduleCron) {
        bindText(stmt, 8, rule.scheduleCron->value());
    } else {
        sqlite3_bind_null(stmt, 8);
    }
}

} // namespace

struct FocusStore::Impl {
    sqlite3 *db = nullptr;
};

FocusStore::FocusStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(databasePath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw BlockingError::systemError("failed to create data directory "
                                             + path.parent_path().string()
                                             + ": " + ec.message());
        }
    }

    if (sqlite3_open(databasePath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw BlockingError::systemError("failed to open focusguard database: " + message);
    }

    execOrThrow(impl->db, kCreateRulesTable);
    execOrThrow(impl->db, kCreateBlockEventsTable);
    execOrThrow(impl->db, kCreateBlockEventsIndex);
    execOrThrow(impl->db, kCreateBypassRequestsTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

FocusStore::~FocusStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::vector<BlockRule> FocusStore::loadRules() const
{
    Statement stmt(impl->db,
                   "SELECT id, rule_type, target, enabled, strictness, created_at, "
                   "schedule_type, schedule_cron FROM rules ORDER BY created_at ASC, id ASC;");

    std::vector<BlockRule> rules;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const std::string id = columnText(stmt.get(), 0);
        const auto type = parseRuleTypeString(columnText(stmt.get(), 1));
        const auto strictness = parseStrictnessString(columnText(stmt.get(), 4));
        const auto scheduleType = parseScheduleTypeString(columnText(stmt.get(), 6));
        if (!type || !strictness || !scheduleType) {
            FGLOG_WARN(QStringLiteral("FocusStore"),
                       QStringLiteral("loadRules"),
                       QStringLiteral("rule_skipped"),
                       QStringLiteral("unknown_enum_value"),
                       QStringLiteral("sqlite_row"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"ruleId", id}}));
            continue;
        }

        try {
            std::optional<CronExpression> cron;
            const auto cronText = columnOptionalText(stmt.get(), 7);
            if (cronText) {
                cron = CronExpression(*cronText);
            }
            BlockRule rule{
                RuleId(id),
                sqlite3_column_int(stmt.get(), 3) != 0,
                *strictness,
                fromEpochSeconds(sqlite3_column_int64(stmt.get(), 5)),
                makeRuleTarget(*type, columnText(stmt.get(), 2)),
                *scheduleType,
                cron
            };
            rules.push_back(std::move(rule));
        } catch (const BlockingError &ex) {
            FGLOG_WARN(QStringLiteral("FocusStore"),
                       QStringLiteral("loadRules"),
                       QStringLiteral("rule_skipped"),
                       QStringLiteral("invalid_identifier"),
                       QStringLiteral("sqlite_row"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"ruleId", id}, {"error", ex.what()}}));
        }
    }
    return rules;
}

void FocusStore::insertRule(const BlockRule &rule)
{
    Statement stmt(impl->db,
                   "INSERT INTO rules (id, rule_type, target, enabled, strictness, "
                   "created_at, schedule_type, schedule_cron) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindRuleFields(stmt.get(), rule);
    stepDone(impl->db, stmt, "failed to insert rule");
}

void FocusStore::updateRule(const BlockRule &rule)
{
    Statement stmt(impl->db,
                   "UPDATE rules SET rule_type = ?2, target = ?3, enabled = ?4, "
                   "strictness = ?5, created_at = ?6, schedule_type = ?7, "
                   "schedule_cron = ?8 WHERE id = ?1;");
    bindRuleFields(stmt.get(), rule);
    stepDone(impl->db, stmt, "failed to update rule");
}

void FocusStore::deleteRule(const RuleId &id)
{
    Statement stmt(impl->db, "DELETE FROM rules WHERE id = ?;");
    bindText(stmt.get(), 1, id.value());
    stepDone(impl->db, stmt, "failed to delete rule");
}

void FocusStore::addBlockEvent(const BlockEvent &event)
{
    Statement stmt(impl->db,
                   "INSERT INTO block_events (id, rule_id, blocked_at, target, "
                   "was_bypassed, created_at, session_id, process_name) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, event.id);
    bindText(stmt.get(), 2, event.ruleId.value());
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(event.blockedAt));
    bindText(stmt.get(), 4, event.target);
    sqlite3_bind_int(stmt.get(), 5, event.wasBypassed ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 6, toEpochSeconds(event.createdAt));
    bindOptionalText(stmt.get(), 7, event.sessionId);
    bindOptionalText(stmt.get(), 8, event.processName);
    stepDone(impl->db, stmt, "failed to insert block event");
}

std::vector<BlockEvent> FocusStore::listBlockEvents() const
{
    const std::string sql = std::string(kSelectEventColumns)
        + " ORDER BY blocked_at ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<BlockEvent> events;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        events.push_back(readEvent(stmt.get()));
    }
    return events;
}

void FocusStore::addBypassRequest(const BypassRequest &request)
{
    Statement stmt(impl->db,
                   "INSERT INTO bypass_requests (id, rule_id, requested_at, "
                   "bypass_code, reason) VALUES (?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, request.id);
    bindText(stmt.get(), 2, request.ruleId);
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(request.requestedAt));
    bindOptionalText(stmt.get(), 4, request.bypassCode);
    bindOptionalText(stmt.get(), 5, request.reason);
    stepDone(impl->db, stmt, "failed to insert bypass request");
}

std::vector<BypassRequest> FocusStore::listBypassRequests() const
{
    Statement stmt(impl->db,
                   "SELECT id, rule_id, requested_at, bypass_code, reason "
                   "FROM bypass_requests ORDER BY requested_at ASC;");

    std::vector<BypassRequest> requests;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        BypassRequest request;
        request.id = columnText(stmt.get(), 0);
        request.ruleId = columnText(stmt.get(), 1);
        request.requestedAt = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 2));
        request.bypassCode = columnOptionalText(stmt.get(), 3);
        request.reason = columnOptionalText(stmt.get(), 4);
        requests.push_back(std::move(request));
    }
    return requests;
}

std::optional<std::string> FocusStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void FocusStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stepDone(impl->db, stmt, "failed to set meta value");
}

bool FocusStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace focusguard
