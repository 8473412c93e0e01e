#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace focusguard {

// FocusStore is the SQLite access layer for all persistent engine state:
// rules, block events, bypass requests, and the meta table holding the
// enforcement lock and the global blocking switch. Failures throw
// BlockingError with ErrorKind::SystemError.
class FocusStore {
public:
    explicit FocusStore(const std::string &databasePath);
    ~FocusStore();

    FocusStore(const FocusStore &) = delete;
    FocusStore &operator=(const FocusStore &) = delete;

    // Rules that fail identifier validation on load are skipped and logged.
    std::vector<BlockRule> loadRules() const;
    void insertRule(const BlockRule &rule);
    void updateRule(const BlockRule &rule);
    void deleteRule(const RuleId &id);

    // Block events are append-only.
    void addBlockEvent(const BlockEvent &event);
    std::vector<BlockEvent> listBlockEvents() const;

    void addBypassRequest(const BypassRequest &request);
    std::vector<BypassRequest> listBypassRequests() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace focusguard
