#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace focusguard {

// Tracks which focus sessions are running, as reported by the session owner.
// Safe to call from any thread.
class SessionTracker {
public:
    // Returns false when the session was already active.
    bool startSession(const std::string &sessionId);
    // Returns false when the session was not active.
    bool endSession(const std::string &sessionId);

    bool isSessionActive(const std::string &sessionId) const;
    bool hasActiveSession() const;
    std::vector<std::string> activeSessions() const;

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_active;
};

} // namespace focusguard
