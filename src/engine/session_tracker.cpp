#include "engine/session_tracker.hpp"

namespace focusguard {

bool SessionTracker::startSession(const std::string &sessionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.insert(sessionId).second;
}

bool SessionTracker::endSession(const std::string &sessionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.erase(sessionId) > 0;
}

bool SessionTracker::isSessionActive(const std::string &sessionId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.count(sessionId) > 0;
}

bool SessionTracker::hasActiveSession() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_active.empty();
}

std::vector<std::string> SessionTracker::activeSessions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_active.begin(), m_active.end());
}

} // namespace focusguard
