#include "engine/permission_detector.hpp"

#include <future>
#include <thread>
#include <utility>

#include <QDir>
#include <QFile>
#include <QStringList>

#include <signal.h>
#include <unistd.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace focusguard {

namespace {

ProbeResult failure(std::string message)
{
    return ProbeResult{false, std::move(message)};
}

// Runs one probe on its own thread. A probe that does not finish within the
// timeout is reported as failed and left to finish in the background; while
// it runs, later calls wait on it rather than launching a second thread.
template <typename Fn>
ProbeResult runBounded(const char *name, std::chrono::milliseconds timeout,
                       std::mutex &slotMutex, std::shared_future<ProbeResult> &slot, Fn fn)
{
    std::shared_future<ProbeResult> result;
    {
        std::lock_guard<std::mutex> lock(slotMutex);
        if (slot.valid()
            && slot.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            FGLOG_DEBUG(QStringLiteral("PermissionDetector"),
                        QStringLiteral("runBounded"),
                        QStringLiteral("probe_still_running"),
                        QStringLiteral("reuse_in_flight"),
                        QStringLiteral("future_wait"),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"probe", name}}));
            result = slot;
        } else {
            std::packaged_task<ProbeResult()> task(std::move(fn));
            result = task.get_future().share();
            slot = result;
            std::thread(std::move(task)).detach();
        }
    }

    if (result.wait_for(timeout) != std::future_status::ready) {
        FGLOG_WARN(QStringLiteral("PermissionDetector"),
                   QStringLiteral("runBounded"),
                   QStringLiteral("probe_timeout"),
                   QStringLiteral("probe_exceeded_budget"),
                   QStringLiteral("future_wait"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"probe", name}, {"timeoutMs", timeout.count()}}));
        return failure(std::string("Probe timed out after ")
                       + std::to_string(timeout.count()) + " ms");
    }

    try {
        return result.get();
    } catch (const std::exception &ex) {
        return failure(std::string("Probe failed: ") + ex.what());
    }
}

QStringList processEntries()
{
    const QDir proc(QStringLiteral("/proc"));
    QStringList pids;
    for (const QString &entry : proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        bool numeric = false;
        entry.toLongLong(&numeric);
        if (numeric) {
            pids.push_back(entry);
        }
    }
    return pids;
}

PermissionMethod makeMethod(std::string name,
                            std::vector<std::string> steps,
                            bool isPermanent,
                            bool isRecommended,
                            std::vector<std::string> grants)
{
    PermissionMethod method;
    method.name = std::move(name);
    method.steps = std::move(steps);
    method.isPermanent = isPermanent;
    method.isRecommended = isRecommended;
    method.grants = std::move(grants);
    return method;
}

PlatformInstructions macosInstructions()
{
    PlatformInstructions instructions;
    instructions.platform = "macOS";
    instructions.primaryMethod = makeMethod(
        "Grant Full Disk Access",
        {"Open System Settings (or System Preferences on older macOS)",
         "Navigate to Privacy & Security > Full Disk Access",
         "Click the lock icon in the bottom left and authenticate",
         "Click the '+' button to add an application",
         "Select the focusguard-daemon binary",
         "Ensure the checkbox next to focusguard-daemon is enabled",
         "Close System Settings and restart FocusGuard"},
        true, true,
        {"Read/write access to /etc/hosts for website blocking",
         "Process monitoring and termination capabilities"});
    instructions.alternativeMethods.push_back(makeMethod(
        "Run with sudo (Temporary)",
        {"Stop FocusGuard if it is currently running",
         "Open the Terminal application",
         "Run: sudo focusguard-daemon",
         "Enter your password when prompted",
         "Note: This grants temporary permissions for this session only"},
        false, false,
        {"Temporary elevated access for this session"}));
    instructions.requiresRestart = true;
    instructions.securityNotes = {
        "Full Disk Access allows FocusGuard to modify system files like /etc/hosts",
        "FocusGuard only modifies the hosts file and does not access other system files",
        "This permission is required by all effective website blockers on macOS",
        "You can revoke this permission at any time from System Settings"};
    return instructions;
}

PlatformInstructions windowsInstructions()
{
    PlatformInstructions instructions;
    instructions.platform = "Windows";
    instructions.primaryMethod = makeMethod(
        "Set to Always Run as Administrator",
        {"Stop FocusGuard if it is currently running",
         "Right-click the FocusGuard shortcut",
         "Select 'Properties' from the context menu",
         "Navigate to the 'Compatibility' tab",
         "Check the box 'Run this program as an administrator'",
         "Click 'Apply' and then 'OK'",
         "Launch FocusGuard and accept the UAC prompt"},
        true, true,
        {"Administrator access to modify C:\\Windows\\System32\\drivers\\etc\\hosts",
         "Process monitoring and termination capabilities"});
    instructions.alternativeMethods.push_back(makeMethod(
        "Run as Administrator (One Time)",
        {"Right-click the FocusGuard icon",
         "Select 'Run as administrator'",
         "Click 'Yes' on the User Account Control (UAC) prompt",
         "Note: This grants temporary permissions for this session only"},
        false, false,
        {"Temporary administrator access for this session"}));
    instructions.requiresRestart = true;
    instructions.securityNotes = {
        "Administrator access is required to modify the Windows hosts file",
        "The hosts file is located at C:\\Windows\\System32\\drivers\\etc\\hosts",
        "FocusGuard only modifies the hosts file for website blocking purposes",
        "Windows will show a UAC prompt each time FocusGuard starts"};
    return instructions;
}

PlatformInstructions linuxInstructions()
{
    PlatformInstructions instructions;
    instructions.platform = "Linux";
    instructions.primaryMethod = makeMethod(
        "Create sudoers rule (Recommended)",
        {"Open a terminal",
         "Run: sudo visudo",
         "Add this line at the end (replace 'username' with your username):",
         "  username ALL=(ALL) NOPASSWD: /usr/bin/tee /etc/hosts",
         "Save and exit the editor",
         "Restart focusguard-daemon"},
        true, true,
        {"Passwordless sudo access for modifying /etc/hosts",
         "Process monitoring and termination capabilities"});
    instructions.alternativeMethods.push_back(makeMethod(
        "Run with sudo",
        {"Open a terminal",
         "Run: sudo focusguard-daemon",
         "Enter your password when prompted",
         "Note: This is needed every time the daemon starts"},
        false, false,
        {"Temporary root access for this session"}));
    instructions.alternativeMethods.push_back(makeMethod(
        "Make hosts file world-writable (Not Recommended)",
        {"Open a terminal",
         "Run: sudo chmod 666 /etc/hosts",
         "Warning: any program will be able to modify your hosts file",
         "Only use this if you understand the security implications"},
        true, false,
        {"Write access to /etc/hosts for all users (security risk)"}));
    instructions.requiresRestart = false;
    instructions.securityNotes = {
        "Root access is required to modify /etc/hosts on Linux",
        "The sudoers rule option is the most secure approach",
        "Making /etc/hosts world-writable is NOT recommended",
        "FocusGuard only modifies the hosts file for website blocking",
        "Different Linux distributions may have different DNS caching mechanisms"};
    return instructions;
}

} // namespace

ProbeResult SystemCapabilityProbe::probeHostsFile(const std::string &hostsFilePath)
{
    const QString path = QString::fromStdString(hostsFilePath);
    if (!QFile::exists(path)) {
        return failure("Hosts file not found at " + hostsFilePath);
    }

    QFile reader(path);
    if (!reader.open(QIODevice::ReadOnly)) {
        return failure("Cannot read hosts file: " + reader.errorString().toStdString());
    }
    const QByteArray contents = reader.readAll();
    if (contents.isEmpty() && reader.error() != QFileDevice::NoError) {
        return failure("Cannot read hosts file: " + reader.errorString().toStdString());
    }
    reader.close();

    // Opening for append creates no bytes; closing leaves the file untouched.
    QFile writer(path);
    if (!writer.open(QIODevice::WriteOnly | QIODevice::Append)) {
        if (writer.error() == QFileDevice::OpenError
            && access(hostsFilePath.c_str(), W_OK) != 0) {
            return failure("Permission denied. Elevated privileges required.");
        }
        return failure("Unexpected error: " + writer.errorString().toStdString());
    }
    writer.close();
    return ProbeResult{true, std::nullopt};
}

ProbeResult SystemCapabilityProbe::probeProcessMonitoring()
{
    if (!QDir(QStringLiteral("/proc")).exists()) {
        return failure("Process table /proc is not available");
    }
    if (processEntries().isEmpty()) {
        return failure("Process list is empty (unexpected)");
    }
    return ProbeResult{true, std::nullopt};
}

ProbeResult SystemCapabilityProbe::probeProcessTermination()
{
    const ProbeResult monitoring = probeProcessMonitoring();
    if (!monitoring.ok) {
        return failure("Cannot enumerate processes: "
                       + monitoring.error.value_or("Unknown error"));
    }
    // Signal 0 checks delivery rights without sending anything.
    if (kill(getpid(), 0) != 0) {
        return failure("Cannot signal processes owned by this user");
    }
    return ProbeResult{true, std::nullopt};
}

PermissionDetector::PermissionDetector(std::string hostsFilePath,
                                       std::chrono::milliseconds probeTimeout,
                                       std::shared_ptr<CapabilityProbe> probe)
    : m_hostsFilePath(std::move(hostsFilePath))
    , m_probeTimeout(probeTimeout)
    , m_probe(probe ? std::move(probe) : std::make_shared<SystemCapabilityProbe>())
    , m_inFlight(std::make_unique<InFlightProbes>())
{
}

OverallPermissionStatus PermissionDetector::overallStatusFor(bool hostsFileWritable,
                                                             bool processMonitoring,
                                                             bool processTermination)
{
    if (hostsFileWritable && processMonitoring && processTermination) {
        return OverallPermissionStatus::FullyFunctional;
    }
    if (!hostsFileWritable && !processMonitoring && !processTermination) {
        return OverallPermissionStatus::NonFunctional;
    }
    return OverallPermissionStatus::Degraded;
}

PermissionStatus PermissionDetector::checkPermissions() const
{
    // Each task holds its own reference so a timed-out probe keeps the
    // implementation alive until it returns.
    std::shared_ptr<CapabilityProbe> probe = m_probe;
    const std::string hostsPath = m_hostsFilePath;

    const ProbeResult hosts = runBounded("hosts_file", m_probeTimeout, m_inFlight->mutex,
                                         m_inFlight->hostsFile, [probe, hostsPath]() {
        return probe->probeHostsFile(hostsPath);
    });
    const ProbeResult monitoring = runBounded("process_monitoring", m_probeTimeout, m_inFlight->mutex,
                                              m_inFlight->processMonitoring, [probe]() {
        return probe->probeProcessMonitoring();
    });
    const ProbeResult termination = runBounded("process_termination", m_probeTimeout, m_inFlight->mutex,
                                               m_inFlight->processTermination, [probe]() {
        return probe->probeProcessTermination();
    });

    PermissionStatus status;
    status.hostsFileWritable = hosts.ok;
    status.hostsFileError = hosts.ok ? std::nullopt : hosts.error;
    status.hostsFilePath = m_hostsFilePath;
    status.processMonitoringAvailable = monitoring.ok;
    status.processMonitoringError = monitoring.ok ? std::nullopt : monitoring.error;
    status.processTerminationAvailable = termination.ok;
    status.processTerminationError = termination.ok ? std::nullopt : termination.error;
    status.overallStatus = overallStatusFor(hosts.ok, monitoring.ok, termination.ok);
    status.platform = currentPlatform();

    if (!hosts.ok) {
        status.recommendations.push_back(
            "Grant file system permissions to enable website blocking through hosts file.");
    }
    if (!monitoring.ok) {
        status.recommendations.push_back(
            "Grant process monitoring permissions to enable app blocking.");
    }
    if (status.overallStatus == OverallPermissionStatus::NonFunctional) {
        status.recommendations.push_back(
            "Consider using frontend-based blocking as a temporary fallback.");
    }
    if (status.overallStatus != OverallPermissionStatus::FullyFunctional) {
        status.recommendations.push_back(
            "See detailed setup instructions for " + status.platform
            + " to enable full blocking capabilities.");
    }

    FGLOG_INFO(QStringLiteral("PermissionDetector"),
               QStringLiteral("checkPermissions"),
               QStringLiteral("permission_check_complete"),
               QStringLiteral("client_call"),
               QStringLiteral("bounded_probes"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"overallStatus", toOverallStatusString(status.overallStatus)},
                              {"hostsFileWritable", hosts.ok},
                              {"processMonitoring", monitoring.ok},
                              {"processTermination", termination.ok}}));
    return status;
}

std::string PermissionDetector::currentPlatform()
{
#if defined(__APPLE__)
    return "macOS";
#elif defined(_WIN32)
    return "Windows";
#else
    return "Linux";
#endif
}

PlatformInstructions PermissionDetector::instructionsFor(const std::string &platform)
{
    std::string key = toLower(trimmed(platform));
    if (key.empty()) {
        key = toLower(currentPlatform());
    }

    if (key == "macos" || key == "darwin") {
        return macosInstructions();
    }
    if (key == "windows") {
        return windowsInstructions();
    }
    if (key == "linux") {
        return linuxInstructions();
    }
    throw BlockingError::validation("platform", "Unsupported platform: " + platform);
}

} // namespace focusguard
