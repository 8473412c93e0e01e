#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace focusguard {

struct ProbeResult {
    bool ok = false;
    std::optional<std::string> error;
};

// One capability check per enforcement mechanism. Implementations may block;
// PermissionDetector bounds every call with a timeout.
class CapabilityProbe {
public:
    virtual ~CapabilityProbe() = default;

    virtual ProbeResult probeHostsFile(const std::string &hostsFilePath) = 0;
    virtual ProbeResult probeProcessMonitoring() = 0;
    virtual ProbeResult probeProcessTermination() = 0;
};

// Probes the running Linux host. The hosts file check opens the file for
// appending and closes it without writing.
class SystemCapabilityProbe : public CapabilityProbe {
public:
    ProbeResult probeHostsFile(const std::string &hostsFilePath) override;
    ProbeResult probeProcessMonitoring() override;
    ProbeResult probeProcessTermination() override;
};

class PermissionDetector {
public:
    PermissionDetector(std::string hostsFilePath,
                       std::chrono::milliseconds probeTimeout,
                       std::shared_ptr<CapabilityProbe> probe = nullptr);

    // Never throws for probe failures; they are reported in the status.
    PermissionStatus checkPermissions() const;

    // platform is "macos"/"darwin", "windows", "linux" (any case) or empty
    // for the running platform. Anything else is a validation error.
    static PlatformInstructions instructionsFor(const std::string &platform);
    static std::string currentPlatform();

    static OverallPermissionStatus overallStatusFor(bool hostsFileWritable,
                                                    bool processMonitoring,
                                                    bool processTermination);

private:
    // Last launched run of each probe. A run that outlives its timeout is
    // awaited again by the next check instead of starting another thread.
    struct InFlightProbes {
        std::mutex mutex;
        std::shared_future<ProbeResult> hostsFile;
        std::shared_future<ProbeResult> processMonitoring;
        std::shared_future<ProbeResult> processTermination;
    };

    std::string m_hostsFilePath;
    std::chrono::milliseconds m_probeTimeout;
    std::shared_ptr<CapabilityProbe> m_probe;
    std::unique_ptr<InFlightProbes> m_inFlight;
};

} // namespace focusguard
