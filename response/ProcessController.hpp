#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ward {

enum class SignalResult {
    DELIVERED,
    NOT_FOUND,   // process already gone
    DENIED,
    FAILED
};

inline std::string SignalResultToString(SignalResult result) {
    switch (result) {
        case SignalResult::DELIVERED: return "DELIVERED";
        case SignalResult::NOT_FOUND: return "NOT_FOUND";
        case SignalResult::DENIED:    return "DENIED";
        case SignalResult::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

// OS process-control primitive used for quarantine and for liveness checks
// during maintenance.
class ProcessController {
public:
    virtual ~ProcessController() = default;

    virtual bool Exists(uint32_t pid) = 0;
    virtual SignalResult RequestTermination(uint32_t pid) = 0;
    // True once the process is gone; false when it is still alive after timeout.
    virtual bool WaitForExit(uint32_t pid, std::chrono::milliseconds timeout) = 0;
    virtual SignalResult ForceKill(uint32_t pid) = 0;
};

// kill(2) on POSIX systems, OpenProcess/TerminateProcess on Windows.
class SystemProcessController : public ProcessController {
public:
    bool Exists(uint32_t pid) override;
    SignalResult RequestTermination(uint32_t pid) override;
    bool WaitForExit(uint32_t pid, std::chrono::milliseconds timeout) override;
    SignalResult ForceKill(uint32_t pid) override;

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};
};

} // namespace ward
