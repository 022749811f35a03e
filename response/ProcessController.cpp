#include "response/ProcessController.hpp"
#include "core/Logger.hpp"
#include <climits>
#include <thread>

#ifdef _WIN32
#include "core/WindowsHeaders.hpp"
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace ward {

#ifdef _WIN32

namespace {

SignalResult TerminateWin32(uint32_t pid) {
    HANDLE process_handle = OpenProcess(PROCESS_TERMINATE, FALSE, pid);
    if (process_handle == nullptr) {
        DWORD error = GetLastError();
        if (error == ERROR_INVALID_PARAMETER) {
            return SignalResult::NOT_FOUND;
        }
        LOG_ERROR("Failed to open process {} for termination: {}", pid, error);
        return error == ERROR_ACCESS_DENIED ? SignalResult::DENIED : SignalResult::FAILED;
    }

    BOOL result = ::TerminateProcess(process_handle, 1);
    DWORD error = GetLastError();
    CloseHandle(process_handle);

    if (!result) {
        LOG_ERROR("Failed to terminate process {}: {}", pid, error);
        return SignalResult::FAILED;
    }
    return SignalResult::DELIVERED;
}

} // namespace

bool SystemProcessController::Exists(uint32_t pid) {
    if (pid == 0) {
        return false;
    }
    HANDLE process_handle = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (process_handle == nullptr) {
        return GetLastError() == ERROR_ACCESS_DENIED;
    }
    DWORD exit_code = 0;
    BOOL ok = GetExitCodeProcess(process_handle, &exit_code);
    CloseHandle(process_handle);
    return ok && exit_code == STILL_ACTIVE;
}

SignalResult SystemProcessController::RequestTermination(uint32_t pid) {
    // Windows has no polite termination for arbitrary processes.
    return TerminateWin32(pid);
}

bool SystemProcessController::WaitForExit(uint32_t pid, std::chrono::milliseconds timeout) {
    HANDLE process_handle = OpenProcess(SYNCHRONIZE, FALSE, pid);
    if (process_handle == nullptr) {
        return GetLastError() != ERROR_ACCESS_DENIED;
    }
    DWORD wait = WaitForSingleObject(process_handle, static_cast<DWORD>(timeout.count()));
    CloseHandle(process_handle);
    return wait == WAIT_OBJECT_0;
}

SignalResult SystemProcessController::ForceKill(uint32_t pid) {
    return TerminateWin32(pid);
}

#else

namespace {

SignalResult SendSignal(uint32_t pid, int signal_number) {
    // pid 0 and values that would wrap negative address process groups.
    if (pid == 0 || pid > static_cast<uint32_t>(INT_MAX)) {
        return SignalResult::NOT_FOUND;
    }
    if (::kill(static_cast<pid_t>(pid), signal_number) == 0) {
        return SignalResult::DELIVERED;
    }
    int error = errno;
    if (error == ESRCH) {
        return SignalResult::NOT_FOUND;
    }
    LOG_ERROR("Failed to send signal {} to process {}: {}", signal_number, pid, std::strerror(error));
    return error == EPERM ? SignalResult::DENIED : SignalResult::FAILED;
}

} // namespace

bool SystemProcessController::Exists(uint32_t pid) {
    if (pid == 0 || pid > static_cast<uint32_t>(INT_MAX)) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

SignalResult SystemProcessController::RequestTermination(uint32_t pid) {
    return SendSignal(pid, SIGTERM);
}

bool SystemProcessController::WaitForExit(uint32_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (Exists(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return true;
}

SignalResult SystemProcessController::ForceKill(uint32_t pid) {
    return SendSignal(pid, SIGKILL);
}

#endif

} // namespace ward
