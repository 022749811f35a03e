#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorTypes.hpp"
#include <string>
#include <unordered_set>

namespace ward {

// Turns a normalized event into the canonical token the classifier vocabulary
// was built from, e.g. "CreateProcess", "connect:10.0.0.5:443",
// "LoadLibrary:kernel32.dll", "OpenProcess:lsass.exe", "CreateFile:.exe".
class TokenDeriver {
public:
    explicit TokenDeriver(const HeuristicConfig& config);

    std::string Derive(const BehaviorEvent& event) const;

    bool IsCriticalProcess(const std::string& image_path) const;
    bool IsSuspiciousExtension(const std::string& path) const;

private:
    std::unordered_set<std::string> critical_processes_;
    std::unordered_set<std::string> suspicious_extensions_;
};

} // namespace ward
