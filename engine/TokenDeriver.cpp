#include "engine/TokenDeriver.hpp"
#include "core/StringUtils.hpp"

namespace ward {

TokenDeriver::TokenDeriver(const HeuristicConfig& config) {
    for (const auto& name : config.critical_processes) {
        critical_processes_.insert(ToLower(name));
    }
    for (const auto& ext : config.suspicious_extensions) {
        std::string lowered = ToLower(ext);
        if (!lowered.empty() && lowered[0] != '.') {
            lowered.insert(lowered.begin(), '.');
        }
        suspicious_extensions_.insert(lowered);
    }
}

bool TokenDeriver::IsCriticalProcess(const std::string& image_path) const {
    if (image_path.empty()) {
        return false;
    }
    return critical_processes_.count(ToLower(Basename(image_path))) > 0;
}

bool TokenDeriver::IsSuspiciousExtension(const std::string& path) const {
    std::string ext = LowerExtension(path);
    return !ext.empty() && suspicious_extensions_.count(ext) > 0;
}

std::string TokenDeriver::Derive(const BehaviorEvent& event) const {
    switch (event.kind) {
        case BehaviorKind::PROCESS_CREATE:
            return "CreateProcess";

        case BehaviorKind::NETWORK_CONNECT: {
            const std::string& ip = event.Attr(attr::DEST_IP);
            if (ip.empty()) {
                return "connect";
            }
            return "connect:" + ip + ":" + event.Attr(attr::DEST_PORT);
        }

        case BehaviorKind::IMAGE_LOAD: {
            const std::string& loaded = event.Attr(attr::IMAGE_LOADED);
            return "LoadLibrary:" + (loaded.empty() ? std::string("unknown") : Basename(loaded));
        }

        case BehaviorKind::REMOTE_THREAD_CREATE:
            return "CreateRemoteThread";

        case BehaviorKind::PROCESS_ACCESS: {
            const std::string& target = event.Attr(attr::TARGET_IMAGE);
            if (IsCriticalProcess(target)) {
                return "OpenProcess:" + Basename(target);
            }
            return "OpenProcess";
        }

        case BehaviorKind::FILE_CREATE: {
            const std::string& filename = event.Attr(attr::TARGET_FILENAME);
            if (IsSuspiciousExtension(filename)) {
                return "CreateFile:" + LowerExtension(filename);
            }
            return "CreateFile";
        }

        case BehaviorKind::REGISTRY_WRITE:
            return "RegSetValue";

        case BehaviorKind::DNS_QUERY: {
            const std::string& name = event.Attr(attr::QUERY_NAME);
            return name.empty() ? std::string("DnsQuery") : "DnsQuery:" + ToLower(name);
        }

        case BehaviorKind::PROCESS_TAMPERING:
            return "ProcessTampering";

        case BehaviorKind::OTHER:
            return "Other";
    }
    return "Other";
}

} // namespace ward
