#pragma once

#include "engine/BehaviorTypes.hpp"
#include <string>
#include <vector>

namespace ward {

// Receives every malicious verdict exactly once per process record.
// Implementations must not throw.
class DetectionHandler {
public:
    virtual ~DetectionHandler() = default;

    virtual void OnDetection(const Verdict& verdict, const ProcessRecord& record,
                             const std::vector<std::string>& sequence_indicators) = 0;
};

} // namespace ward
