#pragma once

#include "engine/BehaviorTypes.hpp"
#include <optional>
#include <string>

namespace ward {

struct EvidenceReceipt {
    std::string path;
    std::string file_sha256;
};

// Writes one JSON document per positive verdict:
//   <dir>/detection_<pid>_<YYYYMMDD_HHMMSS>_<uuid8>.json
// Files are never overwritten.
class EvidenceWriter {
public:
    explicit EvidenceWriter(std::string evidence_dir);

    // Fills uuid/created_at_ms when they are unset.
    std::optional<EvidenceReceipt> Write(EvidenceRecord record);

    // Pretty-printed JSON body, including the SHA-256 of the verdict+process part.
    static std::string Serialize(const EvidenceRecord& record);

    const std::string& GetDirectory() const { return evidence_dir_; }

private:
    std::string evidence_dir_;
};

} // namespace ward
