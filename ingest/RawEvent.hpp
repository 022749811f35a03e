#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ward {

// A record as delivered by the telemetry source: an event-kind identifier and a
// flat list of positional string fields. The field list may be shorter than the
// layout for its kind expects.
struct RawEvent {
    uint32_t event_id{0};
    std::vector<std::string> fields;
    std::optional<uint64_t> timestamp_ms;

    // Empty string for indices past the end of the field list.
    const std::string& Field(size_t index) const {
        static const std::string empty;
        return index < fields.size() ? fields[index] : empty;
    }
};

} // namespace ward
