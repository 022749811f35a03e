#pragma once

#include "engine/BehaviorTypes.hpp"
#include "ingest/RawEvent.hpp"
#include <atomic>
#include <optional>
#include <set>

namespace ward {

// Sysmon event identifiers understood by the normalizer.
namespace sysmon {
constexpr uint32_t PROCESS_CREATE = 1;
constexpr uint32_t NETWORK_CONNECT = 3;
constexpr uint32_t IMAGE_LOAD = 7;
constexpr uint32_t CREATE_REMOTE_THREAD = 8;
constexpr uint32_t PROCESS_ACCESS = 10;
constexpr uint32_t FILE_CREATE = 11;
constexpr uint32_t REGISTRY_CREATE_DELETE = 12;
constexpr uint32_t REGISTRY_SET_VALUE = 13;
constexpr uint32_t REGISTRY_RENAME = 14;
constexpr uint32_t DNS_QUERY = 22;
constexpr uint32_t PROCESS_TAMPERING = 25;
} // namespace sysmon

// Maps a Sysmon event identifier to its behavior kind. Unknown ids map to OTHER.
BehaviorKind KindForEventId(uint32_t event_id);

class EventNormalizer {
public:
    explicit EventNormalizer(std::set<uint32_t> monitored_events);

    // Pure conversion of one raw record. Returns nullopt (and counts the record)
    // when the id is not monitored or no valid pid can be extracted.
    std::optional<BehaviorEvent> Normalize(const RawEvent& raw, TimePoint now = Clock::now()) const;

    uint64_t GetNormalizedCount() const { return normalized_.load(); }
    uint64_t GetDroppedCount() const { return dropped_.load(); }
    uint64_t GetUnmonitoredCount() const { return unmonitored_.load(); }

private:
    std::set<uint32_t> monitored_events_;

    mutable std::atomic<uint64_t> normalized_{0};
    mutable std::atomic<uint64_t> dropped_{0};
    mutable std::atomic<uint64_t> unmonitored_{0};
};

} // namespace ward
