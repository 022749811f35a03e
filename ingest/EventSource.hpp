#pragma once

#include "ingest/RawEvent.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace ward {

// Raised when the underlying telemetry feed cannot be read right now.
// The ingestion loop backs off and retries.
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& message) : std::runtime_error(message) {}
};

class EventSource {
public:
    virtual ~EventSource() = default;

    // Returns up to max_records records, waiting at most timeout for the first.
    // An empty batch means nothing arrived in time.
    virtual std::vector<RawEvent> ReadBatch(size_t max_records, std::chrono::milliseconds timeout) = 0;

    // True when the source will never produce more records.
    virtual bool Exhausted() const { return false; }
};

} // namespace ward
