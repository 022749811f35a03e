#pragma once

#include "ingest/EventSource.hpp"
#include <atomic>
#include <fstream>
#include <optional>
#include <string>

namespace ward {

// Newline-delimited JSON records:
//   {"event_id": 10, "fields": ["...", ...], "timestamp": 1714566000000}
// In follow mode the file is tailed like `tail -F`: appended lines are picked up
// and a truncated file is re-read from the start.
class NdjsonEventSource : public EventSource {
public:
    NdjsonEventSource(std::string path, bool follow);

    std::vector<RawEvent> ReadBatch(size_t max_records, std::chrono::milliseconds timeout) override;
    bool Exhausted() const override { return exhausted_; }

    // Parses one line; nullopt for malformed records.
    static std::optional<RawEvent> ParseLine(const std::string& line);

    uint64_t GetRecordCount() const { return records_.load(); }
    uint64_t GetMalformedCount() const { return malformed_.load(); }

private:
    void EnsureOpen();
    void ReadAvailable(size_t max_records, std::vector<RawEvent>& out);

    std::string path_;
    bool follow_;
    std::ifstream stream_;
    std::streamoff offset_{0};
    std::string partial_;
    bool exhausted_{false};

    std::atomic<uint64_t> records_{0};
    std::atomic<uint64_t> malformed_{0};
};

} // namespace ward
