#include "ingest/NdjsonEventSource.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <thread>

namespace ward {

namespace {
constexpr std::chrono::milliseconds TAIL_POLL_INTERVAL{50};
}

NdjsonEventSource::NdjsonEventSource(std::string path, bool follow)
    : path_(std::move(path)), follow_(follow) {}

std::optional<RawEvent> NdjsonEventSource::ParseLine(const std::string& line) {
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto id_it = j.find("event_id");
    if (id_it == j.end() || !id_it->is_number_unsigned() || id_it->get<uint64_t>() > UINT32_MAX) {
        return std::nullopt;
    }

    auto fields_it = j.find("fields");
    if (fields_it == j.end() || !fields_it->is_array()) {
        return std::nullopt;
    }

    RawEvent raw;
    raw.event_id = static_cast<uint32_t>(id_it->get<uint64_t>());
    raw.fields.reserve(fields_it->size());
    for (const auto& field : *fields_it) {
        if (field.is_string()) {
            raw.fields.push_back(field.get<std::string>());
        } else if (field.is_null()) {
            raw.fields.emplace_back();
        } else {
            raw.fields.push_back(field.dump());
        }
    }

    auto ts_it = j.find("timestamp");
    if (ts_it != j.end() && ts_it->is_number_unsigned()) {
        raw.timestamp_ms = ts_it->get<uint64_t>();
    }
    return raw;
}

void NdjsonEventSource::EnsureOpen() {
    std::error_code ec;
    bool exists = std::filesystem::exists(path_, ec);

    if (!exists) {
        if (stream_.is_open()) {
            // Rotated away; start over once it reappears.
            stream_.close();
            offset_ = 0;
            partial_.clear();
        }
        throw SourceUnavailable("Event file not found: " + path_);
    }

    if (stream_.is_open() && follow_) {
        auto size = std::filesystem::file_size(path_, ec);
        if (!ec && static_cast<std::streamoff>(size) < offset_) {
            LOG_WARN("Event file {} was truncated, re-reading from the start", path_);
            stream_.close();
            offset_ = 0;
            partial_.clear();
        }
    }

    if (!stream_.is_open()) {
        stream_.open(path_, std::ios::in | std::ios::binary);
        if (!stream_.is_open()) {
            throw SourceUnavailable("Cannot open event file: " + path_);
        }
        stream_.seekg(offset_);
        LOG_INFO("Reading events from {} (offset {}, follow={})", path_, offset_, follow_);
    }
}

void NdjsonEventSource::ReadAvailable(size_t max_records, std::vector<RawEvent>& out) {
    std::string line;
    while (out.size() < max_records && std::getline(stream_, line)) {
        if (stream_.eof()) {
            // No trailing newline yet; the writer may still be mid-line.
            partial_ += line;
            break;
        }

        std::string full = partial_.empty() ? line : partial_ + line;
        partial_.clear();

        if (!full.empty() && full.back() == '\r') {
            full.pop_back();
        }
        if (full.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto raw = ParseLine(full);
        if (raw) {
            records_++;
            out.push_back(std::move(*raw));
        } else {
            malformed_++;
            LOG_DEBUG("Skipping malformed event line: {}", full.substr(0, 120));
        }
    }

    if (!stream_.good()) {
        stream_.clear();
    }
    std::streamoff pos = stream_.tellg();
    if (pos >= 0) {
        offset_ = pos;
    }
}

std::vector<RawEvent> NdjsonEventSource::ReadBatch(size_t max_records, std::chrono::milliseconds timeout) {
    std::vector<RawEvent> batch;
    if (exhausted_ || max_records == 0) {
        return batch;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        EnsureOpen();
        ReadAvailable(max_records, batch);

        if (!batch.empty()) {
            return batch;
        }

        if (!follow_) {
            if (!partial_.empty()) {
                auto raw = ParseLine(partial_);
                if (raw) {
                    records_++;
                    batch.push_back(std::move(*raw));
                } else {
                    malformed_++;
                }
                partial_.clear();
            }
            exhausted_ = true;
            LOG_INFO("Reached end of {} ({} records, {} malformed)", path_,
                     records_.load(), malformed_.load());
            return batch;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return batch;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(TAIL_POLL_INTERVAL, remaining));
    }
}

} // namespace ward
