#include "ingest/EventNormalizer.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"
#include <utility>
#include <vector>

namespace ward {

namespace {

struct FieldLayout {
    size_t pid_index;
    std::vector<std::pair<const char*, size_t>> fields;
};

// Positional layout per behavior kind. Indices follow the string-insert order
// of the Sysmon operational log.
const FieldLayout& LayoutFor(BehaviorKind kind) {
    static const FieldLayout process_create{3, {
        {attr::IMAGE, 4}, {attr::COMMAND_LINE, 10}, {attr::PARENT_IMAGE, 13}}};
    static const FieldLayout network_connect{3, {
        {attr::IMAGE, 4}, {attr::DEST_IP, 14}, {attr::DEST_HOST, 15}, {attr::DEST_PORT, 16}}};
    static const FieldLayout image_load{3, {
        {attr::IMAGE, 4}, {attr::IMAGE_LOADED, 5}}};
    static const FieldLayout remote_thread{3, {
        {attr::IMAGE, 4}, {attr::TARGET_PID, 6}}};
    static const FieldLayout process_access{3, {
        {attr::IMAGE, 4}, {attr::TARGET_PID, 6}, {attr::TARGET_IMAGE, 7}}};
    static const FieldLayout file_create{3, {
        {attr::IMAGE, 4}, {attr::TARGET_FILENAME, 5}}};
    static const FieldLayout registry{4, {
        {attr::IMAGE, 5}, {attr::TARGET_OBJECT, 6}, {attr::DETAILS, 7}}};
    static const FieldLayout dns_query{3, {
        {attr::QUERY_NAME, 4}, {attr::IMAGE, 7}}};
    static const FieldLayout tampering{3, {
        {attr::IMAGE, 4}, {attr::TAMPER_TYPE, 5}}};
    static const FieldLayout other{3, {{attr::IMAGE, 4}}};

    switch (kind) {
        case BehaviorKind::PROCESS_CREATE:       return process_create;
        case BehaviorKind::NETWORK_CONNECT:      return network_connect;
        case BehaviorKind::IMAGE_LOAD:           return image_load;
        case BehaviorKind::REMOTE_THREAD_CREATE: return remote_thread;
        case BehaviorKind::PROCESS_ACCESS:       return process_access;
        case BehaviorKind::FILE_CREATE:          return file_create;
        case BehaviorKind::REGISTRY_WRITE:       return registry;
        case BehaviorKind::DNS_QUERY:            return dns_query;
        case BehaviorKind::PROCESS_TAMPERING:    return tampering;
        case BehaviorKind::OTHER:                return other;
    }
    return other;
}

} // namespace

BehaviorKind KindForEventId(uint32_t event_id) {
    switch (event_id) {
        case sysmon::PROCESS_CREATE:         return BehaviorKind::PROCESS_CREATE;
        case sysmon::NETWORK_CONNECT:        return BehaviorKind::NETWORK_CONNECT;
        case sysmon::IMAGE_LOAD:             return BehaviorKind::IMAGE_LOAD;
        case sysmon::CREATE_REMOTE_THREAD:   return BehaviorKind::REMOTE_THREAD_CREATE;
        case sysmon::PROCESS_ACCESS:         return BehaviorKind::PROCESS_ACCESS;
        case sysmon::FILE_CREATE:            return BehaviorKind::FILE_CREATE;
        case sysmon::REGISTRY_CREATE_DELETE:
        case sysmon::REGISTRY_SET_VALUE:
        case sysmon::REGISTRY_RENAME:        return BehaviorKind::REGISTRY_WRITE;
        case sysmon::DNS_QUERY:              return BehaviorKind::DNS_QUERY;
        case sysmon::PROCESS_TAMPERING:      return BehaviorKind::PROCESS_TAMPERING;
        default:                             return BehaviorKind::OTHER;
    }
}

EventNormalizer::EventNormalizer(std::set<uint32_t> monitored_events)
    : monitored_events_(std::move(monitored_events)) {
}

std::optional<BehaviorEvent> EventNormalizer::Normalize(const RawEvent& raw, TimePoint now) const {
    if (monitored_events_.find(raw.event_id) == monitored_events_.end()) {
        unmonitored_++;
        return std::nullopt;
    }

    BehaviorKind kind = KindForEventId(raw.event_id);
    const FieldLayout& layout = LayoutFor(kind);

    uint32_t pid = 0;
    if (!ParseUint32(raw.Field(layout.pid_index), pid) || pid == 0) {
        dropped_++;
        LOG_TRACE("Dropping event {} without usable pid ({} fields)", raw.event_id, raw.fields.size());
        return std::nullopt;
    }

    BehaviorEvent event(pid, kind, now);
    event.source_time_ms = raw.timestamp_ms;
    for (const auto& [key, index] : layout.fields) {
        const std::string& value = raw.Field(index);
        if (!value.empty()) {
            event.attributes[key] = value;
        }
    }

    normalized_++;
    return event;
}

} // namespace ward
