//
// Created by Sanger Steel on 10/19/26.
//

#include "har_extractor.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "logger.hpp"

namespace {

const json& empty_object() {
    static const json empty = json::object();
    return empty;
}

const json& child_object(const json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) {
        return empty_object();
    }
    return *it;
}

std::string string_field(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

double number_field(const json& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

int status_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return 0;
    }
    // Integers are compared as doubles too; any int fits exactly.
    double value = it->get<double>();
    if (!std::isfinite(value) || value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return 0;
    }
    return static_cast<int>(value);
}

double phase_field(const json& timings, const char* key) {
    // -1 means "not applicable" in HAR.
    return std::max(0.0, number_field(timings, key, 0));
}

}

TimingRecord timing_record_from_entry(const json& entry) {
    const json& source = entry.is_object() ? entry : empty_object();
    const json& request = child_object(source, "request");
    const json& response = child_object(source, "response");
    const json& timings = child_object(source, "timings");

    TimingRecord record;
    record.url = string_field(request, "url", "unknown");
    record.method = string_field(request, "method", "unknown");
    record.status = status_field(response, "status");
    record.total_time = number_field(source, "time", 0);
    record.blocked = phase_field(timings, "blocked");
    record.dns = phase_field(timings, "dns");
    record.connect = phase_field(timings, "connect");
    record.send = phase_field(timings, "send");
    record.wait = phase_field(timings, "wait");
    record.receive = phase_field(timings, "receive");
    record.ssl = phase_field(timings, "ssl");
    return record;
}

std::vector<TimingRecord> extract_timing_records(const json& har) {
    if (!har.is_object()) {
        Logger.error("Invalid HAR file format: top-level value is not an object");
    }
    auto log = har.find("log");
    if (log == har.end() || !log->is_object()) {
        Logger.error("Invalid HAR file format: missing 'log' object");
    }
    auto entries = log->find("entries");
    if (entries == log->end() || !entries->is_array()) {
        Logger.error("Invalid HAR file format: missing 'log.entries' array");
    }

    std::vector<TimingRecord> records;
    records.reserve(entries->size());
    size_t idx = 0;
    for (const auto& entry: *entries) {
        if (!entry.is_object()) {
            Logger.debug("Entry {} is not an object, using defaults", std::to_string(idx));
        }
        records.emplace_back(timing_record_from_entry(entry));
        idx++;
    }
    Logger.info(std::format("Extracted {} timing records.", records.size()));
    return records;
}
