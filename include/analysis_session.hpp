//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <map>
#include <string>
#include <vector>
#include "statistics.hpp"
#include "timing_record.hpp"

using StatusHistogram = std::map<int, size_t>;

// The records extracted from one HAR file. Read-only once constructed.
class AnalysisSession {
public:
    AnalysisSession(std::string source_path, std::vector<TimingRecord> records);

    // Loads, validates and extracts `path` in one go.
    static AnalysisSession from_file(const std::string& path);

    const std::string& source() const {
        return source_path;
    }

    const std::vector<TimingRecord>& records() const {
        return timing_records;
    }

    size_t size() const {
        return timing_records.size();
    }

    TimingStatistics statistics() const;

    // Stable: requests with equal total time keep their extraction order.
    std::vector<TimingRecord> slowest_requests(size_t n = 10) const;

    StatusHistogram status_histogram() const;

private:
    const std::string source_path;
    const std::vector<TimingRecord> timing_records;
};

// Everything the renderers need, computed once so the text report and the
// JSON export always agree.
struct AnalysisSummary {
    std::string source;
    size_t total_requests = 0;
    StatusHistogram status_distribution;
    TimingStatistics statistics;
    size_t slowest_count = 10;
    std::vector<TimingRecord> slowest;
};

AnalysisSummary summarize(const AnalysisSession& session, size_t slowest_count = 10);
