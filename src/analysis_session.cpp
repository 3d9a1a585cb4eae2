//
// Created by Sanger Steel on 10/19/26.
//

#include "analysis_session.hpp"
#include <algorithm>
#include "har_extractor.hpp"
#include "har_loader.hpp"
#include "logger.hpp"

AnalysisSession::AnalysisSession(std::string source_path, std::vector<TimingRecord> records)
    : source_path(std::move(source_path)), timing_records(std::move(records)) {
}

AnalysisSession AnalysisSession::from_file(const std::string& path) {
    Logger.info(std::format("Loading HAR file {}", path));
    auto har = load_har_document(path);
    return AnalysisSession(path, extract_timing_records(har));
}

TimingStatistics AnalysisSession::statistics() const {
    return compute_statistics(timing_records);
}

std::vector<TimingRecord> AnalysisSession::slowest_requests(size_t n) const {
    std::vector<TimingRecord> sorted = timing_records;
    std::stable_sort(sorted.begin(), sorted.end(), [](const TimingRecord& a, const TimingRecord& b) {
        return a.total_time > b.total_time;
    });
    if (sorted.size() > n) {
        sorted.resize(n);
    }
    return sorted;
}

StatusHistogram AnalysisSession::status_histogram() const {
    StatusHistogram histogram;
    for (const auto& record: timing_records) {
        histogram[record.status]++;
    }
    return histogram;
}

AnalysisSummary summarize(const AnalysisSession& session, size_t slowest_count) {
    AnalysisSummary summary;
    summary.source = session.source();
    summary.total_requests = session.size();
    summary.status_distribution = session.status_histogram();
    summary.statistics = session.statistics();
    summary.slowest_count = slowest_count;
    summary.slowest = session.slowest_requests(slowest_count);
    Logger.debug("Summarized {} requests", std::to_string(summary.total_requests));
    return summary;
}
