//
// Created by Sanger Steel on 10/19/26.
//

#include "report.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include "logger.hpp"

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t count_code_points(const std::string& s) {
    size_t count = 0;
    for (char c: s) {
        if (!is_continuation_byte(c)) {
            count++;
        }
    }
    return count;
}

// Byte offset where code point number `n` starts, or s.size().
size_t code_point_offset(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation_byte(s[i])) {
            if (seen == n) {
                return i;
            }
            seen++;
        }
    }
    return s.size();
}

}

std::string truncate_url(const std::string& url, size_t max_width) {
    if (count_code_points(url) <= max_width) {
        return url;
    }
    auto keep = max_width > ReportConstants::Ellipsis.size() ? max_width - ReportConstants::Ellipsis.size() : 0;
    return url.substr(0, code_point_offset(url, keep)) + std::string(ReportConstants::Ellipsis);
}

void write_text_report(std::ostream& os, const AnalysisSummary& summary, size_t url_width) {
    const std::string rule(ReportConstants::RuleWidth, '=');
    const std::string dashes(ReportConstants::RuleWidth, '-');

    os << "\n" << rule << "\n";
    os << "HAR File Analysis Summary\n";
    os << rule << "\n";
    os << std::format("File: {}\n", summary.source);
    os << std::format("Total Requests: {}\n", summary.total_requests);
    os << rule << "\n\n";

    os << "HTTP Status Code Distribution:\n";
    os << std::string(ReportConstants::SectionRuleWidth, '-') << "\n";
    for (const auto& [status, count]: summary.status_distribution) {
        os << std::format("  {}: {} requests\n", status, count);
    }
    os << "\n";

    os << "Timing Statistics (all times in milliseconds):\n";
    os << dashes << "\n";
    os << std::format("{:<15} {:>8} {:>12} {:>12} {:>12} {:>12}\n",
                      "Phase", "Count", "Average", "Median", "Min", "Max");
    os << dashes << "\n";
    for (const auto& [quantity, s]: summary.statistics) {
        os << std::format("{:<15} {:>8} {:>12.2f} {:>12.2f} {:>12.2f} {:>12.2f}\n",
                          quantity_info(quantity).display_name, s.count,
                          s.average, s.median, s.min, s.max);
    }
    os << "\n";

    os << std::format("Top {} Slowest Requests:\n", summary.slowest_count);
    os << dashes << "\n";
    size_t rank = 1;
    for (const auto& record: summary.slowest) {
        os << std::format("{:>2}. [{}] {:>8.2f}ms - {} {}\n", rank, record.status, record.total_time,
                          record.method, truncate_url(record.url, url_width));
        rank++;
    }

    os << "\n" << rule << "\n\n";
}

std::string text_report(const AnalysisSummary& summary, size_t url_width) {
    std::ostringstream oss;
    write_text_report(oss, summary, url_width);
    return oss.str();
}

ordered_json to_export_json(const AnalysisSummary& summary) {
    ordered_json status_distribution = ordered_json::object();
    for (const auto& [status, count]: summary.status_distribution) {
        status_distribution[std::to_string(status)] = count;
    }

    ordered_json statistics = ordered_json::object();
    for (const auto& [quantity, s]: summary.statistics) {
        ordered_json j = ordered_json::object();
        j["count"] = s.count;
        j["total"] = s.total;
        j["average"] = s.average;
        j["median"] = s.median;
        j["min"] = s.min;
        j["max"] = s.max;
        j["std_dev"] = s.std_dev;
        statistics[std::string(quantity_info(quantity).key)] = std::move(j);
    }

    ordered_json slowest = ordered_json::array();
    for (const auto& record: summary.slowest) {
        ordered_json j = ordered_json::object();
        j["url"] = record.url;
        j["method"] = record.method;
        j["status"] = record.status;
        j["total_time_ms"] = record.total_time;
        slowest.emplace_back(std::move(j));
    }

    ordered_json doc = ordered_json::object();
    doc["summary"]["source_file"] = summary.source;
    doc["summary"]["total_requests"] = summary.total_requests;
    doc["summary"]["status_distribution"] = std::move(status_distribution);
    doc["timing_statistics"] = std::move(statistics);
    doc["slowest_requests"] = std::move(slowest);
    return doc;
}

void write_export_file(const AnalysisSummary& summary, const std::string& path) {
    // Serialize before touching the filesystem so a failure here leaves nothing behind.
    std::string text;
    try {
        text = to_export_json(summary).dump(2, ' ', false, ordered_json::error_handler_t::replace);
    } catch (const ordered_json::exception& e) {
        Logger.error(std::format("Failed to serialize export for {}: {}", path, e.what()));
    }

    auto tmp_path = path + ".tmp";
    auto discard_tmp = [&tmp_path]() {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
    };
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            Logger.error(std::format("Failed to open export file: {}", path));
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            out.close();
            discard_tmp();
            Logger.error(std::format("Failed writing export file: {}", path));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        discard_tmp();
        Logger.error(std::format("Failed to move export into place at {}: {}", path, ec.message()));
    }
    Logger.debug("Wrote export to {}", path);
}
