//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <ostream>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "analysis_session.hpp"

using ordered_json = nlohmann::ordered_json;

namespace ReportConstants {
    static constexpr size_t RuleWidth = 80;
    static constexpr size_t SectionRuleWidth = 40;
    static constexpr size_t DefaultUrlWidth = 60;
    static constexpr std::string_view Ellipsis = "...";
}

// Cuts `url` to `max_width` UTF-8 code points, the last three being "...".
// Never splits a multi-byte sequence.
std::string truncate_url(const std::string& url, size_t max_width = ReportConstants::DefaultUrlWidth);

void write_text_report(std::ostream& os, const AnalysisSummary& summary,
                       size_t url_width = ReportConstants::DefaultUrlWidth);

std::string text_report(const AnalysisSummary& summary, size_t url_width = ReportConstants::DefaultUrlWidth);

ordered_json to_export_json(const AnalysisSummary& summary);

// Writes to `<path>.tmp` first and renames it over `path`, so a failed
// export never leaves a half-written document behind. Invalid UTF-8 in
// strings is replaced with U+FFFD.
void write_export_file(const AnalysisSummary& summary, const std::string& path);
