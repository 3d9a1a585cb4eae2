//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "timing_record.hpp"

using json = nlohmann::json;

// Pure per-entry transform. Missing or mistyped fields fall back to their
// defaults and phase values are clamped to >= 0; never throws.
TimingRecord timing_record_from_entry(const json& entry);

// Requires `log.entries` to be an array, otherwise throws std::runtime_error.
// Produces exactly one record per entry, in entry order.
std::vector<TimingRecord> extract_timing_records(const json& har);
