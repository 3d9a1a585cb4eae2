//
// Created by Sanger Steel on 10/19/26.
//

#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

StatBlock describe(std::vector<double> values) {
    StatBlock block;
    if (values.empty()) {
        return block;
    }
    std::sort(values.begin(), values.end());

    size_t n = values.size();
    block.count = n;
    block.total = std::accumulate(values.begin(), values.end(), 0.0);
    block.average = block.total / static_cast<double>(n);
    block.min = values.front();
    block.max = values.back();
    if (n % 2 == 1) {
        block.median = values[n / 2];
    } else {
        block.median = (values[n / 2 - 1] + values[n / 2]) / 2.0;
    }

    if (n > 1) {
        double squared_deviations = 0;
        for (double v: values) {
            squared_deviations += (v - block.average) * (v - block.average);
        }
        block.std_dev = std::sqrt(squared_deviations / static_cast<double>(n - 1));
    }
    return block;
}

TimingStatistics compute_statistics(const std::vector<TimingRecord>& records) {
    TimingStatistics stats;
    if (records.empty()) {
        return stats;
    }
    stats.reserve(Quantities.size());
    for (const auto& info: Quantities) {
        std::vector<double> values;
        values.reserve(records.size());
        for (const auto& record: records) {
            double v = record.*(info.field);
            if (v > 0) {
                values.emplace_back(v);
            }
        }
        stats.push_back(QuantityStats{info.quantity, describe(std::move(values))});
    }
    return stats;
}
