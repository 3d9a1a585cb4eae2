//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <cstddef>
#include <vector>
#include "timing_record.hpp"

struct StatBlock {
    size_t count = 0;
    double total = 0;
    double average = 0;
    double median = 0;
    double min = 0;
    double max = 0;
    double std_dev = 0;
};

struct QuantityStats {
    Quantity quantity;
    StatBlock stats;
};

// One entry per quantity in `Quantities` order, or empty when there were no
// records at all.
using TimingStatistics = std::vector<QuantityStats>;

// Descriptive statistics of `values`. Sample standard deviation (n - 1),
// 0 for a single value; an all-zero block for no values.
StatBlock describe(std::vector<double> values);

// Only values > 0 contribute to a quantity, so a record can count towards
// DNS while being left out of SSL.
TimingStatistics compute_statistics(const std::vector<TimingRecord>& records);
