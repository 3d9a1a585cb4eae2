//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <string>
#include "logger.hpp"
#include "report.hpp"
#include "yaml-cpp/yaml.h"

struct AnalyzerConfig {
    size_t slowest_count = 10;
    size_t url_width = ReportConstants::DefaultUrlWidth;
    LogLevel log_level = INFO;
    std::string log_file = "stderr";

    std::string to_str() const;
};

// Every key is optional; missing keys keep the defaults above.
AnalyzerConfig config_from_yaml(const YAML::Node& root);

AnalyzerConfig load_analyzer_config(const std::string& yaml_path);
