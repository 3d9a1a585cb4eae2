//
// Created by Sanger Steel on 10/19/26.
//

#include "analyzer_config.hpp"
#include <format>

namespace {

constexpr size_t MinUrlWidth = 4;

long read_count(const YAML::Node& node, const char* key) {
    auto value = node.as<long>();
    if (value < 0) {
        Logger.error(std::format("Config value '{}' must not be negative, got {}", key, value));
    }
    return value;
}

}

std::string AnalyzerConfig::to_str() const {
    std::string str = "==========\nANALYZER CONFIG\n";
    str += std::format("slowest_count: {}\n", slowest_count);
    str += std::format("url_width: {}\n", url_width);
    str += std::format("log_level: {}\n", log_level_name(log_level));
    str += std::format("log_file: {}\n", log_file);
    str += "==========\n";
    return str;
}

AnalyzerConfig config_from_yaml(const YAML::Node& root) {
    AnalyzerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        Logger.error("Config must be a YAML mapping");
    }

    try {
        if (const auto report = root["report"]) {
            if (report["slowest_count"]) {
                config.slowest_count = static_cast<size_t>(read_count(report["slowest_count"], "report.slowest_count"));
            }
            if (report["url_width"]) {
                config.url_width = static_cast<size_t>(read_count(report["url_width"], "report.url_width"));
                if (config.url_width < MinUrlWidth) {
                    Logger.error(std::format("Config value 'report.url_width' must be at least {}, got {}",
                                             MinUrlWidth, config.url_width));
                }
            }
        }
        if (const auto logging = root["logging"]) {
            if (logging["level"]) {
                config.log_level = log_level_from_string(logging["level"].as<std::string>());
            }
            if (logging["file"]) {
                config.log_file = logging["file"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        Logger.error(std::format("Invalid config: {}", e.what()));
    }
    return config;
}

AnalyzerConfig load_analyzer_config(const std::string& yaml_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::BadFile&) {
        Logger.error(std::format("Config file '{}' not found.", yaml_path));
    } catch (const YAML::Exception& e) {
        Logger.error(std::format("Invalid YAML in config file '{}': {}", yaml_path, e.what()));
    }
    return config_from_yaml(root);
}
