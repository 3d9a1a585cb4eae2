//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view help_text = R"(
Usage: hartime <har-file-path> [OPTIONS]

Options:
  <har-file-path>        HAR (HTTP Archive) capture to analyze

  --export <path>        Also write the analysis as a JSON document to <path>
  --top <int>            Number of slowest requests to rank (default 10)
  --config <path>        Path to a .yaml file with report and logging settings
  --help                 Show this help message

Examples:
  hartime mywebsite.har
  hartime mywebsite.har --export results.json
)";

struct CliOptions {
    std::string har_path;
    std::optional<std::string> export_path = std::nullopt;
    std::optional<std::string> config_path = std::nullopt;
    std::optional<size_t> top = std::nullopt;
    bool show_help = false;
};

// Throws std::runtime_error on a missing HAR path or a bad argument.
CliOptions parse_cli_args(const std::vector<std::string>& args);

// Runs the whole pipeline and returns the process exit code. The report goes
// to `out`, fatal errors to `err`.
int run_analyzer(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
