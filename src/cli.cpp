//
// Created by Sanger Steel on 10/19/26.
//

#include "cli.hpp"
#include <format>
#include <stdexcept>
#include "analysis_session.hpp"
#include "analyzer_config.hpp"
#include "logger.hpp"
#include "report.hpp"

namespace {

size_t parse_count(const std::string& s, const char* cli_arg) {
    auto invalid = std::format("Invalid {} value (must be a non-negative integer): {}", cli_arg, s);
    size_t idx = 0;
    long v = -1;
    try {
        v = std::stol(s, &idx, 10);
    } catch (const std::logic_error&) {
        Logger.error(invalid);
    }
    if (idx != s.size() || v < 0) {
        Logger.error(invalid);
    }
    return static_cast<size_t>(v);
}

}

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--export" && i + 1 < args.size()) {
            options.export_path = args[++i];
        } else if (arg == "--export") {
            Logger.info("--export given without an output path, skipping export");
        } else if (arg == "--config" && i + 1 < args.size()) {
            options.config_path = args[++i];
        } else if (arg == "--top" && i + 1 < args.size()) {
            options.top = parse_count(args[++i], "--top");
        } else if (options.har_path.empty() && !arg.starts_with("--")) {
            options.har_path = arg;
        } else {
            Logger.error(std::format("Unrecognized or incomplete argument: {}", arg));
        }
    }
    if (options.har_path.empty() && !options.show_help) {
        Logger.error("Required arg not set: <har-file-path>");
    }
    return options;
}

int run_analyzer(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        err << help_text << std::endl;
        return 1;
    }

    try {
        auto options = parse_cli_args(args);
        if (options.show_help) {
            out << help_text << std::endl;
            return 0;
        }

        AnalyzerConfig config;
        if (options.config_path.has_value()) {
            config = load_analyzer_config(options.config_path.value());
            Logger.set_level(config.log_level);
            Logger.sink.reopen(config.log_file);
        }
        if (options.top.has_value()) {
            config.slowest_count = options.top.value();
        }
        Logger.debug(config.to_str());

        auto session = AnalysisSession::from_file(options.har_path);
        auto summary = summarize(session, config.slowest_count);
        write_text_report(out, summary, config.url_width);

        if (options.export_path.has_value()) {
            const auto& export_path = options.export_path.value();
            write_export_file(summary, export_path);
            out << std::format("Analysis exported to: {}\n", export_path);
        }
    } catch (const std::exception& e) {
        err << e.what() << std::endl;
        return 1;
    }
    return 0;
}
