//
// Created by Sanger Steel on 10/19/26.
//

#include "har_loader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include "logger.hpp"

json parse_har_text(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        Logger.error(std::format("Invalid JSON in HAR file: {}", e.what()));
    }
}

json load_har_document(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Logger.error(std::format("File '{}' not found.", path));
    }
    if (std::filesystem::is_directory(path, ec)) {
        Logger.error(std::format("Could not open file '{}': is a directory.", path));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        Logger.error(std::format("Could not open file '{}'.", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        Logger.error(std::format("Failed reading file '{}'.", path));
    }

    auto text = buffer.str();
    Logger.debug(std::format("Read {} bytes from {}", text.size(), path));
    return parse_har_text(text);
}
