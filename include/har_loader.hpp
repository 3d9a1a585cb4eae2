//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Reads and parses a whole HAR file. Throws std::runtime_error when the file
// is missing or unreadable, or when its content is not valid JSON.
json load_har_document(const std::string& path);

json parse_har_text(const std::string& text);
