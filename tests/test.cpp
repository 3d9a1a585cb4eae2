//
// Created by Sanger Steel on 10/19/26.
//

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "logger.hpp"
#include "har_loader.hpp"
#include "test_helpers.hpp"

const std::string filename = "stderr";
LoggingContext Logger(filename, DEBUG);


TEST_CASE( "Loader parses a valid HAR file" ) {
    auto path = write_temp_file("valid.har", har_with_entries(json::array({har_entry("https://a.test/", 200, 10)})).dump());
    auto doc = load_har_document(path);
    REQUIRE(doc["log"]["entries"].size() == 1);
}

TEST_CASE( "Loader reports a missing file" ) {
    auto path = temp_path("does_not_exist.har").string();
    std::filesystem::remove(path);
    try {
        load_har_document(path);
        FAIL("expected load_har_document to throw");
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        REQUIRE(what.find("not found") != std::string::npos);
        REQUIRE(what.find(path) != std::string::npos);
    }
}

TEST_CASE( "Loader reports invalid JSON distinctly from a missing file" ) {
    auto path = write_temp_file("broken.har", "{\"log\": {\"entries\": [");
    try {
        load_har_document(path);
        FAIL("expected load_har_document to throw");
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        REQUIRE(what.find("Invalid JSON") != std::string::npos);
        REQUIRE(what.find("not found") == std::string::npos);
    }
}

TEST_CASE( "Numbers out of double range are reported as invalid JSON" ) {
    try {
        parse_har_text("[1e400]");
        FAIL("expected parse_har_text to throw");
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        REQUIRE(what.find("Invalid JSON in HAR file") != std::string::npos);
    }
}

TEST_CASE( "Loader rejects an empty file as invalid JSON" ) {
    auto path = write_temp_file("empty.har", "");
    REQUIRE_THROWS_AS(load_har_document(path), std::runtime_error);
}

TEST_CASE( "Log levels round trip through their names" ) {
    REQUIRE(log_level_from_string("debug") == DEBUG);
    REQUIRE(log_level_from_string("info") == INFO);
    REQUIRE(log_level_from_string("error") == ERROR);
    REQUIRE(log_level_from_string("none") == NOTSET);
    REQUIRE(log_level_name(INFO) == "info");
    REQUIRE_THROWS_AS(log_level_from_string("verbose"), std::runtime_error);
}

TEST_CASE( "Logger.error throws with an ERROR prefix" ) {
    try {
        Logger.error("boom");
        FAIL("expected Logger.error to throw");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "ERROR: boom");
    }
}
