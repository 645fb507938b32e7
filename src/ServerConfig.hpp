#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>
#include "FileQueryValidator.hpp"
#include "ReverseBlockReader.hpp"

struct ServerConfig {
    std::string baseDir = "/var/log";
    ReaderOptions reader;
    ValidationLimits limits;
    std::string corsOrigin = "http://localhost:3000";
};

// Applies the "logtail" section of a parsed config.json on top of defaults.
// Throws ReaderConfigError if the reader sizes are inconsistent.
ServerConfig parseServerConfig(const Json::Value& root);

// Reads and parses path. A missing or malformed file yields the defaults
// (logged). LOGTAIL_BASE_DIR overrides base_dir when set.
ServerConfig loadServerConfig(const std::string& path);

// Listening port from text such as the PORT variable: 1..65535, digits only.
std::optional<uint16_t> parsePort(const std::string& text);

// Positive byte count given on the command line, digits only.
std::optional<size_t> parseByteSize(const std::string& text);
