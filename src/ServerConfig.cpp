#include "ServerConfig.hpp"
#include "LogTailErrors.hpp"
#include <cstdlib>
#include <limits>
#include <fstream>
#include <trantor/utils/Logger.h>

namespace {

size_t readSize(const Json::Value& section, const char* key, size_t fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = section[key];
    if (!v.isUInt64()) {
        throw ReaderConfigError(std::string("logtail.") + key + " must be a non-negative integer");
    }
    return static_cast<size_t>(v.asUInt64());
}

std::optional<uint64_t> parseDigits(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

} // namespace

std::optional<uint16_t> parsePort(const std::string& text) {
    auto value = parseDigits(text);
    if (!value || *value == 0 || *value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

std::optional<size_t> parseByteSize(const std::string& text) {
    auto value = parseDigits(text);
    if (!value || *value == 0 || *value > std::numeric_limits<size_t>::max()) {
        return std::nullopt;
    }
    return static_cast<size_t>(*value);
}

ServerConfig parseServerConfig(const Json::Value& root) {
    ServerConfig config;
    if (!root.isObject() || !root.isMember("logtail")) {
        LOG_INFO << "No 'logtail' section in config, using defaults";
        return config;
    }
    const Json::Value& section = root["logtail"];
    config.baseDir = section.get("base_dir", config.baseDir).asString();
    config.corsOrigin = section.get("cors_origin", config.corsOrigin).asString();
    config.reader.blockSize = readSize(section, "block_size", config.reader.blockSize);
    config.reader.leftoverCeiling = readSize(section, "leftover_ceiling", config.reader.leftoverCeiling);
    config.limits.maxSearchLength = readSize(section, "max_search_length", config.limits.maxSearchLength);
    config.limits.maxFilepathLength = readSize(section, "max_filepath_length", config.limits.maxFilepathLength);

    if (config.reader.blockSize == 0) {
        throw ReaderConfigError("logtail.block_size must be positive");
    }
    if (config.reader.blockSize >= config.reader.leftoverCeiling) {
        throw ReaderConfigError("logtail.block_size must be less than logtail.leftover_ceiling");
    }
    return config;
}

ServerConfig loadServerConfig(const std::string& path) {
    Json::Value root;
    std::ifstream configFile(path);
    if (!configFile) {
        LOG_WARN << "Config file " << path << " not found, using defaults";
    } else {
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
            LOG_WARN << "Failed to parse " << path << ": " << errs;
            root = Json::Value();
        }
    }

    ServerConfig config = parseServerConfig(root);
    if (const char* env = std::getenv("LOGTAIL_BASE_DIR")) {
        if (*env != '\0') {
            config.baseDir = env;
        }
    }
    LOG_INFO << "Base directory: " << config.baseDir
             << ", block size: " << config.reader.blockSize
             << ", leftover ceiling: " << config.reader.leftoverCeiling;
    return config;
}
