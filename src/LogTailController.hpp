#pragma once
#include <exception>
#include <memory>
#include <string>
#include <json/json.h>
#include "BaseDirectory.hpp"
#include "FileQueryValidator.hpp"
#include "LineStreamAdapter.hpp"
#include "ServerConfig.hpp"

class LogTailController {
public:
    explicit LogTailController(ServerConfig config);

    Json::Value createError(const std::string& message) const;

    // HTTP status for a failure raised before any byte was sent.
    static int statusFor(std::exception_ptr error);

    // Validates the query, resolves the file, opens it and pulls the first
    // chunk. Everything that can fail before streaming starts fails here.
    std::unique_ptr<LineStreamAdapter> openStream(const FileQuery& query) const;

    const ServerConfig& config() const { return config_; }

private:
    ServerConfig config_;
    BaseDirectory baseDir_;
    FileQueryValidator validator_;
};
