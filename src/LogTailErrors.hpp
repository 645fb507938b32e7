#pragma once
#include <stdexcept>
#include <string>

// Bad request input. Raised before any file is opened.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// The file was modified after the session captured its baseline.
class FileChangedError : public std::runtime_error {
public:
    explicit FileChangedError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed UTF-8 in file content.
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& message) : std::runtime_error(message) {}
};

class ReaderConfigError : public std::invalid_argument {
public:
    explicit ReaderConfigError(const std::string& message) : std::invalid_argument(message) {}
};
