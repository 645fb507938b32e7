#pragma once
#include <filesystem>
#include <string>

// The directory every requested file path is resolved against.
class BaseDirectory {
public:
    explicit BaseDirectory(const std::string& root);

    // Maps user input to an existing regular file inside the root.
    // Throws ValidationError ("Invalid file path", "File not found",
    // "Not a valid file").
    std::string resolve(const std::string& userInput) const;

    // True if canonical lies at or below the canonical root.
    bool contains(const std::filesystem::path& canonical) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};
