#include "BaseDirectory.hpp"
#include "LogTailErrors.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    const char* blanks = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = s.find_last_not_of(blanks);
    return s.substr(first, last - first + 1);
}

} // namespace

BaseDirectory::BaseDirectory(const std::string& root) {
    std::error_code ec;
    root_ = fs::canonical(root, ec);
    if (ec) {
        // Keep the lexical form so requests fail with "File not found"
        // instead of the server refusing to start.
        root_ = fs::absolute(root).lexically_normal();
    }
}

bool BaseDirectory::contains(const fs::path& canonical) const {
    std::string rootStr = root_.string();
    std::string candidate = canonical.string();
    if (!rootStr.empty() && rootStr.back() == '/') {
        rootStr.pop_back();
    }
    return candidate == rootStr || candidate.compare(0, rootStr.length() + 1, rootStr + "/") == 0;
}

std::string BaseDirectory::resolve(const std::string& userInput) const {
    std::string relativeInput = trim(userInput);
    size_t firstNonSlash = relativeInput.find_first_not_of('/');
    relativeInput = firstNonSlash == std::string::npos ? std::string() : relativeInput.substr(firstNonSlash);

    fs::path joined = (root_ / relativeInput).lexically_normal();
    fs::path relative = joined.lexically_relative(root_);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        throw ValidationError("Invalid file path");
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(joined, ec);
    if (ec) {
        throw ValidationError("File not found");
    }
    // "name/" asks for a directory even when name is a regular file.
    if (relativeInput.back() == '/') {
        throw ValidationError("Not a valid file");
    }
    // Symlinks may point outside the root.
    if (!contains(canonical) || canonical == root_) {
        throw ValidationError("Invalid file path");
    }
    if (!fs::is_regular_file(canonical, ec)) {
        throw ValidationError("Not a valid file");
    }
    return canonical.string();
}
