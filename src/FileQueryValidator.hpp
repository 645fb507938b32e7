#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Raw query parameters of GET /file; absent parameters are nullopt.
struct FileQuery {
    std::optional<std::string> filepath;
    std::optional<std::string> entries;
    std::optional<std::string> search;
};

struct ValidationResult {
    bool ok = true;
    std::string reason;

    static ValidationResult pass() { return ValidationResult(); }
    static ValidationResult fail(std::string reason) { return ValidationResult{false, std::move(reason)}; }
};

struct ValidationLimits {
    size_t maxFilepathLength = 4096;
    size_t maxSearchLength = 10000;
};

enum class QueryField { Filepath, Entries, Search };

struct ValidationRule {
    QueryField field;
    std::function<ValidationResult(const std::optional<std::string>&)> check;
};

ValidationResult check_filepath(const std::optional<std::string>& value, size_t maxLength);
ValidationResult check_entries(const std::optional<std::string>& value);
ValidationResult check_search(const std::optional<std::string>& value, size_t maxLength);

// Largest accepted entry count (2^53 - 1).
constexpr uint64_t kMaxEntries = 9007199254740991ULL;

class FileQueryValidator {
public:
    explicit FileQueryValidator(ValidationLimits limits = ValidationLimits());

    // Runs every rule in order; returns the first failure or pass.
    ValidationResult check(const FileQuery& query) const;
    // Same as check() but raises ValidationError on failure.
    void validate(const FileQuery& query) const;

    const std::vector<ValidationRule>& rules() const { return rules_; }

    // Entry cap of a validated query; nullopt means unbounded.
    static std::optional<uint64_t> parseEntries(const std::optional<std::string>& entries);

private:
    static const std::optional<std::string>& fieldOf(const FileQuery& query, QueryField field);

    std::vector<ValidationRule> rules_;
};
