#include "FileQueryValidator.hpp"
#include "LogTailErrors.hpp"
#include <algorithm>

namespace {

// Decodes one code point at s[i]; returns false on malformed input.
bool decodeUtf8(const std::string& s, size_t& i, uint32_t& cp) {
    const unsigned char b0 = static_cast<unsigned char>(s[i]);
    size_t length;
    if (b0 <= 0x7Fu) { cp = b0; i += 1; return true; }
    else if (b0 >= 0xC2u && b0 <= 0xDFu) { length = 2; cp = b0 & 0x1Fu; }
    else if (b0 >= 0xE0u && b0 <= 0xEFu) { length = 3; cp = b0 & 0x0Fu; }
    else if (b0 >= 0xF0u && b0 <= 0xF4u) { length = 4; cp = b0 & 0x07u; }
    else return false;
    if (i + length > s.size()) return false;
    for (size_t k = 1; k < length; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0u) != 0x80u) return false;
        cp = (cp << 6) | (b & 0x3Fu);
    }
    if ((length == 3 && cp < 0x800u) || (length == 4 && (cp < 0x10000u || cp > 0x10FFFFu))) return false;
    if (cp >= 0xD800u && cp <= 0xDFFFu) return false;
    i += length;
    return true;
}

// Invisible or bidi formatting characters that make a term look like
// something it is not, plus C0/C1 controls other than TAB.
bool isAmbiguousCodePoint(uint32_t cp) {
    if (cp == 0x09u) return false;
    if (cp < 0x20u || (cp >= 0x7Fu && cp <= 0x9Fu)) return true;
    return cp == 0x00ADu || cp == 0x061Cu || cp == 0x180Eu || cp == 0xFEFFu ||
           (cp >= 0x200Bu && cp <= 0x200Fu) ||
           (cp >= 0x202Au && cp <= 0x202Eu) ||
           (cp >= 0x2060u && cp <= 0x2064u) ||
           (cp >= 0x2066u && cp <= 0x2069u) ||
           (cp >= 0xFFF9u && cp <= 0xFFFBu);
}

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

ValidationResult check_filepath(const std::optional<std::string>& value, size_t maxLength) {
    if (!value || std::all_of(value->begin(), value->end(), isBlank)) {
        return ValidationResult::fail("Filepath is required");
    }
    if (value->size() > maxLength) {
        return ValidationResult::fail("Filepath must be at most " + std::to_string(maxLength) + " bytes");
    }
    if (value->find('\0') != std::string::npos) {
        return ValidationResult::fail("Filepath must not contain null bytes");
    }
    return ValidationResult::pass();
}

ValidationResult check_entries(const std::optional<std::string>& value) {
    if (!value) {
        return ValidationResult::pass();
    }
    const std::string message = "Entries must be a valid non-negative integer.";
    if (value->empty() || value->size() > 16) {
        return ValidationResult::fail(message);
    }
    uint64_t parsed = 0;
    for (char c : *value) {
        if (c < '0' || c > '9') {
            return ValidationResult::fail(message);
        }
        parsed = parsed * 10 + static_cast<uint64_t>(c - '0');
    }
    if (parsed > kMaxEntries) {
        return ValidationResult::fail(message);
    }
    return ValidationResult::pass();
}

ValidationResult check_search(const std::optional<std::string>& value, size_t maxLength) {
    if (!value) {
        return ValidationResult::pass();
    }
    const std::string lengthMessage = "Invalid search query, length must be between 1 and " +
                                      std::to_string(maxLength) + " characters";
    size_t count = 0;
    size_t i = 0;
    while (i < value->size()) {
        uint32_t cp = 0;
        if (!decodeUtf8(*value, i, cp)) {
            return ValidationResult::fail("Invalid search query, not valid UTF-8");
        }
        if (isAmbiguousCodePoint(cp)) {
            return ValidationResult::fail("Invalid search query, contains invisible or control characters");
        }
        if (++count > maxLength) {
            return ValidationResult::fail(lengthMessage);
        }
    }
    if (count == 0) {
        return ValidationResult::fail(lengthMessage);
    }
    return ValidationResult::pass();
}

FileQueryValidator::FileQueryValidator(ValidationLimits limits) {
    rules_ = {
        {QueryField::Filepath, [limits](const std::optional<std::string>& v) { return check_filepath(v, limits.maxFilepathLength); }},
        {QueryField::Entries, [](const std::optional<std::string>& v) { return check_entries(v); }},
        {QueryField::Search, [limits](const std::optional<std::string>& v) { return check_search(v, limits.maxSearchLength); }},
    };
}

const std::optional<std::string>& FileQueryValidator::fieldOf(const FileQuery& query, QueryField field) {
    switch (field) {
    case QueryField::Filepath: return query.filepath;
    case QueryField::Entries: return query.entries;
    case QueryField::Search: return query.search;
    }
    return query.filepath;
}

ValidationResult FileQueryValidator::check(const FileQuery& query) const {
    ValidationResult first = ValidationResult::pass();
    for (const auto& rule : rules_) {
        ValidationResult result = rule.check(fieldOf(query, rule.field));
        if (!result.ok && first.ok) {
            first = std::move(result);
        }
    }
    return first;
}

void FileQueryValidator::validate(const FileQuery& query) const {
    ValidationResult result = check(query);
    if (!result.ok) {
        throw ValidationError(result.reason);
    }
}

std::optional<uint64_t> FileQueryValidator::parseEntries(const std::optional<std::string>& entries) {
    if (!entries) {
        return std::nullopt;
    }
    if (!check_entries(entries).ok) {
        throw ValidationError("Entries must be a valid non-negative integer.");
    }
    return std::stoull(*entries);
}
