#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Splits payload on '\n' and walks the pieces from last to first. Without a
// search term every non-empty piece is kept; with one, every piece containing
// it. At most max_lines pieces are appended to out, each followed by '\n'.
// Returns the number of pieces kept.
uint64_t append_lines_reversed(const std::string& payload, const std::optional<std::string>& search, uint64_t max_lines, std::string& out);

// Byte-wise substring test.
bool contains_term(const char* data, size_t size, const std::string& term);
