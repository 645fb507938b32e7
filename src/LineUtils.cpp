#include "LineUtils.hpp"
#include <algorithm>
#include <functional>

bool contains_term(const char* data, size_t size, const std::string& term) {
	if (term.empty()) return true;
	if (size < term.size()) return false;
	const char* end = data + size;
	return std::search(data, end, std::boyer_moore_horspool_searcher(term.begin(), term.end())) != end;
}

uint64_t append_lines_reversed(const std::string& payload, const std::optional<std::string>& search, uint64_t max_lines, std::string& out) {
	uint64_t kept = 0;
	size_t end = payload.size();
	while (kept < max_lines) {
		// rfind from end - 1 so the terminator that closed the previous piece is skipped
		size_t nl = (end == 0) ? std::string::npos : payload.rfind('\n', end - 1);
		size_t begin = (nl == std::string::npos) ? 0 : nl + 1;
		const char* piece = payload.data() + begin;
		size_t piece_len = end - begin;

		bool keep = search ? contains_term(piece, piece_len, *search) : piece_len > 0;
		if (keep) {
			out.append(piece, piece_len);
			out.push_back('\n');
			++kept;
		}

		if (nl == std::string::npos) break;
		end = nl;
	}
	return kept;
}
