#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "FileSession.hpp"

// Forward substring search over a byte range of a file, one chunk at a time.
// The last len(term) - 1 bytes of each window are carried into the next so a
// match straddling a chunk boundary is still found.
class OverlapSearchScanner {
public:
    enum class Progress { Found, NotFound, More };

    OverlapSearchScanner(FileSession& session, size_t chunkSize);

    // Starts a search for term within [start, end). term must not be empty.
    void begin(uint64_t start, uint64_t end, const std::string& term);

    // Reads and searches the next chunk of the range given to begin().
    Progress advance();

    // Runs a whole search. True if term occurs within [start, end).
    bool contains(uint64_t start, uint64_t end, const std::string& term);

    uint64_t chunksRead() const { return chunksRead_; }

private:
    FileSession& session_;
    size_t chunkSize_;
    std::vector<char> window_;
    std::string term_;
    uint64_t pos_ = 0;
    uint64_t end_ = 0;
    size_t carried_ = 0;
    uint64_t chunksRead_ = 0;
};
