#pragma once
#include <cstddef>
#include <string>

// Incremental UTF-8 validator. Chunks are fed in emission order; an invalid
// sequence anywhere raises EncodingError, nothing is ever substituted.
class EncodingGuard {
public:
    // Validates a self-contained chunk. Fails if a pending partial sequence
    // exists or if the chunk ends inside a character.
    std::string validateComplete(const char* data, size_t size);

    // Validates the next chunk of a stream. A character cut at the chunk end
    // is held back and prepended to the next chunk; the returned string
    // always ends on a character boundary.
    std::string validateStreaming(const char* data, size_t size);

    // Ends a stream. Fails if a partial character is still pending.
    void finalize();

    size_t pendingBytes() const { return pending_.size(); }

private:
    // Returns the length of the longest valid prefix that ends on a
    // character boundary. Throws on an invalid sequence; a truncated final
    // character is tolerated only when allowTruncatedTail is set.
    static size_t validPrefix(const unsigned char* data, size_t size, bool allowTruncatedTail);

    std::string pending_;
};
