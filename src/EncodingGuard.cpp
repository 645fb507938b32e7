#include "EncodingGuard.hpp"
#include "LogTailErrors.hpp"

namespace {

inline bool isContinuation(unsigned char b) {
    return (b & 0xC0u) == 0x80u;
}

[[noreturn]] void throwInvalid(size_t position) {
    throw EncodingError("Invalid UTF-8 sequence at byte " + std::to_string(position));
}

} // namespace

size_t EncodingGuard::validPrefix(const unsigned char* data, size_t size, bool allowTruncatedTail) {
    size_t i = 0;
    while (i < size) {
        const unsigned char b0 = data[i];
        if (b0 <= 0x7Fu) {
            ++i;
            continue;
        }

        size_t length = 0;
        if (b0 >= 0xC2u && b0 <= 0xDFu) {
            length = 2;
        } else if (b0 >= 0xE0u && b0 <= 0xEFu) {
            length = 3;
        } else if (b0 >= 0xF0u && b0 <= 0xF4u) {
            length = 4;
        } else {
            throwInvalid(i);
        }

        // Check every byte that is present, even for a truncated tail, so a
        // bad continuation byte is reported as soon as it is seen.
        size_t available = size - i;
        size_t present = available < length ? available : length;
        for (size_t k = 1; k < present; ++k) {
            if (!isContinuation(data[i + k])) {
                throwInvalid(i);
            }
        }
        if (present >= 2) {
            const unsigned char b1 = data[i + 1];
            if ((b0 == 0xE0u && b1 < 0xA0u) ||   // overlong
                (b0 == 0xEDu && b1 >= 0xA0u) ||  // surrogate
                (b0 == 0xF0u && b1 < 0x90u) ||   // overlong
                (b0 == 0xF4u && b1 >= 0x90u)) {  // above U+10FFFF
                throwInvalid(i);
            }
        }
        if (present < length) {
            if (!allowTruncatedTail) {
                throwInvalid(i);
            }
            return i;
        }
        i += length;
    }
    return size;
}

std::string EncodingGuard::validateComplete(const char* data, size_t size) {
    if (!pending_.empty()) {
        throw EncodingError("Incomplete UTF-8 sequence before chunk");
    }
    validPrefix(reinterpret_cast<const unsigned char*>(data), size, false);
    return std::string(data, size);
}

std::string EncodingGuard::validateStreaming(const char* data, size_t size) {
    std::string combined;
    combined.reserve(pending_.size() + size);
    combined.append(pending_);
    combined.append(data, size);
    pending_.clear();

    size_t boundary = validPrefix(reinterpret_cast<const unsigned char*>(combined.data()), combined.size(), true);
    pending_.assign(combined, boundary, std::string::npos);
    combined.resize(boundary);
    return combined;
}

void EncodingGuard::finalize() {
    if (!pending_.empty()) {
        pending_.clear();
        throw EncodingError("Incomplete UTF-8 sequence at end of input");
    }
}
