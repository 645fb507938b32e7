#include "OverlapSearchScanner.hpp"
#include "LineUtils.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

OverlapSearchScanner::OverlapSearchScanner(FileSession& session, size_t chunkSize)
    : session_(session), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }
}

void OverlapSearchScanner::begin(uint64_t start, uint64_t end, const std::string& term) {
    if (term.empty()) {
        throw std::invalid_argument("search term must not be empty");
    }
    term_ = term;
    pos_ = start;
    end_ = end;
    carried_ = 0;
    // window layout: [carried overlap][chunk]
    window_.resize(term_.size() - 1 + chunkSize_);
}

OverlapSearchScanner::Progress OverlapSearchScanner::advance() {
    if (pos_ >= end_) {
        return Progress::NotFound;
    }
    size_t readSize = static_cast<size_t>(std::min<uint64_t>(chunkSize_, end_ - pos_));
    session_.readAt(pos_, window_.data() + carried_, readSize);
    ++chunksRead_;
    pos_ += readSize;
    size_t filled = carried_ + readSize;
    if (contains_term(window_.data(), filled, term_)) {
        pos_ = end_;
        return Progress::Found;
    }
    carried_ = std::min(term_.size() - 1, filled);
    std::memmove(window_.data(), window_.data() + filled - carried_, carried_);
    return pos_ < end_ ? Progress::More : Progress::NotFound;
}

bool OverlapSearchScanner::contains(uint64_t start, uint64_t end, const std::string& term) {
    begin(start, end, term);
    Progress progress;
    while ((progress = advance()) == Progress::More) {
    }
    return progress == Progress::Found;
}
