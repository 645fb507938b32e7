#include "ReverseBlockReader.hpp"
#include "LineUtils.hpp"
#include "LogTailErrors.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <limits>
#include <utility>

namespace {

constexpr char kNewLine = '\n';

const ReaderOptions& checked(const ReaderOptions& options) {
    if (options.blockSize == 0) {
        throw ReaderConfigError("blockSize must be positive");
    }
    if (options.blockSize >= options.leftoverCeiling) {
        throw ReaderConfigError("blockSize must be less than leftoverCeiling");
    }
    return options;
}

} // namespace

ReverseBlockReader::ReverseBlockReader(std::unique_ptr<FileSession> session,
                                       std::optional<uint64_t> maxEntries,
                                       std::optional<std::string> search,
                                       ReaderOptions options)
    : session_(std::move(session)),
      search_(std::move(search)),
      options_(checked(options)),
      scanner_(*session_, options_.blockSize),
      block_(options_.blockSize),
      offset_(session_->sizeAtOpen()),
      entriesRemaining_(maxEntries.value_or(std::numeric_limits<uint64_t>::max())) {
    if (search_ && search_->empty()) {
        search_.reset();
    }
}

bool ReverseBlockReader::step(std::string& out) {
    if (state_ == State::Done) {
        return false;
    }
    try {
        if (state_ == State::Scanning) {
            scanStep(out);
        } else {
            resolveStep(out);
        }
    } catch (...) {
        finish();
        throw;
    }
    return state_ != State::Done;
}

std::optional<std::string> ReverseBlockReader::next() {
    std::string out;
    while (out.empty() && step(out)) {
    }
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

void ReverseBlockReader::cancel() {
    cancelled_ = true;
    finish();
}

void ReverseBlockReader::finish() {
    state_ = State::Done;
    leftover_ = std::string();
    session_->close();
}

void ReverseBlockReader::scanStep(std::string& out) {
    if (entriesRemaining_ == 0) {
        finish();
        return;
    }
    if (offset_ == 0) {
        emitFinalLeftover(out);
        finish();
        return;
    }

    size_t readSize = static_cast<size_t>(std::min<uint64_t>(options_.blockSize, offset_));
    offset_ -= readSize;
    session_->readAt(offset_, block_.data(), readSize);

    // Blocks are consumed back to front, so the terminator nearest the block
    // start closes the earliest complete line this block can finish.
    const char* hit = static_cast<const char*>(std::memchr(block_.data(), kNewLine, readSize));
    if (hit == nullptr) {
        leftover_.insert(0, block_.data(), readSize);
        if (leftover_.size() > options_.leftoverCeiling) {
            enterOversizedLine();
        }
        return;
    }
    processBlockWithNewline(readSize, static_cast<size_t>(hit - block_.data()), out);
}

void ReverseBlockReader::processBlockWithNewline(size_t readSize, size_t newlinePos, std::string& out) {
    std::string payload;
    payload.reserve(readSize - newlinePos - 1 + leftover_.size());
    payload.append(block_.data() + newlinePos + 1, readSize - newlinePos - 1);
    payload.append(leftover_);
    leftover_ = std::string(block_.data(), newlinePos);

    const std::string text = guard_.validateComplete(payload.data(), payload.size());
    uint64_t kept = append_lines_reversed(text, search_, entriesRemaining_, out);
    entriesRemaining_ -= kept;
}

void ReverseBlockReader::emitFinalLeftover(std::string& out) {
    if (leftover_.empty() || entriesRemaining_ == 0) {
        return;
    }
    const std::string line = guard_.validateComplete(leftover_.data(), leftover_.size());
    if (search_ && !contains_term(line.data(), line.size(), *search_)) {
        return;
    }
    out.append(line);
    out.push_back(kNewLine);
    --entriesRemaining_;
}

void ReverseBlockReader::enterOversizedLine() {
    state_ = State::ResolvingOversizedLine;
    phase_ = ResolvePhase::FindStart;
    lineEnd_ = offset_ + leftover_.size();
    lineStart_ = 0;
    cursor_ = offset_;
    leftover_ = std::string();
}

void ReverseBlockReader::lineStartFound(uint64_t lineStart) {
    lineStart_ = lineStart;
    cursor_ = lineStart_;
    if (search_) {
        phase_ = ResolvePhase::Search;
        scanner_.begin(lineStart_, lineEnd_, *search_);
    } else {
        phase_ = ResolvePhase::Emit;
    }
}

void ReverseBlockReader::leaveOversizedLine() {
    offset_ = lineStart_ > 0 ? lineStart_ - 1 : 0;
    state_ = State::Scanning;
}

void ReverseBlockReader::resolveStep(std::string& out) {
    switch (phase_) {
    case ResolvePhase::FindStart: {
        if (cursor_ == 0) {
            lineStartFound(0);
            return;
        }
        size_t readSize = static_cast<size_t>(std::min<uint64_t>(options_.blockSize, cursor_));
        cursor_ -= readSize;
        session_->readAt(cursor_, block_.data(), readSize);
        auto rbegin = std::make_reverse_iterator(block_.data() + readSize);
        auto rend = std::make_reverse_iterator(block_.data());
        auto hit = std::find(rbegin, rend, kNewLine);
        if (hit != rend) {
            // hit.base() points one past the terminator.
            lineStartFound(cursor_ + static_cast<uint64_t>(hit.base() - block_.data()));
        }
        return;
    }
    case ResolvePhase::Search:
        switch (scanner_.advance()) {
        case OverlapSearchScanner::Progress::Found:
            phase_ = ResolvePhase::Emit;
            cursor_ = lineStart_;
            break;
        case OverlapSearchScanner::Progress::NotFound:
            leaveOversizedLine();
            break;
        case OverlapSearchScanner::Progress::More:
            break;
        }
        return;
    case ResolvePhase::Emit: {
        size_t readSize = static_cast<size_t>(std::min<uint64_t>(options_.blockSize, lineEnd_ - cursor_));
        session_->readAt(cursor_, block_.data(), readSize);
        cursor_ += readSize;
        out.append(guard_.validateStreaming(block_.data(), readSize));
        if (cursor_ >= lineEnd_) {
            guard_.finalize();
            out.push_back(kNewLine);
            --entriesRemaining_;
            leaveOversizedLine();
        }
        return;
    }
    }
}
