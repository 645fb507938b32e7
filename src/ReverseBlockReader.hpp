#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "EncodingGuard.hpp"
#include "FileSession.hpp"
#include "OverlapSearchScanner.hpp"

struct ReaderOptions {
    size_t blockSize = 1024 * 1024;
    size_t leftoverCeiling = 10 * 1024 * 1024;
};

// Walks a file from its end towards its start in fixed-size blocks and
// produces newline-terminated lines, most recent first. Auxiliary memory is
// bounded by the block size and the leftover ceiling; a line longer than the
// ceiling is located on disk and streamed in chunks instead of buffered.
//
// The reader is driven from outside: every step() performs at most one
// positioned read of at most one block and appends whatever text that read
// completes, which may be nothing. The session is
// closed as soon as the reader reaches Done, fails, or is cancelled.
class ReverseBlockReader {
public:
    enum class State { Scanning, ResolvingOversizedLine, Done };

    ReverseBlockReader(std::unique_ptr<FileSession> session,
                       std::optional<uint64_t> maxEntries,
                       std::optional<std::string> search,
                       ReaderOptions options = ReaderOptions());

    ReverseBlockReader(const ReverseBlockReader&) = delete;
    ReverseBlockReader& operator=(const ReverseBlockReader&) = delete;

    // Runs one step and appends its output to out. Returns false once the
    // reader is Done. Any exception leaves the reader Done with the file closed.
    bool step(std::string& out);

    // Steps until some text is produced or the reader is done. Returns
    // nullopt when exhausted. Unbounded; transports drive step() instead.
    std::optional<std::string> next();

    // Stops generation and releases the file. No read happens afterwards.
    void cancel();

    State state() const { return state_; }
    bool cancelled() const { return cancelled_; }
    uint64_t currentReadOffset() const { return offset_; }
    uint64_t entriesRemaining() const { return entriesRemaining_; }
    size_t leftoverSize() const { return leftover_.size(); }
    const FileSession& session() const { return *session_; }

private:
    enum class ResolvePhase { FindStart, Search, Emit };

    void scanStep(std::string& out);
    void resolveStep(std::string& out);
    void processBlockWithNewline(size_t readSize, size_t newlinePos, std::string& out);
    void emitFinalLeftover(std::string& out);
    void enterOversizedLine();
    void lineStartFound(uint64_t lineStart);
    void leaveOversizedLine();
    void finish();

    std::unique_ptr<FileSession> session_;
    std::optional<std::string> search_;
    ReaderOptions options_;
    OverlapSearchScanner scanner_;
    EncodingGuard guard_;

    std::vector<char> block_;
    std::string leftover_;
    uint64_t offset_;
    uint64_t entriesRemaining_;
    State state_ = State::Scanning;
    bool cancelled_ = false;

    // Oversized line bookkeeping: [lineStart_, lineEnd_) once located.
    ResolvePhase phase_ = ResolvePhase::FindStart;
    uint64_t lineStart_ = 0;
    uint64_t lineEnd_ = 0;
    uint64_t cursor_ = 0;
};
