#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/stat.h>
#include <boost/interprocess/file_mapping.hpp>

// Read-only handle on one file. Size and modification time are taken from
// the open descriptor and serve as the consistency baseline for every later
// read, so a rename or replace of the path does not affect the session.
class FileSession {
public:
    explicit FileSession(const std::string& path);
    ~FileSession();

    FileSession(const FileSession&) = delete;
    FileSession& operator=(const FileSession&) = delete;

    const std::string& path() const { return path_; }
    uint64_t sizeAtOpen() const { return sizeAtOpen_; }
    bool isOpen() const { return open_; }

    // Throws FileChangedError if the modification time advanced since open
    // or the file no longer holds the bytes captured at open.
    void verifyUnchanged() const;

    // Copies [offset, offset + size) into dst after verifying the file is
    // unchanged. The range must lie within sizeAtOpen(). A short read means
    // the file shrank underneath the session and throws FileChangedError.
    void readAt(uint64_t offset, char* dst, size_t size);

    // Releases the handle. Failures are logged, never thrown. Idempotent.
    void close() noexcept;

private:
    int descriptor() const;
    struct stat currentStat() const;

    std::string path_;
    boost::interprocess::file_mapping fileMapping_;
    uint64_t sizeAtOpen_ = 0;
    struct timespec modTimeAtOpen_ = {};
    bool open_;
};
