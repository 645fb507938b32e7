#include "FileSession.hpp"
#include "LogTailErrors.hpp"
#include <cerrno>
#include <system_error>
#include <utility>
#include <unistd.h>
#include <trantor/utils/Logger.h>

namespace {

bool isLater(const struct timespec& a, const struct timespec& b) {
    return a.tv_sec != b.tv_sec ? a.tv_sec > b.tv_sec : a.tv_nsec > b.tv_nsec;
}

} // namespace

FileSession::FileSession(const std::string& path)
    : path_(path),
      fileMapping_(path.c_str(), boost::interprocess::read_only),
      open_(true) {
    struct stat st = currentStat();
    sizeAtOpen_ = static_cast<uint64_t>(st.st_size);
    modTimeAtOpen_ = st.st_mtim;
}

FileSession::~FileSession() {
    close();
}

int FileSession::descriptor() const {
    return fileMapping_.get_mapping_handle().handle;
}

struct stat FileSession::currentStat() const {
    struct stat st;
    if (::fstat(descriptor(), &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "fstat " + path_);
    }
    return st;
}

void FileSession::verifyUnchanged() const {
    struct stat st = currentStat();
    if (isLater(st.st_mtim, modTimeAtOpen_)) {
        throw FileChangedError("File modified during reading: " + path_);
    }
    if (static_cast<uint64_t>(st.st_size) < sizeAtOpen_) {
        throw FileChangedError("File truncated during reading: " + path_);
    }
}

void FileSession::readAt(uint64_t offset, char* dst, size_t size) {
    if (!open_) {
        throw std::logic_error("Read on closed file session");
    }
    if (size == 0) {
        return;
    }
    if (offset > sizeAtOpen_ || size > sizeAtOpen_ - offset) {
        throw std::out_of_range("Read past the size captured at open");
    }
    verifyUnchanged();
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pread(descriptor(), dst + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "pread " + path_);
        }
        if (n == 0) {
            throw FileChangedError("File truncated during reading: " + path_);
        }
        done += static_cast<size_t>(n);
    }
}

void FileSession::close() noexcept {
    if (!open_) {
        return;
    }
    open_ = false;
    try {
        boost::interprocess::file_mapping released(std::move(fileMapping_));
    } catch (const std::exception& e) {
        LOG_WARN << "Error closing file handle for " << path_ << ": " << e.what();
    }
}
