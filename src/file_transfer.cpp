// src/file_transfer.cpp
// Chunked file receive.

#include "file_transfer.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace tether {

namespace {

std::string errno_text(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

void check_filename(const std::string& filename) {
    if (filename.empty()) {
        throw TetherError::io("empty filename");
    }
    size_t start = 0;
    while (start <= filename.size()) {
        size_t end = filename.find('/', start);
        if (end == std::string::npos) end = filename.size();
        if (filename.compare(start, end - start, "..") == 0) {
            throw TetherError::io("filename must not contain '..': " + filename);
        }
        start = end + 1;
    }
}

FileInfo query_file(const std::string& root, const std::string& filename) {
    check_filename(filename);

    FileInfo info;
    info.filename = filename;
    std::string path = root + filename;

    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return info;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw TetherError::io(errno_text("cannot open", path));
    }

    Md5 hash;
    uint64_t total = 0;
    uint8_t buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = errno_text("cannot read", path);
            ::close(fd);
            throw TetherError::io(err);
        }
        if (n == 0) break;
        hash.update(buf, static_cast<size_t>(n));
        total += static_cast<uint64_t>(n);
    }
    ::close(fd);

    info.size = total;
    info.md5 = hash.hex_digest();
    return info;
}

// --- FileWriter ---

FileWriter::FileWriter(const std::string& root, std::string filename, uint64_t declared_size,
                       std::string declared_md5)
    : filename_(std::move(filename)),
      declared_size_(declared_size),
      declared_md5_(std::move(declared_md5)) {
    check_filename(filename_);
    target_path_ = root + filename_;
    staging_path_ = target_path_ + ".new";
}

FileWriter::~FileWriter() {
    close_fd();
}

void FileWriter::close_fd() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FileWriter::begin() {
    if (state_ == State::Committed || state_ == State::Aborted) {
        throw TetherError::io("transfer of " + filename_ + " already finished");
    }
    close_fd();

    fd_ = ::open(staging_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw TetherError::io(errno_text("cannot create", staging_path_));
    }
    hash_ = Md5();
    written_ = 0;
    state_ = State::Open;
    spdlog::debug("receiving {} ({} bytes) into {}", filename_, declared_size_, staging_path_);
}

void FileWriter::write_chunk(const uint8_t* data, size_t len) {
    if (state_ == State::Idle) {
        begin();
    } else if (state_ != State::Open) {
        throw TetherError::io("transfer of " + filename_ + " already finished");
    }

    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd_, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TetherError::io(errno_text("cannot write", staging_path_));
        }
        if (n == 0) {
            throw TetherError::io("no progress writing " + staging_path_);
        }
        done += static_cast<size_t>(n);
    }

    hash_.update(data, len);
    written_ += len;
}

void FileWriter::commit() {
    if (state_ == State::Idle) {
        begin();
    } else if (state_ != State::Open) {
        throw TetherError::io("transfer of " + filename_ + " already finished");
    }

    if (written_ != declared_size_) {
        spdlog::warn("bad file size for {}: expected {}, received {}",
                     filename_, declared_size_, written_);
        abort();
        throw TetherError::integrity("bad file size: expected " + std::to_string(declared_size_)
            + ", received " + std::to_string(written_));
    }

    std::string actual = hash_.hex_digest();
    if (!digest_equals(actual, declared_md5_)) {
        spdlog::warn("bad md5 for {}: expected {}, received {}", filename_, declared_md5_, actual);
        abort();
        throw TetherError::integrity("bad md5: expected " + declared_md5_ + ", received " + actual);
    }

    if (::fsync(fd_) != 0) {
        std::string err = errno_text("cannot sync", staging_path_);
        abort();
        throw TetherError::io(err);
    }
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        std::string err = errno_text("cannot close", staging_path_);
        abort();
        throw TetherError::io(err);
    }
    if (::rename(staging_path_.c_str(), target_path_.c_str()) != 0) {
        std::string err = errno_text("cannot rename", staging_path_);
        abort();
        throw TetherError::io(err);
    }

    state_ = State::Committed;
    spdlog::info("file written: {} ({} bytes)", target_path_, written_);
}

void FileWriter::abort() noexcept {
    if (state_ != State::Open) {
        if (state_ == State::Idle) state_ = State::Aborted;
        return;
    }
    close_fd();
    if (::unlink(staging_path_.c_str()) != 0 && errno != ENOENT) {
        spdlog::warn("cannot remove {}: {}", staging_path_, std::strerror(errno));
    }
    state_ = State::Aborted;
}

} // namespace tether
