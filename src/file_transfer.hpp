// src/file_transfer.hpp
// Chunked file receive: staging file, streaming MD5, atomic commit.

#pragma once

#include "checksum.hpp"
#include "tether/error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace tether {

// Result of a `file_query`. size and md5 are empty when the file does not exist.
struct FileInfo {
    std::string filename;
    std::optional<uint64_t> size;
    std::optional<std::string> md5;
};

// Size and MD5 of `root + filename`. Throws TetherError (Io) on a rejected
// name or a read failure.
FileInfo query_file(const std::string& root, const std::string& filename);

// Reject names that are empty or step outside the root with "..".
void check_filename(const std::string& filename);

// One incoming file. Bytes go to `<target>.new`; the target is replaced by
// rename() only once the declared size and MD5 both match. The target path
// is never opened for writing.
//
// Destroying an open writer closes the staging file and leaves it on disk.
class FileWriter {
public:
    enum class State { Idle, Open, Committed, Aborted };

    FileWriter(const std::string& root, std::string filename, uint64_t declared_size,
               std::string declared_md5);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create or truncate the staging file. Throws TetherError (Io).
    void begin();

    // Append a chunk; opens the staging file first if needed.
    // Throws TetherError (Io) on a storage failure or a finished session.
    void write_chunk(const uint8_t* data, size_t len);

    // Verify and publish. On a size or MD5 mismatch the staging file is
    // removed and TetherError (Integrity) is thrown. Storage failures throw
    // TetherError (Io), also after removing the staging file.
    void commit();

    // Close and remove the staging file. Safe to call more than once.
    void abort() noexcept;

    State state() const noexcept { return state_; }
    uint64_t bytes_written() const noexcept { return written_; }
    uint64_t declared_size() const noexcept { return declared_size_; }
    const std::string& filename() const noexcept { return filename_; }
    const std::string& target_path() const noexcept { return target_path_; }
    const std::string& staging_path() const noexcept { return staging_path_; }

private:
    void close_fd() noexcept;

    std::string filename_;
    std::string target_path_;
    std::string staging_path_;
    uint64_t declared_size_;
    std::string declared_md5_;

    Md5 hash_;
    uint64_t written_ = 0;
    int fd_ = -1;
    State state_ = State::Idle;
};

} // namespace tether
