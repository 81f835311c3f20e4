#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O and download paths
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- MmapWriter: preallocated file written through a mapping ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create (truncating) the file, preallocate to size, then mmap.
    void open(const std::string& path, u64 size);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // Flush and close; throws if the flush fails
    void close();

    bool is_open() const { return open_; }
    u64 size() const { return size_; }

private:
    char* data_{nullptr};
    u64   size_{0};
    bool  open_{false};
    std::string path_;

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- Utility functions ----

// Reduce an offered file name to a plain base name.
// Returns false for empty names, "." / "..", or names carrying a
// separator or NUL byte.
bool safe_base_name(const std::string& offered, std::string& out);

// First free path for `name` in `dir` ("name.ext", then "name (1).ext", ...),
// created empty and exclusively so concurrent callers never get the same one.
// The caller renames its file over it or removes it.
fs::path claim_destination(const fs::path& dir, const std::string& name);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

bool is_regular_file(const std::string& path);

// Delete a file if it exists; failures are logged, never thrown
void remove_quietly(const fs::path& path);

} // namespace file_io
