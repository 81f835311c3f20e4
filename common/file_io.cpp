// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "logger.hpp"
#include <vector>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <algorithm>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const char*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    if (is_open()) {
        try {
            close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("MmapWriter close in destructor: ") + e.what());
        }
    }
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    path_ = file_path;
    size_ = size;

    ensure_parent_dirs(file_path);

#ifdef _WIN32
    file_handle_ = CreateFileA(file_path.c_str(), GENERIC_READ | GENERIC_WRITE, 0,
                               nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot create file: " + file_path);
    }

    LARGE_INTEGER li;
    li.QuadPart = (LONGLONG)size;
    if (!SetFilePointerEx(file_handle_, li, nullptr, FILE_BEGIN) || !SetEndOfFile(file_handle_)) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("Cannot preallocate: " + file_path);
    }
    open_ = true;

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    DWORD hi = (DWORD)(size >> 32);
    DWORD lo = (DWORD)(size & 0xFFFFFFFF);
    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READWRITE, hi, lo, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
        open_ = false;
        throw std::runtime_error("CreateFileMapping(write) failed: " + path_);
    }

    data_ = static_cast<char*>(MapViewOfFile(map_handle_, FILE_MAP_WRITE, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        map_handle_ = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
        open_ = false;
        throw std::runtime_error("MapViewOfFile(write) failed: " + path_);
    }
#else
    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + strerror(errno));
    }
    open_ = true;

    if (size > 0) {
        int rc = posix_fallocate(fd_, 0, (off_t)size);
        if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
            ::close(fd_);
            fd_ = -1;
            open_ = false;
            throw std::runtime_error("Cannot preallocate " + std::to_string(size) +
                                     " bytes: " + file_path);
        }

        void* p = mmap(nullptr, (size_t)size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
        if (p == MAP_FAILED) {
            ::close(fd_);
            fd_ = -1;
            open_ = false;
            throw std::runtime_error("mmap(write) failed: " + path_);
        }
        data_ = static_cast<char*>(p);
    } else {
        data_ = nullptr;
    }
#endif
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw std::runtime_error("MmapWriter::write_at out of bounds: " + path_);
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    if (!open_) return;
    open_ = false;
    bool flushed = true;
#ifdef _WIN32
    if (data_) {
        flushed = FlushViewOfFile(data_, 0) != 0;
        UnmapViewOfFile(data_);
        data_ = nullptr;
    }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
    }
#else
    if (data_ && size_ > 0) {
        flushed = msync(data_, (size_t)size_, MS_SYNC) == 0;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        if (::close(fd_) != 0) flushed = false;
        fd_ = -1;
    }
#endif
    size_ = 0;
    if (!flushed) {
        throw std::runtime_error("Flush failed: " + path_);
    }
}

// ============================================================
// Utility functions
// ============================================================

bool file_io::safe_base_name(const std::string& offered, std::string& out) {
    if (offered.empty() || offered == "." || offered == "..") return false;
    if (offered.find('\0') != std::string::npos) return false;
    if (offered.find('/') != std::string::npos) return false;
    if (offered.find('\\') != std::string::npos) return false;
    if (offered.size() >= 2 && offered[1] == ':') return false;  // drive letter
    out = offered;
    return true;
}

// Create `path` only if nothing is there yet. False when it exists.
static bool create_exclusive(const fs::path& path) {
#ifdef _WIN32
    HANDLE h = CreateFileW(path.wstring().c_str(), GENERIC_WRITE, 0, nullptr,
                           CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        DWORD err = GetLastError();
        if (err == ERROR_FILE_EXISTS || err == ERROR_ALREADY_EXISTS) return false;
        throw std::runtime_error("Cannot create " + path.string() + ": error " + std::to_string(err));
    }
    CloseHandle(h);
#else
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return false;
        throw std::runtime_error("Cannot create " + path.string() + ": " + std::strerror(errno));
    }
    ::close(fd);
#endif
    return true;
}

fs::path file_io::claim_destination(const fs::path& dir, const std::string& name) {
    fs::path candidate = dir / name;
    if (create_exclusive(candidate)) return candidate;

    fs::path p(name);
    std::string stem = p.stem().string();
    std::string ext  = p.extension().string();
    for (int n = 1; n < 10000; ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (create_exclusive(candidate)) return candidate;
    }
    throw std::runtime_error("No free file name for " + name + " in " + dir.string());
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

bool file_io::is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

void file_io::remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Cannot remove " + path.string() + ": " + ec.message());
    }
}
