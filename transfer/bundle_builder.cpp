// ============================================================
// bundle_builder.cpp -- Archive layout, build and split
// ============================================================

#include "bundle_builder.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

// Copy/hash granularity; cancel is checked between slices
static constexpr u64 COPY_SLICE = 4ULL * 1024 * 1024;

void BundleBuilder::build(const std::vector<std::string>& paths) {
    files_.clear();
    total_size_  = 0;
    stream_hash_ = hash::Hash128{};

    // 1. Assign virtual offsets to each file in order
    for (const auto& p : paths) {
        if (!file_io::is_regular_file(p)) {
            throw std::runtime_error("Not a regular file: " + p);
        }
        BundleFile bf;
        bf.name           = fs::path(p).filename().string();
        bf.abs_path       = fs::absolute(p).string();
        bf.virtual_offset = total_size_;
        bf.file_size      = file_io::get_file_size(p);
        total_size_ += bf.file_size;
        files_.push_back(std::move(bf));
    }
}

bool BundleBuilder::write_archive(const std::string& archive_path, const std::atomic<bool>& cancel) {
    file_io::MmapWriter out;
    out.open(archive_path, total_size_);

    hash::StreamHasher128 stream;

    // 2. Copy each file at its offset, hashing as we go
    for (auto& bf : files_) {
        file_io::MmapReader in(bf.abs_path);
        if (in.size() != bf.file_size) {
            throw std::runtime_error("File changed size while bundling: " + bf.abs_path);
        }

        hash::StreamHasher128 file_hash;
        for (u64 off = 0; off < bf.file_size; off += COPY_SLICE) {
            if (cancel.load()) {
                out.close();
                return false;
            }
            u64 n = in.chunk_len(off, COPY_SLICE);
            const char* src = in.chunk_ptr(off);
            out.write_at(bf.virtual_offset + off, src, (size_t)n);
            file_hash.update(src, (size_t)n);
            stream.update(src, (size_t)n);
        }
        bf.xxh3_128 = file_hash.digest();
    }

    out.close();
    stream_hash_ = stream.digest();
    LOG_DEBUG("Bundled " + std::to_string(files_.size()) + " files (" +
              utils::format_bytes(total_size_) + ") into " + archive_path);
    return true;
}

std::vector<TransferEntry> BundleBuilder::entries() const {
    std::vector<TransferEntry> out;
    out.reserve(files_.size());
    for (auto& bf : files_) {
        TransferEntry e;
        e.name     = bf.name;
        e.size     = bf.file_size;
        e.xxh3_128 = bf.xxh3_128;
        out.push_back(std::move(e));
    }
    return out;
}

bool hash_file(const std::string& path, const std::atomic<bool>& cancel, hash::Hash128& out) {
    file_io::MmapReader in(path);
    hash::StreamHasher128 h;
    for (u64 off = 0; off < in.size(); off += COPY_SLICE) {
        if (cancel.load()) return false;
        u64 n = in.chunk_len(off, COPY_SLICE);
        h.update(in.chunk_ptr(off), (size_t)n);
    }
    out = h.digest();
    return true;
}

int split_archive(const std::string& archive_path,
                  const std::vector<TransferEntry>& entries,
                  const std::vector<std::string>& out_paths) {
    if (entries.size() != out_paths.size()) {
        throw std::invalid_argument("split_archive: entry/path count mismatch");
    }

    file_io::MmapReader in(archive_path);
    u64 total = 0;
    for (auto& e : entries) total += e.size;
    if (total != in.size()) {
        throw std::runtime_error("Archive size " + std::to_string(in.size()) +
                                 " does not match entries (" + std::to_string(total) + ")");
    }

    u64 offset = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        const TransferEntry& e = entries[i];
        const char* src = in.chunk_ptr(offset);

        hash::Hash128 h = hash::xxh3_128(e.size ? src : nullptr, (size_t)e.size);
        if (h != e.xxh3_128) {
            LOG_WARN("Checksum mismatch for bundled file " + e.name);
            return (int)i;
        }

        file_io::MmapWriter out;
        out.open(out_paths[i], e.size);
        if (e.size) out.write_at(0, src, (size_t)e.size);
        out.close();
        offset += e.size;
    }
    return -1;
}
