#pragma once

// ============================================================
// bundle_builder.hpp -- Multi-file transfer archive
//
// Lays the offered files out back to back in one byte stream
// and materialises that stream as a temporary archive file.
// The receiver cuts the stream back into files using the same
// layout (entry order and sizes from the offer).
// ============================================================

#include "../common/platform.hpp"
#include "../common/hash.hpp"
#include "../common/protocol.hpp"
#include <atomic>
#include <string>
#include <vector>

// File as it appears in the archive stream.
struct BundleFile {
    std::string   name;            // base name sent to the receiver
    std::string   abs_path;
    u64           virtual_offset{0};
    u64           file_size{0};
    hash::Hash128 xxh3_128{};
};

class BundleBuilder {
public:
    // Assign stream offsets to `paths` in order. Throws std::runtime_error
    // for anything that is not a readable regular file.
    void build(const std::vector<std::string>& paths);

    // Copy every file into `archive_path`, hashing each file and the
    // whole stream in the same pass. Returns false if `cancel` was
    // raised (the partial archive is left for the caller to remove).
    // Throws std::runtime_error on I/O errors.
    bool write_archive(const std::string& archive_path, const std::atomic<bool>& cancel);

    const std::vector<BundleFile>& files() const { return files_; }
    u64 total_size() const { return total_size_; }
    const hash::Hash128& stream_hash() const { return stream_hash_; }

    // Offer entries (valid after write_archive)
    std::vector<TransferEntry> entries() const;

private:
    std::vector<BundleFile> files_;
    u64                     total_size_{0};
    hash::Hash128           stream_hash_{};
};

// xxh3-128 of a whole file. Returns false if cancelled; throws on I/O error.
bool hash_file(const std::string& path, const std::atomic<bool>& cancel, hash::Hash128& out);

// Receiver side: write entry i of the archive to out_paths[i] and verify
// its checksum. Returns the index of the first mismatching entry, or -1
// when every entry matches. Throws std::runtime_error on I/O errors or
// when the entry sizes do not add up to the archive size.
int split_archive(const std::string& archive_path,
                  const std::vector<TransferEntry>& entries,
                  const std::vector<std::string>& out_paths);
