#include "frame_index.hpp"
#include "error.hpp"
#include "frame_decoder.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace molly {

static const char kCacheMagic[8] = {'M', 'O', 'L', 'L', 'Y', 'I', 'D', 'X'};
static const std::uint32_t kCacheVersion = 1;

// ----------------------------------------------------------------------------
// Scanning
// ----------------------------------------------------------------------------

void FrameIndex::scan(const std::uint8_t* data, std::size_t size, std::uint64_t start,
                      std::vector<FrameIndexEntry>& entries) {
    std::uint64_t offset = start;
    while (offset < size) {
        FrameIndexEntry entry;
        entry.offset = offset;
        try {
            entry.length = record_length(data + offset, size - offset);
        } catch (const XtcError& e) {
            throw e.with_frame(entries.size());
        }
        entries.push_back(entry);
        offset = entry.end();
    }
}

FrameIndex FrameIndex::build(const std::uint8_t* data, std::size_t size) {
    FrameIndex index;
    if (data == nullptr || size == 0) {
        return index;
    }
    std::vector<FrameIndexEntry> entries;
    scan(data, size, 0, entries);
    index.entries_ = std::move(entries);
    return index;
}

FrameIndex FrameIndex::refreshed(const std::uint8_t* data, std::size_t size) const {
    if (entries_.empty() || data == nullptr || end_offset() > size) {
        return build(data, size);
    }

    // 1. The last known record must still be where it was, with the same length.
    const FrameIndexEntry& last = entries_.back();
    bool unchanged = false;
    try {
        unchanged = record_length(data + last.offset, size - last.offset) == last.length;
    } catch (const XtcError&) {
        unchanged = false;
    }
    if (!unchanged) {
        return build(data, size);
    }

    // 2. Scan only the tail that was appended.
    std::vector<FrameIndexEntry> entries = entries_;
    scan(data, size, end_offset(), entries);
    FrameIndex index;
    index.entries_ = std::move(entries);
    return index;
}

const FrameIndexEntry& FrameIndex::at(std::size_t i) const {
    if (i >= entries_.size()) {
        throw XtcError(ErrorKind::IndexOutOfRange,
                       "frame " + std::to_string(i) + " is out of bounds (total frames: " +
                       std::to_string(entries_.size()) + ")");
    }
    return entries_[i];
}

// ----------------------------------------------------------------------------
// Cache I/O
// ----------------------------------------------------------------------------

void FrameIndex::save(const std::string& cache_filename, std::uint64_t file_size) const {
    std::ofstream out(cache_filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open cache file for writing: " + cache_filename);
    }

    // 1. header
    out.write(kCacheMagic, sizeof(kCacheMagic));
    out.write(reinterpret_cast<const char*>(&kCacheVersion), sizeof(kCacheVersion));
    out.write(reinterpret_cast<const char*>(&file_size), sizeof(file_size));

    // 2. entries
    std::uint64_t num_frames = entries_.size();
    out.write(reinterpret_cast<const char*>(&num_frames), sizeof(num_frames));
    for (const auto& entry : entries_) {
        out.write(reinterpret_cast<const char*>(&entry.offset), sizeof(entry.offset));
        out.write(reinterpret_cast<const char*>(&entry.length), sizeof(entry.length));
    }

    if (!out) {
        throw std::runtime_error("Error occurred while writing to cache file: " + cache_filename);
    }
}

FrameIndex FrameIndex::load(const std::string& cache_filename, const std::uint8_t* data, std::size_t size) {
    std::ifstream in(cache_filename, std::ios::binary);
    if (!in) {
        throw XtcError(ErrorKind::FileNotFound, "failed to open cache file for reading: " + cache_filename);
    }

    // 1. header
    char magic[sizeof(kCacheMagic)];
    std::uint32_t version = 0;
    std::uint64_t file_size = 0;
    in.read(magic, sizeof(magic));
    in.read(reinterpret_cast<char*>(&version), sizeof(version));
    in.read(reinterpret_cast<char*>(&file_size), sizeof(file_size));
    if (in.fail() || std::memcmp(magic, kCacheMagic, sizeof(kCacheMagic)) != 0) {
        throw XtcError(ErrorKind::CorruptFrame, "not an index cache file: " + cache_filename);
    }
    if (version != kCacheVersion) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "unsupported index cache version " + std::to_string(version));
    }
    if (file_size != size) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "index cache describes a file of " + std::to_string(file_size) +
                       " bytes, trajectory has " + std::to_string(size));
    }

    // 2. entries
    std::uint64_t num_frames = 0;
    in.read(reinterpret_cast<char*>(&num_frames), sizeof(num_frames));
    if (in.fail()) {
        throw XtcError(ErrorKind::CorruptFrame, "cache read error: num_frames");
    }
    // a record is never shorter than its header
    if (num_frames > size / kFrameHeaderBytes) {
        throw XtcError(ErrorKind::CorruptFrame, "cache claims " + std::to_string(num_frames) + " frames");
    }

    std::vector<FrameIndexEntry> entries(static_cast<std::size_t>(num_frames));
    std::uint64_t expected_offset = 0;
    for (auto& entry : entries) {
        in.read(reinterpret_cast<char*>(&entry.offset), sizeof(entry.offset));
        in.read(reinterpret_cast<char*>(&entry.length), sizeof(entry.length));
        if (in.fail()) {
            throw XtcError(ErrorKind::CorruptFrame, "cache read error: frame entries");
        }
        if (entry.offset != expected_offset) {
            throw XtcError(ErrorKind::CorruptFrame, "index cache entries are not contiguous");
        }
        expected_offset = entry.end();
    }
    if (expected_offset != size) {
        throw XtcError(ErrorKind::CorruptFrame, "index cache does not cover the whole trajectory");
    }

    // 3. spot check the first and last record against the file
    if (!entries.empty()) {
        const std::size_t spot_checks[2] = {0, entries.size() - 1};
        for (std::size_t frame : spot_checks) {
            const FrameIndexEntry& entry = entries[frame];
            std::uint32_t length = 0;
            try {
                length = record_length(data + entry.offset, size - entry.offset);
            } catch (const XtcError& e) {
                throw XtcError(ErrorKind::CorruptFrame,
                               std::string("index cache disagrees with the trajectory: ") + e.what(), frame);
            }
            if (length != entry.length) {
                throw XtcError(ErrorKind::CorruptFrame, "index cache disagrees with the trajectory", frame);
            }
        }
    }

    FrameIndex index;
    index.entries_ = std::move(entries);
    return index;
}

} // namespace molly
