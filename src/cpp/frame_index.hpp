#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace molly {

struct FrameIndexEntry {
    std::uint64_t offset = 0;
    std::uint32_t length = 0;

    std::uint64_t end() const { return offset + length; }
    bool operator==(const FrameIndexEntry& other) const {
        return offset == other.offset && length == other.length;
    }
};

/**
 * @brief Byte offset and length of every frame record in a trajectory.
 *
 * Entries are contiguous: entry 0 starts at offset 0 and each entry starts
 * where the previous one ends. Building is all-or-nothing: a failed scan
 * throws and no partial index is produced.
 */
class FrameIndex {
public:
    FrameIndex() = default;

    /**
     * @brief Scan the headers of every record in [data, data + size).
     * @throws XtcError BadMagic / CorruptFrame / TruncatedInput with the
     * number of the frame that failed.
     */
    static FrameIndex build(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Index of the same file after it grew to `size` bytes.
     *
     * Entries already held are kept when the last one still measures the
     * same; only the new tail is scanned. Otherwise the file is rescanned
     * from the start. The result always equals build(data, size).
     */
    FrameIndex refreshed(const std::uint8_t* data, std::size_t size) const;

    /**
     * @brief Write the index to a binary cache file.
     * @param file_size size of the trajectory the index describes.
     * @throws std::runtime_error if writing fails.
     */
    void save(const std::string& cache_filename, std::uint64_t file_size) const;

    /**
     * @brief Read an index from a cache file and check it against the mapped trajectory.
     * @throws XtcError(FileNotFound) if the cache cannot be read,
     * XtcError(CorruptFrame) if it is malformed or does not describe this file.
     */
    static FrameIndex load(const std::string& cache_filename, const std::uint8_t* data, std::size_t size);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const FrameIndexEntry& operator[](std::size_t i) const { return entries_[i]; }
    /** @throws XtcError(IndexOutOfRange) */
    const FrameIndexEntry& at(std::size_t i) const;
    const std::vector<FrameIndexEntry>& entries() const { return entries_; }
    /** @brief Offset just past the last indexed record. */
    std::uint64_t end_offset() const { return entries_.empty() ? 0 : entries_.back().end(); }

    bool operator==(const FrameIndex& other) const { return entries_ == other.entries_; }
    bool operator!=(const FrameIndex& other) const { return !(*this == other); }

private:
    // Append entries for the records in [start, size); errors carry the frame number.
    static void scan(const std::uint8_t* data, std::size_t size, std::uint64_t start,
                     std::vector<FrameIndexEntry>& entries);

    std::vector<FrameIndexEntry> entries_;
};

} // namespace molly
