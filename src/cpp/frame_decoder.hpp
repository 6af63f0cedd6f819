// Parsing of a single xtc frame record held in memory.
#pragma once
#include <cstddef>
#include <cstdint>
#include "basic.hpp"
#include "codec.hpp"

namespace molly {

constexpr std::int32_t kXtcMagic = 1995;

// magic, natoms, step, time, box[9], natoms
constexpr std::size_t kFrameHeaderBytes = 56;
// ... precision, minint[3], maxint[3], smallidx, byte count
constexpr std::size_t kCompressedHeaderBytes = kFrameHeaderBytes + 36;
// Frames with this many atoms or fewer store raw floats instead of a compressed block.
constexpr std::size_t kMaxUncompressedAtoms = 9;

/**
 * @brief Parse the fixed header fields of the record at `data`.
 * @throws XtcError BadMagic, TruncatedInput, CorruptFrame (negative or mismatched atom count).
 */
FrameHeader read_header(const std::uint8_t* data, std::size_t size);

/**
 * @brief Total byte length of the record at `data`, found from its header
 * alone (the compressed block is skipped, not decoded).
 * @throws XtcError BadMagic, CorruptFrame, TruncatedInput if the record
 * extends beyond `size`.
 */
std::uint32_t record_length(const std::uint8_t* data, std::size_t size);

/**
 * @brief Decode the positions of atoms [0, limit) of the record at `data`
 * into `out` (3 * min(limit, natoms) floats).
 * @param precision_out receives the frame precision (0 for raw frames); may be null.
 * @return the frame header.
 */
FrameHeader decode_positions(const std::uint8_t* data, std::size_t size, std::size_t limit,
                             float* out, float* precision_out);

/**
 * @brief Decode a complete frame: header, box and all positions.
 */
Frame decode_frame(const std::uint8_t* data, std::size_t size);

} // namespace molly
