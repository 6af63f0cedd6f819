// Coordinate codec for the xtc compressed coordinate block (xdr3dfcoord scheme).
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace molly {

class BitReader;

namespace codec {

/** Number of entries in the size-class table. */
constexpr int kMagicIntsSize = 73;
/** First usable index into the size-class table; entries below it are 0. */
constexpr int kFirstIdx = 9;
constexpr int kLastIdx = kMagicIntsSize;

/**
 * @brief Size-class boundaries of the small-delta encoding.
 * Each entry is roughly 2^(1/3) times the previous, so three entries
 * together cost about one extra bit.
 */
extern const std::array<int, kMagicIntsSize> kMagicInts;

/** @brief Smallest number of bits that can hold any value below `size`. */
unsigned size_of_int(unsigned size);

/**
 * @brief Number of bits needed to encode three values with the given
 * exclusive upper bounds as one mixed-radix integer.
 */
unsigned size_of_ints(const unsigned sizes[3]);

/**
 * @brief Decode three mixed-radix packed integers of `num_of_bits` bits.
 */
void decode_ints(BitReader& reader, unsigned num_of_bits, const unsigned sizes[3], std::int32_t nums[3]);

} // namespace codec

/**
 * @brief Parameters and packed bytes of one frame's compressed coordinates.
 * Borrowed view into the mapped file; only valid while decoding that frame.
 */
struct CompressedBlock {
    float precision = 0.0f;
    std::array<std::int32_t, 3> minint{};
    std::array<std::int32_t, 3> maxint{};
    std::int32_t smallidx = 0;
    const std::uint8_t* bytes = nullptr;
    std::size_t n_bytes = 0;
};

/**
 * @brief 1 / precision, rounded to float the way the reference decoder does it.
 */
float inverse_precision(float precision);

/**
 * @brief Decode the integer coordinates of atoms [0, limit) of a block
 * holding `natoms` atoms into `out` (3 * limit values).
 *
 * Decoding stops once `limit` atoms have been produced; the rest of the
 * block is not examined.
 * @throws XtcError(CorruptFrame) on any structural inconsistency.
 */
void decompress_ints(const CompressedBlock& block, std::size_t natoms, std::size_t limit, std::int32_t* out);

/**
 * @brief Same as decompress_ints, rescaled to float positions.
 * Each value is `float(int) * inverse_precision(block.precision)`.
 */
void decompress_coords(const CompressedBlock& block, std::size_t natoms, std::size_t limit, float* out);

} // namespace molly
