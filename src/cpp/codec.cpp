#include "codec.hpp"
#include "bit_reader.hpp"
#include "error.hpp"

#include <string>
#include <utility>

namespace molly {
namespace codec {

const std::array<int, kMagicIntsSize> kMagicInts = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 8, 10, 12, 16, 20, 25, 32, 40, 50, 64,
    80, 101, 128, 161, 203, 256, 322, 406, 512, 645, 812, 1024, 1290,
    1625, 2048, 2580, 3250, 4096, 5060, 6501, 8192, 10321, 13003,
    16384, 20642, 26007, 32768, 41285, 52015, 65536, 82570, 104031,
    131072, 165140, 208063, 262144, 330280, 416127, 524287, 660561,
    832255, 1048576, 1321122, 1664510, 2097152, 2642245, 3329021,
    4194304, 5284491, 6658042, 8388607, 10568983, 13316085, 16777216,
};

unsigned size_of_int(unsigned size) {
    std::uint64_t num = 1;
    unsigned num_of_bits = 0;
    while (size >= num && num_of_bits < 32) {
        num_of_bits++;
        num <<= 1;
    }
    return num_of_bits;
}

unsigned size_of_ints(const unsigned sizes[3]) {
    unsigned bytes[32];
    unsigned num_of_bytes = 1;
    bytes[0] = 1;
    for (int i = 0; i < 3; ++i) {
        unsigned tmp = 0;
        unsigned bytecnt;
        for (bytecnt = 0; bytecnt < num_of_bytes; ++bytecnt) {
            tmp = bytes[bytecnt] * sizes[i] + tmp;
            bytes[bytecnt] = tmp & 0xff;
            tmp >>= 8;
        }
        while (tmp != 0) {
            bytes[bytecnt++] = tmp & 0xff;
            tmp >>= 8;
        }
        num_of_bytes = bytecnt;
    }
    unsigned num = 1;
    unsigned num_of_bits = 0;
    num_of_bytes--;
    while (bytes[num_of_bytes] >= num) {
        num_of_bits++;
        num *= 2;
    }
    return num_of_bits + num_of_bytes * 8;
}

void decode_ints(BitReader& reader, unsigned num_of_bits, const unsigned sizes[3], std::int32_t nums[3]) {
    // the packed value is little-endian by byte, each byte read MSB-first
    unsigned bytes[32] = {0};
    int num_of_bytes = 0;
    if (num_of_bits > 8 * 32) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "packed integer width " + std::to_string(num_of_bits) + " too large");
    }
    while (num_of_bits > 8) {
        bytes[num_of_bytes++] = reader.read_bits(8);
        num_of_bits -= 8;
    }
    if (num_of_bits > 0) {
        bytes[num_of_bytes++] = reader.read_bits(num_of_bits);
    }
    for (int i = 2; i > 0; --i) {
        unsigned num = 0;
        for (int j = num_of_bytes - 1; j >= 0; --j) {
            num = (num << 8) | bytes[j];
            unsigned p = num / sizes[i];
            bytes[j] = p;
            num = num - p * sizes[i];
        }
        nums[i] = static_cast<std::int32_t>(num);
    }
    nums[0] = static_cast<std::int32_t>(bytes[0] | (bytes[1] << 8) | (bytes[2] << 16) | (bytes[3] << 24));
}

} // namespace codec

using codec::kFirstIdx;
using codec::kLastIdx;
using codec::kMagicInts;

float inverse_precision(float precision) {
    return static_cast<float>(1.0 / static_cast<double>(precision));
}

namespace {

void check_smallidx(std::int32_t smallidx) {
    if (smallidx < kFirstIdx || smallidx >= kLastIdx) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "size index " + std::to_string(smallidx) + " outside the magic table range [" +
                       std::to_string(kFirstIdx) + ", " + std::to_string(kLastIdx) + ")");
    }
}

/*
 * Core of the decompression. `emit(index, x, y, z)` receives every atom in
 * output order; decoding returns as soon as `limit` atoms were emitted.
 */
template <typename Emit>
void decode_block(const CompressedBlock& block, std::size_t natoms, std::size_t limit, Emit&& emit) {
    if (limit > natoms) limit = natoms;
    if (limit == 0) return;

    unsigned sizeint[3];
    unsigned bitsizeint[3] = {0, 0, 0};
    for (int k = 0; k < 3; ++k) {
        sizeint[k] = static_cast<unsigned>(block.maxint[k]) - static_cast<unsigned>(block.minint[k]) + 1u;
        if (sizeint[k] == 0) {
            throw XtcError(ErrorKind::CorruptFrame, "coordinate range overflows 32 bits");
        }
    }

    // a bitsize of 0 flags sizes too large to be multiplied together
    unsigned bitsize = 0;
    if ((sizeint[0] | sizeint[1] | sizeint[2]) > 0xffffff) {
        for (int k = 0; k < 3; ++k) {
            bitsizeint[k] = codec::size_of_int(sizeint[k]);
        }
    } else {
        bitsize = codec::size_of_ints(sizeint);
    }

    std::int32_t smallidx = block.smallidx;
    check_smallidx(smallidx);
    int smaller = kMagicInts[smallidx - 1 > kFirstIdx ? smallidx - 1 : kFirstIdx] / 2;
    int smallnum = kMagicInts[smallidx] / 2;
    unsigned sizesmall[3];
    sizesmall[0] = sizesmall[1] = sizesmall[2] = static_cast<unsigned>(kMagicInts[smallidx]);

    BitReader reader(block.bytes, block.n_bytes);
    std::size_t i = 0;        // atoms decoded
    std::size_t written = 0;  // atoms emitted
    int run = 0;
    std::int32_t thiscoord[3];
    std::int32_t prevcoord[3];

    while (i < natoms) {
        if (bitsize == 0) {
            thiscoord[0] = static_cast<std::int32_t>(reader.read_bits(bitsizeint[0]));
            thiscoord[1] = static_cast<std::int32_t>(reader.read_bits(bitsizeint[1]));
            thiscoord[2] = static_cast<std::int32_t>(reader.read_bits(bitsizeint[2]));
        } else {
            codec::decode_ints(reader, bitsize, sizeint, thiscoord);
        }
        i++;
        for (int k = 0; k < 3; ++k) {
            thiscoord[k] = static_cast<std::int32_t>(static_cast<std::uint32_t>(thiscoord[k]) +
                                                     static_cast<std::uint32_t>(block.minint[k]));
            prevcoord[k] = thiscoord[k];
        }

        int is_smaller = 0;
        if (reader.read_bits(1) == 1) {
            run = static_cast<int>(reader.read_bits(5));
            is_smaller = run % 3;
            run -= is_smaller;
            is_smaller--;
        }

        if (run > 0) {
            if (i + static_cast<std::size_t>(run / 3) > natoms) {
                throw XtcError(ErrorKind::CorruptFrame,
                               "run of " + std::to_string(run / 3) + " atoms at atom " + std::to_string(i) +
                               " exceeds the atom count " + std::to_string(natoms));
            }
            for (int k = 0; k < run; k += 3) {
                codec::decode_ints(reader, static_cast<unsigned>(smallidx), sizesmall, thiscoord);
                i++;
                thiscoord[0] += prevcoord[0] - smallnum;
                thiscoord[1] += prevcoord[1] - smallnum;
                thiscoord[2] += prevcoord[2] - smallnum;
                if (k == 0) {
                    // first and second atom of a run are stored interchanged (water molecules)
                    std::swap(thiscoord[0], prevcoord[0]);
                    std::swap(thiscoord[1], prevcoord[1]);
                    std::swap(thiscoord[2], prevcoord[2]);
                    emit(written++, prevcoord[0], prevcoord[1], prevcoord[2]);
                    if (written == limit) return;
                } else {
                    prevcoord[0] = thiscoord[0];
                    prevcoord[1] = thiscoord[1];
                    prevcoord[2] = thiscoord[2];
                }
                emit(written++, thiscoord[0], thiscoord[1], thiscoord[2]);
                if (written == limit) return;
            }
        } else {
            emit(written++, thiscoord[0], thiscoord[1], thiscoord[2]);
            if (written == limit) return;
        }

        smallidx += is_smaller;
        check_smallidx(smallidx);
        if (is_smaller < 0) {
            smallnum = smaller;
            smaller = smallidx > kFirstIdx ? kMagicInts[smallidx - 1] / 2 : 0;
        } else if (is_smaller > 0) {
            smaller = smallnum;
            smallnum = kMagicInts[smallidx] / 2;
        }
        sizesmall[0] = sizesmall[1] = sizesmall[2] = static_cast<unsigned>(kMagicInts[smallidx]);
    }
}

template <typename Emit>
void decode_block_checked(const CompressedBlock& block, std::size_t natoms, std::size_t limit, Emit&& emit) {
    try {
        decode_block(block, natoms, limit, emit);
    } catch (const XtcError& e) {
        if (e.kind() != ErrorKind::TruncatedInput) throw;
        throw XtcError(ErrorKind::CorruptFrame,
                       "compressed block of " + std::to_string(block.n_bytes) + " bytes ended early: " + e.what());
    }
}

} // namespace

void decompress_ints(const CompressedBlock& block, std::size_t natoms, std::size_t limit, std::int32_t* out) {
    decode_block_checked(block, natoms, limit,
        [out](std::size_t idx, std::int32_t x, std::int32_t y, std::int32_t z) {
            out[idx * 3 + 0] = x;
            out[idx * 3 + 1] = y;
            out[idx * 3 + 2] = z;
        });
}

void decompress_coords(const CompressedBlock& block, std::size_t natoms, std::size_t limit, float* out) {
    if (!(block.precision > 0.0f)) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "precision " + std::to_string(block.precision) + " is not positive");
    }
    const float inv_precision = inverse_precision(block.precision);
    decode_block_checked(block, natoms, limit,
        [out, inv_precision](std::size_t idx, std::int32_t x, std::int32_t y, std::int32_t z) {
            out[idx * 3 + 0] = static_cast<float>(x) * inv_precision;
            out[idx * 3 + 1] = static_cast<float>(y) * inv_precision;
            out[idx * 3 + 2] = static_cast<float>(z) * inv_precision;
        });
}

} // namespace molly
