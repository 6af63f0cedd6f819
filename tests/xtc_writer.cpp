#include "xtc_writer.hpp"
#include "codec.hpp"
#include "frame_decoder.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>

namespace molly {
namespace fixture {

using codec::kFirstIdx;
using codec::kLastIdx;
using codec::kMagicInts;

// ----------------------------------------------------------------------------
// Bit and byte sinks
// ----------------------------------------------------------------------------

void BitWriter::write(unsigned num_of_bits, std::uint32_t value) {
    for (unsigned b = num_of_bits; b > 0; --b) {
        if ((bit_pos_ & 7) == 0) {
            bytes_.push_back(0);
        }
        std::uint32_t bit = (value >> (b - 1)) & 1u;
        bytes_.back() |= static_cast<std::uint8_t>(bit << (7 - (bit_pos_ & 7)));
        ++bit_pos_;
    }
}

static void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

static void put_i32(std::vector<std::uint8_t>& out, std::int32_t v) {
    put_u32(out, static_cast<std::uint32_t>(v));
}

static void put_f32(std::vector<std::uint8_t>& out, float v) {
    std::uint32_t raw;
    std::memcpy(&raw, &v, sizeof(raw));
    put_u32(out, raw);
}

void put_i32be(std::vector<std::uint8_t>& bytes, std::size_t offset, std::int32_t value) {
    std::uint32_t v = static_cast<std::uint32_t>(value);
    bytes.at(offset + 0) = static_cast<std::uint8_t>(v >> 24);
    bytes.at(offset + 1) = static_cast<std::uint8_t>(v >> 16);
    bytes.at(offset + 2) = static_cast<std::uint8_t>(v >> 8);
    bytes.at(offset + 3) = static_cast<std::uint8_t>(v);
}

// ----------------------------------------------------------------------------
// Compression
// ----------------------------------------------------------------------------

// Mixed-radix packing of three integers; inverse of codec::decode_ints.
static void encode_ints(BitWriter& writer, unsigned num_of_bits, const unsigned sizes[3], const unsigned nums[3]) {
    unsigned bytes[32];
    unsigned num_of_bytes = 0;
    unsigned tmp = nums[0];
    do {
        bytes[num_of_bytes++] = tmp & 0xff;
        tmp >>= 8;
    } while (tmp != 0);

    for (int i = 1; i < 3; ++i) {
        if (nums[i] >= sizes[i]) {
            throw std::logic_error("encode_ints: value does not fit its size");
        }
        tmp = nums[i];
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

    if (num_of_bits >= num_of_bytes * 8) {
        for (unsigned i = 0; i < num_of_bytes; ++i) {
            writer.write(8, bytes[i]);
        }
        writer.write(num_of_bits - num_of_bytes * 8, 0);
    } else {
        unsigned i;
        for (i = 0; i < num_of_bytes - 1; ++i) {
            writer.write(8, bytes[i]);
        }
        writer.write(num_of_bits - (num_of_bytes - 1) * 8, bytes[i]);
    }
}

std::int32_t quantize(float x, float precision) {
    float lf = x >= 0.0f ? x * precision + 0.5f : x * precision - 0.5f;
    return static_cast<std::int32_t>(lf);
}

float expected_coordinate(float x, float precision) {
    return static_cast<float>(quantize(x, precision)) * inverse_precision(precision);
}

std::vector<float> expected_positions(const FrameSpec& frame) {
    if (frame.n_atoms() <= kMaxUncompressedAtoms) {
        return frame.positions;
    }
    std::vector<float> out(frame.positions.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = expected_coordinate(frame.positions[i], frame.precision);
    }
    return out;
}

EncodedBlock compress_coords(const std::vector<float>& positions, float precision) {
    const int size = static_cast<int>(positions.size() / 3);
    EncodedBlock block;

    // 1. quantize, find bounds and the smallest step between neighbours
    std::vector<std::int32_t> q(positions.size());
    for (int k = 0; k < 3; ++k) {
        block.minint[k] = INT_MAX;
        block.maxint[k] = INT_MIN;
    }
    int mindiff = INT_MAX;
    int old[3] = {0, 0, 0};
    for (int i = 0; i < size; ++i) {
        int diff = 0;
        for (int k = 0; k < 3; ++k) {
            std::int32_t v = quantize(positions[i * 3 + k], precision);
            q[i * 3 + k] = v;
            block.minint[k] = std::min(block.minint[k], v);
            block.maxint[k] = std::max(block.maxint[k], v);
            diff += std::abs(old[k] - v);
            old[k] = v;
        }
        if (diff < mindiff && i > 0) mindiff = diff;
    }

    unsigned sizeint[3];
    unsigned bitsizeint[3] = {0, 0, 0};
    for (int k = 0; k < 3; ++k) {
        sizeint[k] = static_cast<unsigned>(block.maxint[k] - block.minint[k] + 1);
    }
    unsigned bitsize = 0;
    if ((sizeint[0] | sizeint[1] | sizeint[2]) > 0xffffff) {
        for (int k = 0; k < 3; ++k) bitsizeint[k] = codec::size_of_int(sizeint[k]);
    } else {
        bitsize = codec::size_of_ints(sizeint);
    }

    // 2. initial size class; kept inside the table
    int smallidx = kFirstIdx;
    while (smallidx < kLastIdx - 1 && kMagicInts[smallidx] < mindiff) {
        smallidx++;
    }
    block.smallidx = smallidx;

    int maxidx = std::min(kLastIdx - 1, smallidx + 8);
    int minidx = maxidx - 8;
    int smaller = kMagicInts[std::max(kFirstIdx, smallidx - 1)] / 2;
    int smallnum = kMagicInts[smallidx] / 2;
    unsigned sizesmall[3];
    sizesmall[0] = sizesmall[1] = sizesmall[2] = static_cast<unsigned>(kMagicInts[smallidx]);
    int larger = kMagicInts[maxidx] / 2;

    // 3. encode atoms, grouping close successors into runs
    BitWriter writer;
    int prevcoord[3] = {0, 0, 0};
    unsigned tmpcoord[30];
    int prevrun = -1;
    int i = 0;
    while (i < size) {
        int is_small = 0;
        int is_smaller;
        std::int32_t* thiscoord = q.data() + i * 3;
        if (smallidx < maxidx && i >= 1 &&
            std::abs(thiscoord[0] - prevcoord[0]) < larger &&
            std::abs(thiscoord[1] - prevcoord[1]) < larger &&
            std::abs(thiscoord[2] - prevcoord[2]) < larger) {
            is_smaller = 1;
        } else if (smallidx > minidx) {
            is_smaller = -1;
        } else {
            is_smaller = 0;
        }
        if (i + 1 < size) {
            if (std::abs(thiscoord[0] - thiscoord[3]) < smallnum &&
                std::abs(thiscoord[1] - thiscoord[4]) < smallnum &&
                std::abs(thiscoord[2] - thiscoord[5]) < smallnum) {
                // interchange first with second atom
                std::swap(thiscoord[0], thiscoord[3]);
                std::swap(thiscoord[1], thiscoord[4]);
                std::swap(thiscoord[2], thiscoord[5]);
                is_small = 1;
            }
        }
        for (int k = 0; k < 3; ++k) {
            tmpcoord[k] = static_cast<unsigned>(thiscoord[k] - block.minint[k]);
        }
        if (bitsize == 0) {
            for (int k = 0; k < 3; ++k) writer.write(bitsizeint[k], tmpcoord[k]);
        } else {
            encode_ints(writer, bitsize, sizeint, tmpcoord);
        }
        for (int k = 0; k < 3; ++k) prevcoord[k] = thiscoord[k];
        thiscoord += 3;
        i++;

        int run = 0;
        if (is_small == 0 && is_smaller == -1) is_smaller = 0;
        while (is_small && run < 8 * 3) {
            int tmpsum = 0;
            for (int k = 0; k < 3; ++k) {
                int d = thiscoord[k] - prevcoord[k];
                tmpsum += d * d;
            }
            if (is_smaller == -1 && tmpsum >= smaller * smaller) {
                is_smaller = 0;
            }
            for (int k = 0; k < 3; ++k) {
                tmpcoord[run++] = static_cast<unsigned>(thiscoord[k] - prevcoord[k] + smallnum);
                prevcoord[k] = thiscoord[k];
            }
            i++;
            thiscoord += 3;
            is_small = 0;
            if (i < size &&
                std::abs(thiscoord[0] - prevcoord[0]) < smallnum &&
                std::abs(thiscoord[1] - prevcoord[1]) < smallnum &&
                std::abs(thiscoord[2] - prevcoord[2]) < smallnum) {
                is_small = 1;
            }
        }
        if (run != prevrun || is_smaller != 0) {
            prevrun = run;
            writer.write(1, 1);
            writer.write(5, static_cast<std::uint32_t>(run + is_smaller + 1));
        } else {
            writer.write(1, 0);
        }
        for (int k = 0; k < run; k += 3) {
            encode_ints(writer, static_cast<unsigned>(smallidx), sizesmall, &tmpcoord[k]);
        }
        if (is_smaller != 0) {
            smallidx += is_smaller;
            if (is_smaller < 0) {
                smallnum = smaller;
                smaller = kMagicInts[smallidx - 1] / 2;
            } else {
                smaller = smallnum;
                smallnum = kMagicInts[smallidx] / 2;
            }
            sizesmall[0] = sizesmall[1] = sizesmall[2] = static_cast<unsigned>(kMagicInts[smallidx]);
        }
    }

    block.bytes = writer.bytes();
    return block;
}

// ----------------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------------

std::vector<std::uint8_t> encode_frame(const FrameSpec& frame) {
    std::vector<std::uint8_t> out;
    const std::int32_t natoms = static_cast<std::int32_t>(frame.n_atoms());
    put_i32(out, kXtcMagic);
    put_i32(out, natoms);
    put_i32(out, frame.step);
    put_f32(out, frame.time);
    for (const auto& row : frame.box) {
        for (float v : row) put_f32(out, v);
    }
    put_i32(out, natoms);

    if (frame.n_atoms() <= kMaxUncompressedAtoms) {
        for (float v : frame.positions) put_f32(out, v);
        return out;
    }

    EncodedBlock block = compress_coords(frame.positions, frame.precision);
    put_f32(out, frame.precision);
    for (std::int32_t v : block.minint) put_i32(out, v);
    for (std::int32_t v : block.maxint) put_i32(out, v);
    put_i32(out, block.smallidx);
    put_i32(out, static_cast<std::int32_t>(block.bytes.size()));
    out.insert(out.end(), block.bytes.begin(), block.bytes.end());
    while (out.size() % 4 != 0) out.push_back(0);
    return out;
}

std::vector<std::uint8_t> encode_trajectory(const std::vector<FrameSpec>& frames) {
    std::vector<std::uint8_t> out;
    for (const auto& frame : frames) {
        std::vector<std::uint8_t> record = encode_frame(frame);
        out.insert(out.end(), record.begin(), record.end());
    }
    return out;
}

FrameSpec make_frame(std::int32_t step, std::size_t n_atoms, std::uint32_t seed,
                     float precision, float box_length) {
    FrameSpec frame;
    frame.step = step;
    frame.time = 0.002f * static_cast<float>(step);
    frame.precision = precision;
    for (int k = 0; k < 3; ++k) {
        frame.box[k][k] = box_length;
    }

    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> in_box(0.0f, box_length);
    std::uniform_real_distribution<float> bond(-0.1f, 0.1f);
    frame.positions.resize(n_atoms * 3);
    for (std::size_t i = 0; i < n_atoms; ++i) {
        const bool hydrogen = i % 3 != 0;
        for (int k = 0; k < 3; ++k) {
            frame.positions[i * 3 + k] = hydrogen
                ? frame.positions[(i - i % 3) * 3 + k] + bond(gen)
                : in_box(gen);
        }
    }
    return frame;
}

std::vector<FrameSpec> make_trajectory(std::size_t n_frames, std::size_t n_atoms, float precision) {
    std::vector<FrameSpec> frames;
    frames.reserve(n_frames);
    for (std::size_t f = 0; f < n_frames; ++f) {
        frames.push_back(make_frame(static_cast<std::int32_t>(f * 10), n_atoms,
                                    static_cast<std::uint32_t>(1000 + f), precision));
    }
    return frames;
}

// ----------------------------------------------------------------------------
// Files
// ----------------------------------------------------------------------------

void write_file(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Failed to write test file: " + path);
    }
}

void append_file(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Failed to append to test file: " + path);
    }
}

std::string temp_path(const std::string& name) {
    std::string prefix = "molly";
    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        prefix += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    std::string path = ::testing::TempDir() + prefix + "_" + name;
    std::remove(path.c_str());
    return path;
}

} // namespace fixture
} // namespace molly
