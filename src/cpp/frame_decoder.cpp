#include "frame_decoder.hpp"
#include "bit_reader.hpp"
#include "error.hpp"

#include <string>

namespace molly {

static std::size_t padded4(std::size_t n) {
    return (n + 3) & ~static_cast<std::size_t>(3);
}

static void check_magic(std::int32_t magic) {
    if (magic != kXtcMagic) {
        throw XtcError(ErrorKind::BadMagic,
                       "expected magic " + std::to_string(kXtcMagic) + ", found " + std::to_string(magic));
    }
}

static std::size_t checked_natoms(std::int32_t natoms) {
    if (natoms < 0) {
        throw XtcError(ErrorKind::CorruptFrame, "negative atom count " + std::to_string(natoms));
    }
    return static_cast<std::size_t>(natoms);
}

/*
 * Reads every header field up to and including the second atom count,
 * leaving `reader` at the start of the coordinate data.
 */
static FrameHeader parse_header(BitReader& reader) {
    FrameHeader header;
    check_magic(reader.read_i32be());
    header.n_atoms = checked_natoms(reader.read_i32be());
    header.step = reader.read_i32be();
    header.time = reader.read_f32be();
    for (auto& row : header.box) {
        for (auto& v : row) {
            v = reader.read_f32be();
        }
    }
    std::size_t coord_natoms = checked_natoms(reader.read_i32be());
    if (coord_natoms != header.n_atoms) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "header declares " + std::to_string(header.n_atoms) +
                       " atoms but coordinate block holds " + std::to_string(coord_natoms));
    }
    return header;
}

static CompressedBlock parse_block(BitReader& reader) {
    CompressedBlock block;
    block.precision = reader.read_f32be();
    for (auto& v : block.minint) v = reader.read_i32be();
    for (auto& v : block.maxint) v = reader.read_i32be();
    block.smallidx = reader.read_i32be();
    std::int32_t n_bytes = reader.read_i32be();
    if (n_bytes < 0) {
        throw XtcError(ErrorKind::CorruptFrame, "negative compressed byte count " + std::to_string(n_bytes));
    }
    block.n_bytes = static_cast<std::size_t>(n_bytes);
    block.bytes = reader.take_bytes(padded4(block.n_bytes));
    return block;
}

FrameHeader read_header(const std::uint8_t* data, std::size_t size) {
    BitReader reader(data, size);
    return parse_header(reader);
}

std::uint32_t record_length(const std::uint8_t* data, std::size_t size) {
    BitReader reader(data, size);
    FrameHeader header = parse_header(reader);

    std::size_t length;
    if (header.n_atoms <= kMaxUncompressedAtoms) {
        length = kFrameHeaderBytes + header.n_atoms * 3 * sizeof(float);
    } else {
        // jump straight to the byte count
        reader.skip_bytes(kCompressedHeaderBytes - 4 - kFrameHeaderBytes);
        std::int32_t n_bytes = reader.read_i32be();
        if (n_bytes < 0) {
            throw XtcError(ErrorKind::CorruptFrame, "negative compressed byte count " + std::to_string(n_bytes));
        }
        // every compressed atom costs at least one bit
        if (header.n_atoms > static_cast<std::size_t>(n_bytes) * 8) {
            throw XtcError(ErrorKind::CorruptFrame,
                           std::to_string(header.n_atoms) + " atoms cannot fit in " +
                           std::to_string(n_bytes) + " compressed bytes");
        }
        length = kCompressedHeaderBytes + padded4(static_cast<std::size_t>(n_bytes));
    }
    if (length > size) {
        throw XtcError(ErrorKind::TruncatedInput,
                       "record of " + std::to_string(length) + " bytes, only " +
                       std::to_string(size) + " available");
    }
    return static_cast<std::uint32_t>(length);
}

FrameHeader decode_positions(const std::uint8_t* data, std::size_t size, std::size_t limit,
                             float* out, float* precision_out) {
    BitReader reader(data, size);
    FrameHeader header = parse_header(reader);
    if (limit > header.n_atoms) limit = header.n_atoms;

    if (header.n_atoms == 0) {
        if (precision_out) *precision_out = 0.0f;
        return header;
    }

    if (header.n_atoms <= kMaxUncompressedAtoms) {
        // raw floats, no precision
        for (std::size_t i = 0; i < header.n_atoms * 3; ++i) {
            float v = reader.read_f32be();
            if (i < limit * 3) out[i] = v;
        }
        if (precision_out) *precision_out = 0.0f;
        return header;
    }

    CompressedBlock block = parse_block(reader);
    decompress_coords(block, header.n_atoms, limit, out);
    if (precision_out) *precision_out = block.precision;
    return header;
}

Frame decode_frame(const std::uint8_t* data, std::size_t size) {
    Frame frame;
    // bounds the record before anything is sized from its atom count
    const std::size_t length = record_length(data, size);
    FrameHeader header = read_header(data, length);
    frame.positions.resize(header.n_atoms * 3);
    decode_positions(data, length, header.n_atoms, frame.positions.data(), &frame.precision);
    frame.box = header.box;
    frame.step = header.step;
    frame.time = header.time;
    frame.n_atoms = header.n_atoms;
    return frame;
}

} // namespace molly
