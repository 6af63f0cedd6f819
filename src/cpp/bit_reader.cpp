#include "bit_reader.hpp"
#include "error.hpp"

#include <string>

namespace molly {

void BitReader::skip_bytes(std::size_t n) {
    take_bytes(n);
}

const std::uint8_t* BitReader::take_bytes(std::size_t n) {
    if (bit_pos_ & 7) {
        throw XtcError(ErrorKind::CorruptFrame,
                       "byte access at unaligned bit position " + std::to_string(bit_pos_));
    }
    if (n > remaining_bits() / 8) {
        throw_truncated(n * 8);
    }
    const std::uint8_t* p = data_ + (bit_pos_ >> 3);
    bit_pos_ += n * 8;
    return p;
}

void BitReader::throw_truncated(std::size_t wanted_bits) const {
    throw XtcError(ErrorKind::TruncatedInput,
                   "wanted " + std::to_string(wanted_bits) + " bits at bit " +
                   std::to_string(bit_pos_) + ", only " +
                   std::to_string(remaining_bits()) + " remain");
}

void BitReader::throw_bad_width(unsigned n) const {
    throw XtcError(ErrorKind::CorruptFrame,
                   "bit field width " + std::to_string(n) + " outside 1..32");
}

} // namespace molly
