#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace molly {

/**
 * @brief Sequential reader over a big-endian byte span.
 *
 * Whole values (read_u32be / read_i32be / read_f32be) and bit fields
 * (read_bits, MSB-first within each byte) share one cursor.
 * Running past the end of the span throws XtcError(TruncatedInput).
 */
class BitReader {
public:
    BitReader(const std::uint8_t* data, std::size_t size)
        : data_(data), size_bits_(size * 8) {}

    /**
     * @brief Read the next `n` bits (1 <= n <= 32) as an unsigned value.
     */
    std::uint32_t read_bits(unsigned n) {
        if (n == 0 || n > 32) {
            throw_bad_width(n);
        }
        if (n > remaining_bits()) {
            throw_truncated(n);
        }
        std::uint64_t value = 0;
        unsigned remaining = n;
        while (remaining > 0) {
            std::size_t byte_idx = bit_pos_ >> 3;
            unsigned bit_idx = static_cast<unsigned>(bit_pos_ & 7);
            unsigned bits_in_byte = 8 - bit_idx;
            unsigned take = remaining < bits_in_byte ? remaining : bits_in_byte;
            unsigned shift = bits_in_byte - take;
            std::uint32_t extracted = (static_cast<std::uint32_t>(data_[byte_idx]) >> shift) & ((1u << take) - 1u);
            value = (value << take) | extracted;
            bit_pos_ += take;
            remaining -= take;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t read_u32be() {
        if (bit_pos_ & 7) {
            return read_bits(32);
        }
        if (remaining_bits() < 32) {
            throw_truncated(32);
        }
        const std::uint8_t* p = data_ + (bit_pos_ >> 3);
        bit_pos_ += 32;
        return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
               (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
    }

    std::int32_t read_i32be() {
        return static_cast<std::int32_t>(read_u32be());
    }

    float read_f32be() {
        std::uint32_t raw = read_u32be();
        float value;
        std::memcpy(&value, &raw, sizeof(value));
        return value;
    }

    /** @brief Advance by `n` whole bytes. The cursor must be byte aligned. */
    void skip_bytes(std::size_t n);

    /** @brief Byte span starting at the (aligned) cursor; advances past it. */
    const std::uint8_t* take_bytes(std::size_t n);

    std::size_t bit_position() const { return bit_pos_; }
    std::size_t byte_position() const { return (bit_pos_ + 7) >> 3; }
    std::size_t remaining_bits() const { return size_bits_ - bit_pos_; }

private:
    [[noreturn]] void throw_truncated(std::size_t wanted_bits) const;
    [[noreturn]] void throw_bad_width(unsigned n) const;

    const std::uint8_t* data_;
    std::size_t size_bits_;
    std::size_t bit_pos_ = 0;
};

} // namespace molly
