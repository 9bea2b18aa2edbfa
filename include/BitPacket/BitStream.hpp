#pragma once
// BitStream.hpp – Big-endian (MSB-first) bit-level I/O layered on the byte
// cursors of Stream.hpp.
//
// Bit order rules:
//   • Within each byte, the MSB is the first bit on the wire.
//   • A field wider than the bits left in the current byte continues at the
//     MSB of the next byte.
//   • The underlying byte stream is only touched one whole byte at a time:
//     the reader pulls a byte when it needs its first bit, the writer pushes
//     a byte once all eight bits are set (or on flush, zero-padded).

#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace bitpacket {

// ─────────────────────────────────────────────────────────────────────────────
//  BitStreamReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads bits sequentially from a ByteReader.
//
// Example – reading the two nibbles of 0xAB:
//   readU(4) → 0xA   readU(4) → 0xB
class BitStreamReader {
public:
    explicit BitStreamReader(ByteReader& in) noexcept : in_(in) {}

    [[nodiscard]] size_t bitsRead()    const noexcept { return pos_; }
    [[nodiscard]] bool   byteAligned() const noexcept { return avail_ == 0; }

    // Read n bits as an unsigned 64-bit integer, MSB of the field first.
    // Throws StreamLengthMismatch if the byte stream runs out.
    [[nodiscard]] uint64_t readU(size_t n) {
        if (n == 0 || n > 64)
            throw std::invalid_argument("BitStreamReader: bit count must be 1–64");
        uint64_t result = 0;
        size_t   left   = n;
        while (left > 0) {
            if (avail_ == 0) {
                cur_   = in_.readByte();
                avail_ = 8;
            }
            const size_t  chunk = std::min(left, avail_);
            const size_t  shift = avail_ - chunk;
            const uint8_t bits  = static_cast<uint8_t>((cur_ >> shift) & ((1u << chunk) - 1u));

            result  = (result << chunk) | bits;
            avail_ -= chunk;
            pos_   += chunk;
            left   -= chunk;
        }
        return result;
    }

    [[nodiscard]] bool readBit() { return readU(1) != 0; }

    // Drop the unread low bits of the current byte.  Under
    // PaddingPolicy::RequireZero they must all be zero.
    void finish() {
        if (avail_ == 0) return;
        const uint8_t pad = static_cast<uint8_t>(cur_ & ((1u << avail_) - 1u));
        if (pad != 0 && in_.options().padding == PaddingPolicy::RequireZero)
            throw NonZeroPadding("BitStreamReader: " + std::to_string(avail_) +
                                 " padding bit(s) are not zero");
        pos_  += avail_;
        avail_ = 0;
    }

private:
    ByteReader& in_;
    uint8_t     cur_{0};
    size_t      avail_{0}; // unread bits left in cur_
    size_t      pos_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
//  BitStreamWriter
// ─────────────────────────────────────────────────────────────────────────────
// Packs bits MSB-first and hands complete bytes to a ByteWriter.
class BitStreamWriter {
public:
    explicit BitStreamWriter(ByteWriter& out) noexcept : out_(out) {}

    // Write n bits from value, MSB first.  Only the low n bits of value are used.
    void writeU(uint64_t value, size_t n) {
        if (n == 0 || n > 64)
            throw std::invalid_argument("BitStreamWriter: bit count must be 1–64");
        if (n < 64) value &= (uint64_t{1} << n) - 1u;

        size_t left = n;
        while (left > 0) {
            const size_t avail = 8 - used_;
            const size_t chunk = std::min(left, avail);

            // The top 'chunk' bits of the remaining 'left' bits of value
            const size_t  field_shift = left - chunk;
            const uint8_t bits = static_cast<uint8_t>(
                (value >> field_shift) & ((1u << chunk) - 1u));

            cur_  |= static_cast<uint8_t>(bits << (avail - chunk));
            used_ += chunk;
            pos_  += chunk;
            left  -= chunk;

            if (used_ == 8) {
                out_.writeByte(cur_);
                cur_  = 0;
                used_ = 0;
            }
        }
    }

    void writeBit(bool b) { writeU(b ? 1u : 0u, 1); }

    // Zero-pad to the next byte boundary and emit the partial byte, if any.
    void flush() {
        if (used_ == 0) return;
        out_.writeByte(cur_);
        pos_ += 8 - used_;
        cur_  = 0;
        used_ = 0;
    }

    [[nodiscard]] size_t bitsWritten() const noexcept { return pos_; }
    [[nodiscard]] bool   byteAligned() const noexcept { return used_ == 0; }

private:
    ByteWriter& out_;
    uint8_t     cur_{0};
    size_t      used_{0}; // bits already set in cur_
    size_t      pos_{0};
};

} // namespace bitpacket
