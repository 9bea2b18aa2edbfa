#pragma once
// Stream.hpp – Byte-granular cursors over the buffers a layout is decoded
// from and encoded into.
//
// Both cursors only move forward.  A read that asks for more bytes than
// remain throws StreamLengthMismatch and leaves the cursor untouched.

#include "BitPacket/Error.hpp"
#include "BitPacket/Options.hpp"
#include "BitPacket/Value.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace bitpacket {

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> buf, DecodeOptions options = {}) noexcept
        : buf_(buf), options_(options) {}

    [[nodiscard]] size_t position()  const noexcept { return pos_; }
    [[nodiscard]] size_t remaining() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool   atEnd()     const noexcept { return pos_ == buf_.size(); }

    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

    // Read exactly n bytes.
    [[nodiscard]] std::span<const uint8_t> read(size_t n) {
        if (n > remaining())
            throw StreamLengthMismatch("ByteReader: need " + std::to_string(n) +
                                       " byte(s) at offset " + std::to_string(pos_) +
                                       ", only " + std::to_string(remaining()) + " left");
        auto out = buf_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    [[nodiscard]] uint8_t readByte() { return read(1)[0]; }

private:
    std::span<const uint8_t> buf_;
    size_t                   pos_{0};
    DecodeOptions            options_;
};

// ─────────────────────────────────────────────────────────────────────────────
//  ByteWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends bytes to an internal buffer that grows as needed.
class ByteWriter {
public:
    ByteWriter() = default;

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void writeByte(uint8_t b) { buf_.push_back(b); }

    [[nodiscard]] const Bytes& buffer() const noexcept { return buf_; }
    [[nodiscard]] Bytes        take()         noexcept { return std::move(buf_); }
    [[nodiscard]] size_t       size()   const noexcept { return buf_.size(); }

private:
    Bytes buf_;
};

} // namespace bitpacket
