// Number.cpp – Fixed-width integer / real codec.

#include "BitPacket/Number.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <bit>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace bitpacket {

static bool validWidth(const NumericFormat& f) {
    if (f.kind == NumberKind::Float) return f.width == 4 || f.width == 8;
    return f.width == 1 || f.width == 2 || f.width == 4 || f.width == 8;
}

Number::Number(std::string name, NumericFormat format, const Value& value)
    : Field(std::move(name)), format_(format), raw_(format.width, 0) {
    if (!validWidth(format_))
        throw std::invalid_argument("Number '" + this->name() + "': unsupported width " +
                                    std::to_string(format_.width));
    store(value);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Raw bytes ↔ integer image
// ─────────────────────────────────────────────────────────────────────────────

uint64_t Number::bits() const noexcept {
    const size_t w = format_.width;
    uint64_t out = 0;
    for (size_t i = 0; i < w; ++i) {
        const size_t idx = (format_.order == ByteOrder::BigEndian) ? i : w - 1 - i;
        out = (out << 8) | raw_[idx];
    }
    return out;
}

void Number::storeBits(uint64_t bits) noexcept {
    const size_t w = format_.width;
    for (size_t i = 0; i < w; ++i) {
        const uint8_t b   = static_cast<uint8_t>(bits >> (8 * (w - 1 - i)));
        const size_t  idx = (format_.order == ByteOrder::BigEndian) ? i : w - 1 - i;
        raw_[idx] = b;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Value access
// ─────────────────────────────────────────────────────────────────────────────

Value Number::value() const {
    const uint64_t raw    = bits();
    const size_t   nbits  = static_cast<size_t>(format_.width) * 8;

    switch (format_.kind) {
    case NumberKind::Unsigned:
        return raw;

    case NumberKind::Signed:
        // Sign-extend if the MSB of the field is 1
        if (nbits < 64 && ((raw >> (nbits - 1)) & 1u))
            return static_cast<int64_t>(raw | (~uint64_t{0} << nbits));
        return static_cast<int64_t>(raw);

    case NumberKind::Float:
        if (format_.width == 4)
            return static_cast<double>(std::bit_cast<float>(static_cast<uint32_t>(raw)));
        return std::bit_cast<double>(raw);
    }
    throw std::logic_error("Number: unknown kind");
}

void Number::setValue(const Value& v) {
    store(v);
}

void Number::store(const Value& v) {
    const size_t nbits = static_cast<size_t>(format_.width) * 8;

    switch (format_.kind) {
    case NumberKind::Unsigned: {
        const uint64_t u = toUnsigned(v);
        if (nbits < 64 && u > (uint64_t{1} << nbits) - 1u)
            throw SizeExceeded("Value " + std::to_string(u) + " does not fit " +
                               std::to_string(nbits) + "-bit field '" + name() + "'");
        storeBits(u);
        break;
    }

    case NumberKind::Signed: {
        const int64_t s = toSigned(v);
        if (nbits < 64) {
            const int64_t lo = -(int64_t{1} << (nbits - 1));
            const int64_t hi =  (int64_t{1} << (nbits - 1)) - 1;
            if (s < lo || s > hi)
                throw SizeExceeded("Value " + std::to_string(s) + " does not fit signed " +
                                   std::to_string(nbits) + "-bit field '" + name() + "'");
        }
        storeBits(static_cast<uint64_t>(s));
        break;
    }

    case NumberKind::Float: {
        const double d = toDouble(v);
        if (format_.width == 4) {
            if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max())
                throw SizeExceeded("Value does not fit binary32 field '" + name() + "'");
            storeBits(std::bit_cast<uint32_t>(static_cast<float>(d)));
        } else {
            storeBits(std::bit_cast<uint64_t>(d));
        }
        break;
    }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Presentation / wire
// ─────────────────────────────────────────────────────────────────────────────

std::string Number::strValue() const {
    return toString(value());
}

std::string Number::strHexValue() const {
    return hexString(raw_);
}

void Number::encode(ByteWriter& out, const Field& /*context*/) const {
    out.write(raw_);
}

void Number::decode(ByteReader& in, const Field& /*context*/) {
    auto src = in.read(raw_.size());
    raw_.assign(src.begin(), src.end());
}

bool Number::isSameType(const Field& other) const {
    return Field::isSameType(other) &&
           static_cast<const Number&>(other).format_ == format_;
}

} // namespace bitpacket
