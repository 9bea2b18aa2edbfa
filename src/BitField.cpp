// BitField.cpp – Sub-byte unsigned fields and their 1-bit variants.

#include "BitPacket/BitField.hpp"
#include "BitPacket/BitStream.hpp"
#include "BitPacket/Error.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace bitpacket {

// Bytes needed to show 'bits' bits in hex.
static size_t byteEnd(size_t bits) {
    return (bits + 7) / 8;
}

// Pick a label for a 0/1 value, falling back to the plain text for anything
// a calibration curve turned into something else.
static std::string label(const Value& v, const std::array<const char*, 2>& names) {
    if (const auto* u = std::get_if<uint64_t>(&v); u && *u < names.size())
        return names[*u];
    return toString(v);
}

// ─────────────────────────────────────────────────────────────────────────────
//  BitField
// ─────────────────────────────────────────────────────────────────────────────

BitField::BitField(std::string name, size_t bits, uint64_t value)
    : Field(std::move(name)), bits_(bits) {
    if (bits_ == 0 || bits_ > 64)
        throw std::invalid_argument("BitField '" + this->name() +
                                    "': bit count must be 1–64");
    store(value);
}

void BitField::setValue(const Value& v) {
    store(toUnsigned(v));
}

void BitField::store(uint64_t v) {
    if (bits_ < 64 && v > (uint64_t{1} << bits_) - 1u)
        throw SizeExceeded("Value " + std::to_string(v) + " is bigger than the " +
                           std::to_string(bits_) + "-bit field '" + name() + "'");
    value_ = v;
}

std::string BitField::strValue() const {
    return hexString(value_, byteEnd(bits_));
}

std::string BitField::strHexValue() const {
    return hexString(value_, byteEnd(bits_));
}

std::string BitField::strEngValue() const {
    const Value eng = engValue();
    if (const auto* u = std::get_if<uint64_t>(&eng))
        return hexString(*u, byteEnd(bits_));
    return toString(eng);
}

void BitField::encode(ByteWriter& /*out*/, const Field& /*context*/) const {
    throw UnsupportedNesting("Bit field '" + name() +
                             "' must be enclosed in a BitStructure");
}

void BitField::decode(ByteReader& /*in*/, const Field& /*context*/) {
    throw UnsupportedNesting("Bit field '" + name() +
                             "' must be enclosed in a BitStructure");
}

void BitField::encodeBits(BitStreamWriter& out, const Field& /*context*/) const {
    out.writeU(value_, bits_);
}

void BitField::decodeBits(BitStreamReader& in, const Field& /*context*/) {
    value_ = in.readU(bits_);
}

bool BitField::isSameType(const Field& other) const {
    return Field::isSameType(other) &&
           static_cast<const BitField&>(other).bits_ == bits_;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Boolean / Flag
// ─────────────────────────────────────────────────────────────────────────────

static constexpr std::array<const char*, 2> kBooleanNames{"False", "True"};
static constexpr std::array<const char*, 2> kFlagNames{"Inactive", "Active"};

Boolean::Boolean(std::string name, bool value)
    : BitField(std::move(name), 1, value ? 1u : 0u) {}

std::string Boolean::strValue() const    { return label(value(), kBooleanNames); }
std::string Boolean::strEngValue() const { return label(engValue(), kBooleanNames); }

Flag::Flag(std::string name, uint64_t value)
    : BitField(std::move(name), 1, value) {}

std::string Flag::strValue() const    { return label(value(), kFlagNames); }
std::string Flag::strEngValue() const { return label(engValue(), kFlagNames); }

} // namespace bitpacket
