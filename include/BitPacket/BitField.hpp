#pragma once
// BitField.hpp – Unsigned fields narrower than (or not aligned to) a byte.
//
// Bit fields can only be encoded through a bit stream, so they must be
// enclosed in a BitStructure.  size() is reported in bits.
//
// Example – first byte of an IPv4 header:
//   BitStructure ip{"ip"};
//   ip.add<BitField>("version", 4, 4);
//   ip.add<BitField>("hlen",    4, 5);   // ip.bytes() → { 0x45 }

#include "BitPacket/Field.hpp"

#include <cstdint>
#include <string>

namespace bitpacket {

class BitField : public Field {
public:
    // Throws std::invalid_argument unless 1 ≤ bits ≤ 64,
    // SizeExceeded if value needs more than 'bits' bits.
    BitField(std::string name, size_t bits, uint64_t value = 0);

    [[nodiscard]] size_t size()    const override { return bits_; }
    [[nodiscard]] size_t bitSize() const override { return bits_; }

    [[nodiscard]] bool byteAligned()    const noexcept override { return false; }
    [[nodiscard]] bool bitAddressable() const noexcept override { return true; }

    [[nodiscard]] Value value() const override { return value_; }
    void setValue(const Value& v) override;

    [[nodiscard]] std::string strValue()    const override;
    [[nodiscard]] std::string strHexValue() const override;
    [[nodiscard]] std::string strEngValue() const override;

    // Always throw UnsupportedNesting: a bit field needs a bit stream.
    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

    void encodeBits(BitStreamWriter& out, const Field& context) const override;
    void decodeBits(BitStreamReader& in, const Field& context) override;

    [[nodiscard]] bool isSameType(const Field& other) const override;

private:
    void store(uint64_t v);

    size_t   bits_;
    uint64_t value_{0};
};

// ─── Single-bit specializations ───────────────────────────────────────────────

// Renders as "False" / "True".
class Boolean : public BitField {
public:
    explicit Boolean(std::string name, bool value = false);

    void enable()  { setValue(uint64_t{1}); }
    void disable() { setValue(uint64_t{0}); }
    [[nodiscard]] bool enabled() const { return toUnsigned(value()) != 0; }

    [[nodiscard]] std::string strValue()    const override;
    [[nodiscard]] std::string strEngValue() const override;
};

// Renders as "Inactive" / "Active".
class Flag : public BitField {
public:
    static constexpr uint64_t Inactive = 0;
    static constexpr uint64_t Active   = 1;

    explicit Flag(std::string name, uint64_t value = Inactive);

    void activate()   { setValue(Active); }
    void deactivate() { setValue(Inactive); }
    [[nodiscard]] bool active() const { return toUnsigned(value()) == Active; }

    [[nodiscard]] std::string strValue()    const override;
    [[nodiscard]] std::string strEngValue() const override;
};

} // namespace bitpacket
