#pragma once
// Structure.hpp – Byte-oriented sequence of fields.
//
// Children are encoded and decoded in declaration order.  Bit fields cannot
// be appended directly; wrap them in a BitStructure first.

#include "BitPacket/Container.hpp"

namespace bitpacket {

class Structure : public Container {
public:
    explicit Structure(std::string name);

    // Throws UnsupportedNesting for fields that are not byte aligned.
    void append(std::unique_ptr<Field> field) override;

    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;
};

// ─────────────────────────────────────────────────────────────────────────────
// BitStructure – Sequence of bit-addressable fields packed MSB-first.
//
// From the outside a BitStructure occupies a whole number of bytes; the
// last byte is zero padded on encode.  On decode the padding bits are
// checked only under PaddingPolicy::RequireZero.  BitStructures nest.
// ─────────────────────────────────────────────────────────────────────────────

class BitStructure : public Container {
public:
    explicit BitStructure(std::string name);

    // Throws UnsupportedNesting for fields that cannot be bit packed.
    void append(std::unique_ptr<Field> field) override;

    // Whole bytes: ceil(bitSize() / 8).
    [[nodiscard]] size_t size()    const override { return (bitSize() + 7) / 8; }
    [[nodiscard]] size_t bitSize() const override;

    [[nodiscard]] bool bitAddressable() const noexcept override { return true; }

    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

    void encodeBits(BitStreamWriter& out, const Field& context) const override;
    void decodeBits(BitStreamReader& in, const Field& context) override;
};

} // namespace bitpacket
