// Structure.cpp – Sequential encode / decode of byte and bit structures.

#include "BitPacket/Structure.hpp"
#include "BitPacket/BitStream.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <spdlog/spdlog.h>

namespace bitpacket {

// ─────────────────────────────────────────────────────────────────────────────
//  Structure
// ─────────────────────────────────────────────────────────────────────────────

Structure::Structure(std::string name) : Container(std::move(name)) {}

void Structure::append(std::unique_ptr<Field> field) {
    if (field && !field->byteAligned())
        throw UnsupportedNesting("Field '" + field->name() + "' is not byte aligned and must be "
                                 "enclosed in a BitStructure to be added to '" + name() + "'");
    appendChild(std::move(field));
}

void Structure::encode(ByteWriter& out, const Field& context) const {
    for (const auto& child : children())
        child->encode(out, context);
}

void Structure::decode(ByteReader& in, const Field& context) {
    DecodeScope scope{*this};
    const auto& kids = children();
    for (size_t i = 0; i < kids.size(); ++i) {
        scope.reveal(i + 1);
        spdlog::trace("Structure '{}': decoding '{}' at offset {}", name(), kids[i]->name(),
                      in.position());
        kids[i]->decode(in, context);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  BitStructure
// ─────────────────────────────────────────────────────────────────────────────

BitStructure::BitStructure(std::string name) : Container(std::move(name)) {}

void BitStructure::append(std::unique_ptr<Field> field) {
    if (field && !field->bitAddressable())
        throw UnsupportedNesting("Field '" + field->name() +
                                 "' is byte oriented and cannot be added to BitStructure '" +
                                 name() + "'");
    appendChild(std::move(field));
}

size_t BitStructure::bitSize() const {
    size_t total = 0;
    for (const auto& child : children()) total += child->bitSize();
    return total;
}

void BitStructure::encode(ByteWriter& out, const Field& context) const {
    BitStreamWriter bits{out};
    encodeBits(bits, context);
    bits.flush();
}

void BitStructure::decode(ByteReader& in, const Field& context) {
    BitStreamReader bits{in};
    decodeBits(bits, context);
    bits.finish();
}

void BitStructure::encodeBits(BitStreamWriter& out, const Field& context) const {
    for (const auto& child : children())
        child->encodeBits(out, context);
}

void BitStructure::decodeBits(BitStreamReader& in, const Field& context) {
    DecodeScope scope{*this};
    const auto& kids = children();
    for (size_t i = 0; i < kids.size(); ++i) {
        scope.reveal(i + 1);
        spdlog::trace("BitStructure '{}': decoding '{}' at bit {}", name(), kids[i]->name(),
                      in.bitsRead());
        kids[i]->decodeBits(in, context);
    }
}

} // namespace bitpacket
