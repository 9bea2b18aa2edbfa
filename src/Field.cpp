// Field.cpp – Behaviour common to every field: navigation, calibration,
// whole-buffer encode/decode and the defaults for leaves.

#include "BitPacket/Field.hpp"
#include "BitPacket/BitStream.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <string>
#include <typeinfo>

namespace bitpacket {

std::pair<std::string_view, std::string_view> splitPath(std::string_view path) noexcept {
    const size_t dot = path.find(PathSeparator);
    if (dot == std::string_view::npos) return {path, {}};
    return {path.substr(0, dot), path.substr(dot + 1)};
}

Field::Field(std::string name) : name_(std::move(name)) {}

const Field& Field::root() const noexcept {
    const Field* f = this;
    while (f->parent_) f = f->parent_;
    return *f;
}

Field& Field::root() noexcept {
    Field* f = this;
    while (f->parent_) f = f->parent_;
    return *f;
}

Value Field::engValue() const {
    return calibration_ ? calibration_(value()) : value();
}

std::string Field::strEngValue() const {
    return toString(engValue());
}

// ─── Leaf defaults ────────────────────────────────────────────────────────────

const Field& Field::lookup(std::string_view path) const {
    throw NotAContainer("Field '" + name_ + "' is not a container (looking up '" +
                        std::string(path) + "')");
}

Field& Field::lookup(std::string_view path) {
    throw NotAContainer("Field '" + name_ + "' is not a container (looking up '" +
                        std::string(path) + "')");
}

void Field::set(std::string_view path, const Value& /*v*/) {
    throw NotAContainer("Field '" + name_ + "' is not a container (assigning '" +
                        std::string(path) + "')");
}

void Field::encodeBits(BitStreamWriter& /*out*/, const Field& /*context*/) const {
    throw UnsupportedNesting("Field '" + name_ +
                             "' is byte oriented and cannot be packed into a BitStructure");
}

void Field::decodeBits(BitStreamReader& /*in*/, const Field& /*context*/) {
    throw UnsupportedNesting("Field '" + name_ +
                             "' is byte oriented and cannot be unpacked from a BitStructure");
}

bool Field::isSameType(const Field& other) const {
    return typeid(*this) == typeid(other);
}

// ─── Whole-buffer helpers ─────────────────────────────────────────────────────

Bytes Field::bytes() const {
    ByteWriter out;
    encode(out, root());
    return out.take();
}

void Field::setBytes(std::span<const uint8_t> buf, const DecodeOptions& options) {
    ByteReader in{buf, options};
    decode(in, root());
    if (options.reject_trailing_bytes && !in.atEnd())
        throw StreamLengthMismatch("Field '" + name_ + "' consumed " +
                                   std::to_string(in.position()) + " of " +
                                   std::to_string(buf.size()) + " byte(s)");
}

} // namespace bitpacket
