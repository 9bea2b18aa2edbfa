// String.cpp – Byte runs sized by a length resolver.

#include "BitPacket/String.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <spdlog/spdlog.h>

namespace bitpacket {

String::String(std::string name, Bytes data)
    : Field(std::move(name)), length_(data.size()), data_(std::move(data)) {}

String::String(std::string name, LengthResolver length, Bytes data)
    : Field(std::move(name)), length_(std::move(length)), data_(std::move(data)) {}

void String::setValue(const Value& v) {
    const Bytes& data = toBytes(v);
    const size_t expected = length_(root());
    if (data.size() != expected)
        throw LengthMismatch("String '" + name() + "' expects " + std::to_string(expected) +
                             " byte(s), got " + std::to_string(data.size()));
    data_ = data;
}

void String::encode(ByteWriter& out, const Field& context) const {
    const size_t expected = length_(context);
    if (data_.size() != expected)
        throw LengthMismatch("String '" + name() + "' holds " + std::to_string(data_.size()) +
                             " byte(s) but its length resolves to " + std::to_string(expected));
    out.write(data_);
}

void String::decode(ByteReader& in, const Field& context) {
    const size_t n = length_(context);
    spdlog::trace("String '{}': reading {} byte(s) at offset {}", name(), n, in.position());
    auto src = in.read(n);
    data_.assign(src.begin(), src.end());
}

} // namespace bitpacket
