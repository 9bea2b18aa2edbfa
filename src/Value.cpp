// Value.cpp – Value conversions and text helpers.

#include "BitPacket/Value.hpp"
#include "BitPacket/Error.hpp"

#include <fmt/format.h>

#include <limits>
#include <string>

namespace bitpacket {

// ─────────────────────────────────────────────────────────────────────────────
//  Conversions
// ─────────────────────────────────────────────────────────────────────────────

uint64_t toUnsigned(const Value& v) {
    if (const auto* u = std::get_if<uint64_t>(&v)) return *u;
    if (const auto* s = std::get_if<int64_t>(&v)) {
        if (*s < 0)
            throw SizeExceeded("Negative value " + std::to_string(*s) +
                               " does not fit an unsigned field");
        return static_cast<uint64_t>(*s);
    }
    throw TypeError("Expected an integer value");
}

int64_t toSigned(const Value& v) {
    if (const auto* s = std::get_if<int64_t>(&v)) return *s;
    if (const auto* u = std::get_if<uint64_t>(&v)) {
        if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw SizeExceeded("Value " + std::to_string(*u) +
                               " does not fit a signed 64-bit integer");
        return static_cast<int64_t>(*u);
    }
    throw TypeError("Expected an integer value");
}

double toDouble(const Value& v) {
    if (const auto* d = std::get_if<double>(&v))   return *d;
    if (const auto* u = std::get_if<uint64_t>(&v)) return static_cast<double>(*u);
    if (const auto* s = std::get_if<int64_t>(&v))  return static_cast<double>(*s);
    throw TypeError("Expected a numeric value, got a byte run");
}

const Bytes& toBytes(const Value& v) {
    if (const auto* b = std::get_if<Bytes>(&v)) return *b;
    throw TypeError("Expected a byte run, got a number");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Text
// ─────────────────────────────────────────────────────────────────────────────

std::string toString(const Value& v) {
    if (const auto* u = std::get_if<uint64_t>(&v)) return std::to_string(*u);
    if (const auto* s = std::get_if<int64_t>(&v))  return std::to_string(*s);
    if (const auto* d = std::get_if<double>(&v))   return fmt::format("{}", *d);
    return hexString(std::get<Bytes>(v));
}

std::string hexString(uint64_t value, size_t byte_width) {
    return fmt::format("0x{:0{}X}", value, byte_width * 2);
}

std::string hexString(std::span<const uint8_t> bytes) {
    if (bytes.empty()) return {};
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (uint8_t b : bytes) out += fmt::format("{:02X}", b);
    return out;
}

} // namespace bitpacket
