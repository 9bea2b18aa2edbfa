#pragma once
// Value.hpp – The value type carried by every field, plus conversions and
// the hex / text helpers used by the presentation hooks.

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace bitpacket {

using Bytes = std::vector<uint8_t>;

// A field value: unsigned integer, signed integer, floating point or a raw
// byte run.  Containers report their encoded bytes.
using Value = std::variant<uint64_t, int64_t, double, Bytes>;

// Calibration curve: raw value → engineering value.  An empty curve is the
// identity.
using Calibration = std::function<Value(const Value&)>;

// ─── Conversions ──────────────────────────────────────────────────────────────
// Integer conversions throw SizeExceeded when the number is out of range for
// the target and TypeError for a double or byte run.

[[nodiscard]] uint64_t     toUnsigned(const Value& v);
[[nodiscard]] int64_t      toSigned(const Value& v);
[[nodiscard]] double       toDouble(const Value& v);
[[nodiscard]] const Bytes& toBytes(const Value& v);

// ─── Text ─────────────────────────────────────────────────────────────────────

// Decimal for numbers, hex digits for byte runs ("" when empty).
[[nodiscard]] std::string toString(const Value& v);

// "0x" followed by byte_width * 2 upper-case hex digits.
[[nodiscard]] std::string hexString(uint64_t value, size_t byte_width);

// "0x" followed by two hex digits per byte, or "" for an empty span.
[[nodiscard]] std::string hexString(std::span<const uint8_t> bytes);

} // namespace bitpacket
