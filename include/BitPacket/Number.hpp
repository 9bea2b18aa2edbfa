#pragma once
// Number.hpp – Fixed-width numeric leaves (integers and IEEE-754 reals).
//
// One field type covers every numeric encoding; the wire shape is given by
// a NumericFormat {kind, width, byte order}.  The field stores the bytes as
// they appear on the wire and converts on value() / setValue().

#include "BitPacket/Field.hpp"

#include <cstdint>
#include <string>

namespace bitpacket {

enum class ByteOrder { BigEndian, LittleEndian };

enum class NumberKind {
    Unsigned, // value() → uint64_t
    Signed,   // value() → int64_t  (two's complement)
    Float,    // value() → double   (IEEE-754 binary32 / binary64)
};

struct NumericFormat {
    NumberKind kind{NumberKind::Unsigned};
    uint8_t    width{1};                    // bytes: 1, 2, 4, 8 (Float: 4, 8)
    ByteOrder  order{ByteOrder::BigEndian};

    bool operator==(const NumericFormat&) const = default;
};

// ─── Named formats (big-endian unless suffixed LE) ────────────────────────────

inline constexpr NumericFormat UInt8   {NumberKind::Unsigned, 1};
inline constexpr NumericFormat UInt16  {NumberKind::Unsigned, 2};
inline constexpr NumericFormat UInt32  {NumberKind::Unsigned, 4};
inline constexpr NumericFormat UInt64  {NumberKind::Unsigned, 8};
inline constexpr NumericFormat Int8    {NumberKind::Signed,   1};
inline constexpr NumericFormat Int16   {NumberKind::Signed,   2};
inline constexpr NumericFormat Int32   {NumberKind::Signed,   4};
inline constexpr NumericFormat Int64   {NumberKind::Signed,   8};
inline constexpr NumericFormat Float32 {NumberKind::Float,    4};
inline constexpr NumericFormat Float64 {NumberKind::Float,    8};

inline constexpr NumericFormat UInt16LE {NumberKind::Unsigned, 2, ByteOrder::LittleEndian};
inline constexpr NumericFormat UInt32LE {NumberKind::Unsigned, 4, ByteOrder::LittleEndian};
inline constexpr NumericFormat UInt64LE {NumberKind::Unsigned, 8, ByteOrder::LittleEndian};
inline constexpr NumericFormat Int16LE  {NumberKind::Signed,   2, ByteOrder::LittleEndian};
inline constexpr NumericFormat Int32LE  {NumberKind::Signed,   4, ByteOrder::LittleEndian};
inline constexpr NumericFormat Int64LE  {NumberKind::Signed,   8, ByteOrder::LittleEndian};
inline constexpr NumericFormat Float32LE{NumberKind::Float,    4, ByteOrder::LittleEndian};
inline constexpr NumericFormat Float64LE{NumberKind::Float,    8, ByteOrder::LittleEndian};

class Number : public Field {
public:
    // Throws std::invalid_argument for an unsupported width.
    Number(std::string name, NumericFormat format, const Value& value = uint64_t{0});

    [[nodiscard]] const NumericFormat& format() const noexcept { return format_; }

    // Wire bytes, in wire order.
    [[nodiscard]] const Bytes& raw() const noexcept { return raw_; }

    [[nodiscard]] size_t size() const override { return format_.width; }

    [[nodiscard]] Value value() const override;
    // Throws SizeExceeded if v is out of range, TypeError for a byte run.
    void setValue(const Value& v) override;

    [[nodiscard]] std::string strValue() const override;
    [[nodiscard]] std::string strHexValue() const override;

    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

    [[nodiscard]] bool isSameType(const Field& other) const override;

protected:
    // Unsigned integer formed by the wire bytes (byte order applied).
    [[nodiscard]] uint64_t bits() const noexcept;

private:
    void store(const Value& v);
    void storeBits(uint64_t bits) noexcept;

    NumericFormat format_;
    Bytes         raw_;
};

} // namespace bitpacket
