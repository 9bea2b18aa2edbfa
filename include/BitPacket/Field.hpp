#pragma once
// Field.hpp – Contract shared by every node of a BitPacket layout tree.
//
// A layout is a tree.  Containers own their children; every child keeps a
// non-owning pointer back to its parent.  The root of the tree is the
// Context: it is handed to every length resolver and field factory so that
// a nested field can depend on any field decoded before it.
//
// Units:
//   • Bit fields (BitField, Boolean, Flag) report size() in bits and may only
//     live inside a BitStructure.
//   • Every other field reports size() in bytes.  A BitStructure is byte
//     aligned from the outside and bit addressable from the inside.

#include "BitPacket/Options.hpp"
#include "BitPacket/Value.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitpacket {

class BitStreamReader;
class BitStreamWriter;
class ByteReader;
class ByteWriter;

// Separator of dotted field paths ("header.length").
inline constexpr char PathSeparator = '.';

// Split "a.b.c" into {"a", "b.c"}; the tail is empty for a single segment.
[[nodiscard]] std::pair<std::string_view, std::string_view> splitPath(std::string_view path) noexcept;

class Field {
public:
    explicit Field(std::string name);
    virtual ~Field() = default;

    Field(const Field&)            = delete;
    Field& operator=(const Field&) = delete;

    // ── Identity and navigation ──────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const Field* parent() const noexcept { return parent_; }
    [[nodiscard]] Field*       parent()       noexcept { return parent_; }

    // Outermost ancestor (this field when it has no parent).
    [[nodiscard]] const Field& root() const noexcept;
    [[nodiscard]] Field&       root()       noexcept;

    // ── Size ─────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual size_t size() const = 0;
    [[nodiscard]] virtual size_t bitSize() const { return size() * 8; }

    // Can be encoded into / decoded from a byte stream.
    [[nodiscard]] virtual bool byteAligned() const noexcept { return true; }
    // Can be packed into a bit stream (i.e. be a BitStructure child).
    [[nodiscard]] virtual bool bitAddressable() const noexcept { return false; }

    // ── Value ────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual Value value() const = 0;
    virtual void setValue(const Value& v) = 0;

    void setCalibration(Calibration curve) { calibration_ = std::move(curve); }
    [[nodiscard]] const Calibration& calibration() const noexcept { return calibration_; }

    // calibration(value()), or value() when no curve is set.
    [[nodiscard]] virtual Value engValue() const;

    // ── Presentation hooks ───────────────────────────────────────────────────

    [[nodiscard]] virtual std::string strValue() const = 0;
    [[nodiscard]] virtual std::string strHexValue() const = 0;
    [[nodiscard]] virtual std::string strEngValue() const;

    // ── Children and dotted paths ────────────────────────────────────────────

    // Ordered children; empty for leaves.
    [[nodiscard]] virtual std::vector<const Field*> fields() const { return {}; }

    // Dotted paths of every leaf below this field; empty for leaves.
    [[nodiscard]] virtual std::vector<std::string> keys() const { return {}; }

    // Resolve "a.b.c" below this field.  Leaves throw NotAContainer.
    [[nodiscard]] virtual const Field& lookup(std::string_view path) const;
    [[nodiscard]] virtual Field&       lookup(std::string_view path);

    [[nodiscard]] const Field& field(std::string_view path) const { return lookup(path); }
    [[nodiscard]] Field&       field(std::string_view path)       { return lookup(path); }
    [[nodiscard]] const Field& operator[](std::string_view path) const { return field(path); }
    [[nodiscard]] Field&       operator[](std::string_view path)       { return field(path); }

    [[nodiscard]] Value get(std::string_view path) const { return lookup(path).value(); }
    virtual void set(std::string_view path, const Value& v);

    // ── Wire format ──────────────────────────────────────────────────────────
    // encode/decode consume exactly size() bytes; the bit variants exactly
    // bitSize() bits.  'context' is the root of the tree being processed.

    virtual void encode(ByteWriter& out, const Field& context) const = 0;
    virtual void decode(ByteReader& in, const Field& context) = 0;

    virtual void encodeBits(BitStreamWriter& out, const Field& context) const;
    virtual void decodeBits(BitStreamReader& in, const Field& context);

    // Encode into a new buffer, using root() as the context.
    [[nodiscard]] Bytes bytes() const;

    // Decode from buf, using root() as the context.  Extra bytes are ignored
    // unless options.reject_trailing_bytes is set.
    void setBytes(std::span<const uint8_t> buf, const DecodeOptions& options = {});

    // ── Dynamic state ────────────────────────────────────────────────────────

    // Drop everything a decode or bind materialized.
    virtual void reset() {}

    // Same concrete field type and wire shape (used by Array::append).
    [[nodiscard]] virtual bool isSameType(const Field& other) const;

protected:
    static void rename(Field& f, std::string name) { f.name_ = std::move(name); }
    static void adopt(Field& child, Field* parent) noexcept { child.parent_ = parent; }

private:
    std::string name_;
    Field*      parent_{nullptr};
    Calibration calibration_;
};

} // namespace bitpacket
