#pragma once
// Array.hpp – Repeated fields whose element count is known only at decode
// time.
//
// Array          – a Structure whose first child is a counter field, followed
//                  by elements "0", "1", ...  The counter always equals the
//                  number of elements.
// MetaStructure  – elements "0", "1", ... whose count is resolved from the
//                  Context (e.g. a sibling decoded earlier).
//
// Both build elements with a FieldFactory.  Decoding drops the elements of
// any previous pass before materializing the new ones.
//
// Example – counted list of 32-bit values:
//   Array values{"values", std::make_unique<Number>("count", UInt8),
//                [](const Field&) { return std::make_unique<Number>("v", UInt32); }};
//   values.setBytes(Bytes{0x02, 0,0,0,0x0A, 0,0,0,0x14});
//   values.get("1");   // 20

#include "BitPacket/Resolver.hpp"
#include "BitPacket/Structure.hpp"

#include <optional>

namespace bitpacket {

// Upper bound on the element count of a decode whose first element consumed
// no bytes; larger counts throw LengthMismatch.
inline constexpr size_t MaxEmptyElements = 4096;

class Array : public Structure {
public:
    // The counter is reset to 0.  factory must build the element type.  A
    // counter named like an index ("0") is rejected (std::invalid_argument).
    Array(std::string name, std::unique_ptr<Field> counter, FieldFactory factory);

    // An unbound MetaField is bound against root() first.
    // Type-checks field against a fresh factory element (TypeError), names
    // it after its index and advances the counter.  If the counter cannot
    // hold the new length the element is removed again and SizeExceeded
    // propagates.
    void append(std::unique_ptr<Field> field) override;

    [[nodiscard]] size_t length() const noexcept { return count() - 1; }

    [[nodiscard]] const Field& counter() const { return at(0); }

    [[nodiscard]] Field&       element(size_t index);
    [[nodiscard]] const Field& element(size_t index) const;

    // "i" or "i.sub": i may be an existing index or length(), which appends
    // a new element first.  Larger indices throw IndexError; the counter
    // is read-only (ReadOnlyField).
    void set(std::string_view path, const Value& v) override;

    void decode(ByteReader& in, const Field& context) override;

    // Drop every element and zero the counter.
    void reset() override;

private:
    Field& counterField() { return at(0); }
    void   syncCounter();

    FieldFactory factory_;
};

// ─────────────────────────────────────────────────────────────────────────────

class MetaStructure : public Structure {
public:
    MetaStructure(std::string name, LengthResolver count, FieldFactory factory);

    // Names field after its index.
    void append(std::unique_ptr<Field> field) override;

    [[nodiscard]] size_t length() const noexcept { return count(); }

    // Same index rules as Array::set.
    void set(std::string_view path, const Value& v) override;

    // Throws LengthMismatch unless the element count equals the resolved
    // count.
    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

    void reset() override;

private:
    LengthResolver count_;
    FieldFactory   factory_;
};

// Numeric path segment ("12") → index; nullopt for anything else.
[[nodiscard]] std::optional<size_t> parseIndex(std::string_view segment) noexcept;

} // namespace bitpacket
