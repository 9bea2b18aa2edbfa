#pragma once
// Mask.hpp – Unsigned numbers whose bits carry named masks.
//
//   Mask status{"status", UInt8, {{"READY", 0x01}, {"ERROR", 0x80}}};
//   status.mask(0x80);
//   status.isMasked("ERROR");        // true
//   status["ERROR"].strValue();      // "Masked"
//
// fields() exposes one read-only indicator per mask, ordered by mask value,
// for renderers; the indicators follow every change of the number.

#include "BitPacket/BitField.hpp"
#include "BitPacket/Number.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitpacket {

// Indicator of one mask: renders as "Unmasked" / "Masked".
class MaskBit : public BitField {
public:
    explicit MaskBit(std::string name);

    // Indicators follow their Mask; throws ReadOnlyField.
    void setValue(const Value& v) override;

    [[nodiscard]] std::string strValue()    const override;
    [[nodiscard]] std::string strEngValue() const override;

private:
    friend class Mask;
    void update(bool masked) { BitField::setValue(masked ? uint64_t{1} : uint64_t{0}); }
};

class Mask : public Number {
public:
    using Masks = std::vector<std::pair<std::string, uint64_t>>;

    // format must be unsigned (std::invalid_argument otherwise).
    Mask(std::string name, NumericFormat format, Masks masks, uint64_t value = 0);

    void mask(uint64_t bits);
    void unmask(uint64_t bits);

    // Throws KeyNotFound for an unknown mask name.
    [[nodiscard]] bool isMasked(std::string_view mask_name) const;

    void setValue(const Value& v) override;
    void decode(ByteReader& in, const Field& context) override;

    [[nodiscard]] std::string strValue()    const override { return strHexValue(); }
    [[nodiscard]] std::string strEngValue() const override { return strHexValue(); }

    [[nodiscard]] std::vector<const Field*> fields() const override;
    [[nodiscard]] const Field& lookup(std::string_view path) const override;
    [[nodiscard]] Field&       lookup(std::string_view path) override;

private:
    void refresh();

    Masks                                 masks_;
    std::vector<std::unique_ptr<MaskBit>> indicators_;
};

} // namespace bitpacket
