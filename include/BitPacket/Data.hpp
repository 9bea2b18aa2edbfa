#pragma once
// Data.hpp – A run of words preceded by its length.
//
// Data is a Structure with exactly two children: the caller's length field
// and a String named "Data" holding length × word_size bytes.  Setting the
// value of the Data field updates the length field.
//
//   +--------+----------------------+
//   | Length |        Data          |
//   +--------+----------------------+
//   | length | Length × word_size   |
//   +--------+----------------------+
//
// The word size is a literal or is resolved from the Context:
//   pkt.add<Number>("WSize", UInt8);
//   pkt.add<Data>("data", std::make_unique<Number>("Length", UInt8),
//                 [](const Field& ctx) { return size_t(toUnsigned(ctx.get("WSize"))); });

#include "BitPacket/Resolver.hpp"
#include "BitPacket/String.hpp"
#include "BitPacket/Structure.hpp"

namespace bitpacket {

class Data : public Structure {
public:
    Data(std::string name, std::unique_ptr<Field> length, LengthResolver word_size = 1);

    // The content bytes (not the encoded structure).
    [[nodiscard]] Value value() const override;

    // Throws LengthMismatch unless the content is a whole number of words,
    // ValueTooLong if the word count does not fit the length field.
    void setValue(const Value& v) override;

    [[nodiscard]] std::string strValue() const override;

    [[nodiscard]] const Field&  lengthField() const { return at(0); }
    [[nodiscard]] const String& content()     const { return *content_; }

private:
    LengthResolver word_size_;
    String*        content_{nullptr};
};

} // namespace bitpacket
