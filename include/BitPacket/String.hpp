#pragma once
// String.hpp – Raw byte runs whose length is a literal or is resolved from
// the Context at encode / decode time.
//
//   Structure pkt{"pkt"};
//   pkt.add<Number>("len", UInt8);
//   pkt.add<String>("text", [](const Field& ctx) {
//       return static_cast<size_t>(toUnsigned(ctx.get("len")));
//   });
//   pkt.setBytes(Bytes{0x03, 'A', 'B', 'C'});   // text = "ABC"

#include "BitPacket/Field.hpp"
#include "BitPacket/Resolver.hpp"

#include <string>
#include <string_view>

namespace bitpacket {

class String : public Field {
public:
    // Fixed length: data.size().
    String(std::string name, Bytes data);

    // Length resolved from the Context; data is not checked until setValue
    // or encode, since the Context may not be complete yet.
    String(std::string name, LengthResolver length, Bytes data = {});

    [[nodiscard]] size_t size() const override { return data_.size(); }

    [[nodiscard]] Value value() const override { return data_; }

    // Throws LengthMismatch unless the new value has the resolved length.
    void setValue(const Value& v) override;

    [[nodiscard]] std::string text() const { return {data_.begin(), data_.end()}; }
    void setText(std::string_view s) { setValue(Bytes(s.begin(), s.end())); }

    [[nodiscard]] std::string strValue()    const override { return hexString(data_); }
    [[nodiscard]] std::string strHexValue() const override { return hexString(data_); }

    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

private:
    LengthResolver length_;
    Bytes          data_;
};

} // namespace bitpacket
