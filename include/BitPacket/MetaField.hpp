#pragma once
// MetaField.hpp – A field whose concrete type is chosen at decode time.
//
// A MetaField holds a FieldFactory.  Decoding (or an explicit bind) calls
// the factory with the Context and keeps the result as its delegate; every
// other operation is forwarded to the delegate.  Until then all accessors
// throw NotMaterialized.  Each decode builds a fresh delegate.
//
// Example – payload type selected by a preceding tag:
//   Structure msg{"msg"};
//   msg.add<Number>("tag", UInt8);
//   msg.add<MetaField>("payload", [](const Field& ctx) -> std::unique_ptr<Field> {
//       if (toUnsigned(ctx.get("tag")) == 1)
//           return std::make_unique<Number>("p", UInt16);
//       return std::make_unique<Number>("p", UInt32);
//   });

#include "BitPacket/Field.hpp"
#include "BitPacket/Resolver.hpp"

namespace bitpacket {

class MetaField : public Field {
public:
    MetaField(std::string name, FieldFactory factory);

    [[nodiscard]] bool materialized() const noexcept { return delegate_ != nullptr; }

    // Build a new delegate from context, replacing any previous one.  The
    // delegate takes this field's name and has this field as parent.
    Field& bind(const Field& context);

    // Throw NotMaterialized before bind / decode.
    [[nodiscard]] Field&       delegate()       { return require(); }
    [[nodiscard]] const Field& delegate() const { return require(); }

    [[nodiscard]] size_t size()    const override { return require().size(); }
    [[nodiscard]] size_t bitSize() const override { return require().bitSize(); }

    // An unbound MetaField may be placed in either kind of structure.
    [[nodiscard]] bool byteAligned() const noexcept override {
        return delegate_ ? delegate_->byteAligned() : true;
    }
    [[nodiscard]] bool bitAddressable() const noexcept override {
        return delegate_ ? delegate_->bitAddressable() : true;
    }

    [[nodiscard]] Value value() const override { return require().value(); }
    void setValue(const Value& v) override { require().setValue(v); }

    // A curve set on the MetaField itself wins over the delegate's.
    [[nodiscard]] Value engValue() const override;

    [[nodiscard]] std::string strValue()    const override { return require().strValue(); }
    [[nodiscard]] std::string strHexValue() const override { return require().strHexValue(); }
    [[nodiscard]] std::string strEngValue() const override;

    [[nodiscard]] std::vector<const Field*> fields() const override { return require().fields(); }
    // Unbound, a MetaField lists as a leaf.
    [[nodiscard]] std::vector<std::string> keys() const override {
        return delegate_ ? delegate_->keys() : std::vector<std::string>{};
    }
    [[nodiscard]] const Field& lookup(std::string_view path) const override {
        return require().lookup(path);
    }
    [[nodiscard]] Field& lookup(std::string_view path) override {
        return require().lookup(path);
    }
    void set(std::string_view path, const Value& v) override { require().set(path, v); }

    void encode(ByteWriter& out, const Field& context) const override;
    void decode(ByteReader& in, const Field& context) override;

    void encodeBits(BitStreamWriter& out, const Field& context) const override;
    void decodeBits(BitStreamReader& in, const Field& context) override;

    // Drop the delegate.
    void reset() override { delegate_.reset(); }

    [[nodiscard]] bool isSameType(const Field& other) const override;

private:
    [[nodiscard]] Field&       require();
    [[nodiscard]] const Field& require() const;

    FieldFactory           factory_;
    std::unique_ptr<Field> delegate_;
};

} // namespace bitpacket
