// MetaField.cpp – Late-bound delegate creation and forwarding.

#include "BitPacket/MetaField.hpp"
#include "BitPacket/Error.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace bitpacket {

MetaField::MetaField(std::string name, FieldFactory factory)
    : Field(std::move(name)), factory_(std::move(factory)) {
    if (!factory_)
        throw std::invalid_argument("MetaField '" + this->name() + "' needs a field factory");
}

Field& MetaField::require() {
    if (!delegate_)
        throw NotMaterialized("MetaField '" + name() + "' has not been decoded or bound yet");
    return *delegate_;
}

const Field& MetaField::require() const {
    if (!delegate_)
        throw NotMaterialized("MetaField '" + name() + "' has not been decoded or bound yet");
    return *delegate_;
}

Field& MetaField::bind(const Field& context) {
    auto field = factory_(context);
    if (!field)
        throw TypeError("MetaField '" + name() + "': factory returned no field");

    rename(*field, name());
    adopt(*field, this);
    delegate_ = std::move(field);
    spdlog::debug("MetaField '{}': materialized", name());
    return *delegate_;
}

Value MetaField::engValue() const {
    const auto& curve = calibration();
    return curve ? curve(require().value()) : require().engValue();
}

std::string MetaField::strEngValue() const {
    return calibration() ? toString(engValue()) : require().strEngValue();
}

// ─── Wire format ──────────────────────────────────────────────────────────────

void MetaField::encode(ByteWriter& out, const Field& context) const {
    require().encode(out, context);
}

void MetaField::decode(ByteReader& in, const Field& context) {
    bind(context).decode(in, context);
}

void MetaField::encodeBits(BitStreamWriter& out, const Field& context) const {
    require().encodeBits(out, context);
}

void MetaField::decodeBits(BitStreamReader& in, const Field& context) {
    bind(context).decodeBits(in, context);
}

bool MetaField::isSameType(const Field& other) const {
    if (const auto* meta = dynamic_cast<const MetaField*>(&other))
        return require().isSameType(meta->require());
    return require().isSameType(other);
}

} // namespace bitpacket
