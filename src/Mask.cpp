// Mask.cpp – Named bit masks over an unsigned number.

#include "BitPacket/Mask.hpp"
#include "BitPacket/Error.hpp"

#include <algorithm>
#include <stdexcept>

namespace bitpacket {

MaskBit::MaskBit(std::string name) : BitField(std::move(name), 1) {}

void MaskBit::setValue(const Value& /*v*/) {
    throw ReadOnlyField("Mask indicator '" + name() + "' follows its mask; use mask()/unmask()");
}

std::string MaskBit::strValue() const {
    return toUnsigned(value()) ? "Masked" : "Unmasked";
}

std::string MaskBit::strEngValue() const {
    return strValue();
}

// ─────────────────────────────────────────────────────────────────────────────

Mask::Mask(std::string name, NumericFormat format, Masks masks, uint64_t value)
    : Number(std::move(name), format, value), masks_(std::move(masks)) {
    if (format.kind != NumberKind::Unsigned)
        throw std::invalid_argument("Mask '" + this->name() + "' needs an unsigned format");

    std::stable_sort(masks_.begin(), masks_.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });
    for (const auto& [mask_name, bits] : masks_) {
        auto indicator = std::make_unique<MaskBit>(mask_name);
        adopt(*indicator, this);
        indicators_.push_back(std::move(indicator));
    }
    refresh();
}

void Mask::mask(uint64_t bits) {
    setValue(toUnsigned(value()) | bits);
}

void Mask::unmask(uint64_t bits) {
    setValue(toUnsigned(value()) & ~bits);
}

bool Mask::isMasked(std::string_view mask_name) const {
    for (const auto& [n, bits] : masks_)
        if (n == mask_name) return (toUnsigned(value()) & bits) != 0;
    throw KeyNotFound("Mask '" + std::string(mask_name) + "' does not exist in '" +
                      name() + "'");
}

void Mask::setValue(const Value& v) {
    Number::setValue(v);
    refresh();
}

void Mask::decode(ByteReader& in, const Field& context) {
    Number::decode(in, context);
    refresh();
}

void Mask::refresh() {
    const uint64_t current = toUnsigned(value());
    for (size_t i = 0; i < masks_.size(); ++i)
        indicators_[i]->update((current & masks_[i].second) != 0);
}

std::vector<const Field*> Mask::fields() const {
    std::vector<const Field*> out;
    out.reserve(indicators_.size());
    for (const auto& ind : indicators_) out.push_back(ind.get());
    return out;
}

const Field& Mask::lookup(std::string_view path) const {
    const auto [head, rest] = splitPath(path);
    for (const auto& ind : indicators_) {
        if (ind->name() != head) continue;
        if (rest.empty()) return *ind;
        return ind->lookup(rest);
    }
    throw KeyNotFound("Mask '" + std::string(head) + "' does not exist in '" + name() + "'");
}

Field& Mask::lookup(std::string_view path) {
    const auto [head, rest] = splitPath(path);
    for (auto& ind : indicators_) {
        if (ind->name() != head) continue;
        if (rest.empty()) return *ind;
        return ind->lookup(rest);
    }
    throw KeyNotFound("Mask '" + std::string(head) + "' does not exist in '" + name() + "'");
}

} // namespace bitpacket
