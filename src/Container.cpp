// Container.cpp – Child ownership, name index and dotted-path resolution.

#include "BitPacket/Container.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Stream.hpp"

#include <stdexcept>

namespace bitpacket {

Container::Container(std::string name) : Field(std::move(name)) {}

// ─────────────────────────────────────────────────────────────────────────────
//  Children
// ─────────────────────────────────────────────────────────────────────────────

void Container::append(std::unique_ptr<Field> field) {
    appendChild(std::move(field));
}

void Container::appendChild(std::unique_ptr<Field> field) {
    if (!field)
        throw std::invalid_argument("Container '" + name() + "': cannot append a null field");
    if (index_.count(field->name()))
        throw NameConflict("Field '" + field->name() + "' already exists in '" + name() + "'");

    adopt(*field, this);
    index_.emplace(field->name(), children_.size());
    children_.push_back(std::move(field));
}

void Container::truncate(size_t n) {
    while (children_.size() > n) {
        index_.erase(children_.back()->name());
        children_.pop_back();
    }
}

Field& Container::at(size_t index) {
    if (index >= children_.size())
        throw std::out_of_range("Container '" + name() + "': index " + std::to_string(index) +
                                " out of range");
    return *children_[index];
}

const Field& Container::at(size_t index) const {
    if (index >= children_.size())
        throw std::out_of_range("Container '" + name() + "': index " + std::to_string(index) +
                                " out of range");
    return *children_[index];
}

std::vector<const Field*> Container::fields() const {
    std::vector<const Field*> out;
    out.reserve(children_.size());
    for (const auto& c : children_) out.push_back(c.get());
    return out;
}

std::vector<std::string> Container::keys() const {
    std::vector<std::string> out;
    for (const auto& c : children_) {
        const auto sub = c->keys();
        if (sub.empty() && !dynamic_cast<const Container*>(c.get()))
            out.push_back(c->name());
        for (const auto& k : sub)
            out.push_back(c->name() + PathSeparator + k);
    }
    return out;
}

void Container::reset() {
    for (auto& c : children_) c->reset();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Path resolution
// ─────────────────────────────────────────────────────────────────────────────

size_t Container::indexOf(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end())
        throw KeyNotFound("Field '" + std::string(name) + "' does not exist in '" +
                          this->name() + "'");
    if (it->second >= visible_)
        throw KeyNotFound("Field '" + std::string(name) + "' in '" + this->name() +
                          "' has not been decoded yet");
    return it->second;
}

const Field& Container::lookup(std::string_view path) const {
    if (path.empty())
        throw KeyNotFound("Empty field path in '" + name() + "'");
    const auto [head, rest] = splitPath(path);
    const Field& child = *children_[indexOf(head)];
    return rest.empty() ? child : child.lookup(rest);
}

Field& Container::lookup(std::string_view path) {
    if (path.empty())
        throw KeyNotFound("Empty field path in '" + name() + "'");
    const auto [head, rest] = splitPath(path);
    Field& child = *children_[indexOf(head)];
    return rest.empty() ? child : child.lookup(rest);
}

void Container::set(std::string_view path, const Value& v) {
    if (path.empty())
        throw KeyNotFound("Empty field path in '" + name() + "'");
    const auto [head, rest] = splitPath(path);
    Field& child = *children_[indexOf(head)];
    if (rest.empty())
        child.setValue(v);
    else
        child.set(rest, v);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Value
// ─────────────────────────────────────────────────────────────────────────────

size_t Container::size() const {
    size_t total = 0;
    for (const auto& c : children_) total += c->size();
    return total;
}

Value Container::value() const {
    return bytes();
}

void Container::setValue(const Value& v) {
    const Bytes& data = toBytes(v);
    ByteReader in{data};
    decode(in, root());
    if (!in.atEnd())
        throw StreamLengthMismatch("Container '" + name() + "' consumed " +
                                   std::to_string(in.position()) + " of " +
                                   std::to_string(data.size()) + " byte(s)");
}

std::string Container::strValue() const {
    return hexString(bytes());
}

std::string Container::strHexValue() const {
    return hexString(bytes());
}

} // namespace bitpacket
