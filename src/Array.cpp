// Array.cpp – Counted and resolver-sized repetitions of factory-built fields.

#include "BitPacket/Array.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/MetaField.hpp"
#include "BitPacket/Stream.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <stdexcept>

namespace bitpacket {

std::optional<size_t> parseIndex(std::string_view segment) noexcept {
    if (segment.empty() || (segment.size() > 1 && segment.front() == '0'))
        return std::nullopt;
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || ptr != segment.data() + segment.size())
        return std::nullopt;
    return index;
}

// ─── Element construction ─────────────────────────────────────────────────────

static std::unique_ptr<Field> build(const FieldFactory& factory, const Field& context,
                                    const std::string& owner) {
    auto field = factory(context);
    if (!field)
        throw TypeError("'" + owner + "': element factory returned no field");
    return field;
}

// Like build(), but a MetaField element is materialized right away so that
// it can be assigned or compared before any decode.
static std::unique_ptr<Field> buildBound(const FieldFactory& factory, const Field& context,
                                         const std::string& owner) {
    auto field = build(factory, context, owner);
    if (auto* meta = dynamic_cast<MetaField*>(field.get()))
        meta->bind(context);
    return field;
}

// MetaField knows how to compare through its delegate, so let it decide.
static bool sameType(const Field& expected, const Field& actual) {
    if (dynamic_cast<const MetaField*>(&actual))
        return actual.isSameType(expected);
    return expected.isSameType(actual);
}

// Elements that consume no input would let a counter read from a few bytes
// materialize an arbitrary number of fields.
static void checkEmptyElements(const std::string& owner, size_t n) {
    if (n > MaxEmptyElements)
        throw LengthMismatch("'" + owner + "': " + std::to_string(n) +
                             " element(s) of zero size exceed the limit of " +
                             std::to_string(MaxEmptyElements));
}

static IndexError indexError(const std::string& owner, size_t index, size_t length) {
    return IndexError("'" + owner + "': index " + std::to_string(index) +
                      " is past the end (length " + std::to_string(length) + ")");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Array
// ─────────────────────────────────────────────────────────────────────────────

Array::Array(std::string name, std::unique_ptr<Field> counter, FieldFactory factory)
    : Structure(std::move(name)), factory_(std::move(factory)) {
    if (!counter)
        throw std::invalid_argument("Array '" + this->name() + "' needs a counter field");
    if (!factory_)
        throw std::invalid_argument("Array '" + this->name() + "' needs an element factory");
    if (parseIndex(counter->name()))
        throw std::invalid_argument("Array '" + this->name() + "': counter name '" +
                                    counter->name() + "' collides with element indices");
    Structure::append(std::move(counter));
    syncCounter();
}

Field& Array::element(size_t index) {
    if (index >= length()) throw indexError(name(), index, length());
    return at(index + 1);
}

const Field& Array::element(size_t index) const {
    if (index >= length()) throw indexError(name(), index, length());
    return at(index + 1);
}

void Array::syncCounter() {
    counterField().setValue(uint64_t{length()});
}

void Array::append(std::unique_ptr<Field> field) {
    if (!field)
        throw std::invalid_argument("Array '" + name() + "': cannot append a null field");

    // An unbound MetaField has no wire shape to compare yet.
    if (auto* meta = dynamic_cast<MetaField*>(field.get()); meta && !meta->materialized())
        meta->bind(root());

    const auto prototype = buildBound(factory_, root(), name());
    if (!sameType(*prototype, *field))
        throw TypeError("Array '" + name() + "': field '" + field->name() +
                        "' does not match the element type");

    rename(*field, std::to_string(length()));
    Structure::append(std::move(field));
    try {
        syncCounter();
    } catch (const FieldError&) {
        truncate(count() - 1);
        throw;
    }
}

void Array::set(std::string_view path, const Value& v) {
    const auto [head, rest] = splitPath(path);
    if (head == counter().name())
        throw ReadOnlyField("Array '" + name() + "': counter '" + counter().name() +
                            "' only changes through append or decode");

    if (const auto index = parseIndex(head)) {
        if (*index > length()) throw indexError(name(), *index, length());
        if (*index == length()) {
            append(buildBound(factory_, root(), name()));
            try {
                Structure::set(path, v);
            } catch (const FieldError&) {
                truncate(count() - 1);
                syncCounter();
                throw;
            }
            return;
        }
    }
    Structure::set(path, v);
}

void Array::decode(ByteReader& in, const Field& context) {
    reset();

    DecodeScope scope{*this};
    scope.reveal(1);
    counterField().decode(in, context);

    const uint64_t n = toUnsigned(counter().value());
    spdlog::debug("Array '{}': decoding {} element(s) at offset {}", name(), n, in.position());

    for (uint64_t i = 0; i < n; ++i) {
        auto element = build(factory_, context, name());
        rename(*element, std::to_string(i));
        Structure::append(std::move(element));
        scope.reveal(count());
        const size_t start = in.position();
        at(count() - 1).decode(in, context);
        if (i == 0 && in.position() == start)
            checkEmptyElements(name(), n);
    }
}

void Array::reset() {
    truncate(1);
    counterField().reset();
    syncCounter();
}

// ─────────────────────────────────────────────────────────────────────────────
//  MetaStructure
// ─────────────────────────────────────────────────────────────────────────────

MetaStructure::MetaStructure(std::string name, LengthResolver count, FieldFactory factory)
    : Structure(std::move(name)), count_(std::move(count)), factory_(std::move(factory)) {
    if (!factory_)
        throw std::invalid_argument("MetaStructure '" + this->name() +
                                    "' needs an element factory");
}

void MetaStructure::append(std::unique_ptr<Field> field) {
    if (!field)
        throw std::invalid_argument("MetaStructure '" + name() + "': cannot append a null field");
    rename(*field, std::to_string(count()));
    Structure::append(std::move(field));
}

void MetaStructure::set(std::string_view path, const Value& v) {
    const auto [head, rest] = splitPath(path);
    if (const auto index = parseIndex(head)) {
        if (*index > length()) throw indexError(name(), *index, length());
        if (*index == length()) {
            append(buildBound(factory_, root(), name()));
            try {
                Structure::set(path, v);
            } catch (const FieldError&) {
                truncate(count() - 1);
                throw;
            }
            return;
        }
    }
    Structure::set(path, v);
}

void MetaStructure::encode(ByteWriter& out, const Field& context) const {
    const size_t expected = count_(context);
    if (expected != count())
        throw LengthMismatch("MetaStructure '" + name() + "' holds " + std::to_string(count()) +
                             " element(s) but its count resolves to " + std::to_string(expected));
    Structure::encode(out, context);
}

void MetaStructure::decode(ByteReader& in, const Field& context) {
    reset();

    const size_t n = count_(context);
    spdlog::debug("MetaStructure '{}': decoding {} element(s) at offset {}", name(), n,
                  in.position());

    DecodeScope scope{*this};
    for (size_t i = 0; i < n; ++i) {
        auto element = build(factory_, context, name());
        rename(*element, std::to_string(i));
        Structure::append(std::move(element));
        scope.reveal(count());
        const size_t start = in.position();
        at(count() - 1).decode(in, context);
        if (i == 0 && in.position() == start)
            checkEmptyElements(name(), n);
    }
}

void MetaStructure::reset() {
    truncate(0);
}

} // namespace bitpacket
