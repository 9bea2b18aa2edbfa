#pragma once
// Container.hpp – Ordered, name-indexed collection of fields that is itself
// a field.
//
// Child order is wire order.  Names are unique among siblings and children
// are reachable by dotted path:
//
//   ip.field("header.version");        // Field&
//   ip.get("header.length");           // Value
//   ip.set("header.length", 20);
//
// While a container is being decoded, children that have not been reached
// yet are hidden from lookups, so a resolver that refers forward fails with
// KeyNotFound instead of reading a stale value.

#include "BitPacket/Field.hpp"

#include <cstddef>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitpacket {

class Container : public Field {
public:
    explicit Container(std::string name);

    // Takes ownership of field and makes this its parent.
    // Throws NameConflict if a child with the same name exists.
    virtual void append(std::unique_ptr<Field> field);

    // Construct a T in place, append it and return it.
    template <typename T, typename... Args>
    T& add(Args&&... args) {
        auto owned = std::make_unique<T>(std::forward<Args>(args)...);
        T&   ref   = *owned;
        append(std::move(owned));
        return ref;
    }

    [[nodiscard]] size_t count() const noexcept { return children_.size(); }
    [[nodiscard]] Field&       at(size_t index);
    [[nodiscard]] const Field& at(size_t index) const;

    // Dotted paths of every leaf below this container, in wire order.  A
    // bound MetaField is expanded through its delegate.
    [[nodiscard]] std::vector<std::string> keys() const override;

    // Sum of the children's sizes.
    [[nodiscard]] size_t size() const override;

    // The encoded bytes of the container.
    [[nodiscard]] Value value() const override;
    // Decode from a byte run of exactly size() bytes.
    void setValue(const Value& v) override;

    [[nodiscard]] std::string strValue()    const override;
    [[nodiscard]] std::string strHexValue() const override;

    [[nodiscard]] std::vector<const Field*> fields() const override;
    [[nodiscard]] const Field& lookup(std::string_view path) const override;
    [[nodiscard]] Field&       lookup(std::string_view path) override;
    void set(std::string_view path, const Value& v) override;

    void reset() override;

protected:
    // Hides children at index >= n from lookups for the lifetime of the
    // scope; the destructor makes every child visible again.
    class DecodeScope {
    public:
        explicit DecodeScope(Container& c) noexcept : c_(c) { c_.visible_ = 0; }
        ~DecodeScope() { c_.visible_ = npos; }

        DecodeScope(const DecodeScope&)            = delete;
        DecodeScope& operator=(const DecodeScope&) = delete;

        void reveal(size_t n) noexcept { c_.visible_ = n; }

    private:
        Container& c_;
    };

    // Append without the kind checks of derived containers.
    void appendChild(std::unique_ptr<Field> field);

    // Drop every child from index n on.
    void truncate(size_t n);

    // Index of a visible direct child; throws KeyNotFound.
    [[nodiscard]] size_t indexOf(std::string_view name) const;

    [[nodiscard]] const std::vector<std::unique_ptr<Field>>& children() const noexcept {
        return children_;
    }

private:
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    std::vector<std::unique_ptr<Field>>          children_;
    std::map<std::string, size_t, std::less<>>   index_;
    size_t                                       visible_{npos};
};

} // namespace bitpacket
