#pragma once
// Resolver.hpp – Functions a layout evaluates against the Context (the root
// of the tree) while encoding or decoding.

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace bitpacket {

class Field;

// Builds one new field instance.  The result is named and adopted by the
// caller (Array, MetaStructure, MetaField).
using FieldFactory = std::function<std::unique_ptr<Field>(const Field& context)>;

// A byte length or element count: either a literal or a function of the
// Context.  A resolver may only read fields declared before the field it
// sizes; later ones are not decoded yet and lookups fail with KeyNotFound.
class LengthResolver {
public:
    using Function = std::function<size_t(const Field& context)>;

    LengthResolver(size_t fixed) noexcept : fixed_(fixed) {}

    template <typename F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, LengthResolver> &&
                 std::is_invocable_r_v<size_t, F&, const Field&>)
    LengthResolver(F fn) : fn_(std::move(fn)) {}

    [[nodiscard]] size_t operator()(const Field& context) const {
        return fn_ ? fn_(context) : fixed_;
    }

    [[nodiscard]] bool isFixed() const noexcept { return !fn_; }

private:
    size_t   fixed_{0};
    Function fn_;
};

} // namespace bitpacket
