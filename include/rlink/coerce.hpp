// Coercion of untyped engine results into the declared result shape
#pragma once
#include <vector>
#include "rlink/descriptor.hpp"
#include "rlink/types.hpp"
#include "rlink/value.hpp"

namespace rlink {

class ReturnCoercer {
public:
    explicit ReturnCoercer(const TypeContext& ctx) : ctx_(ctx) {}

    // 0 results -> empty object_array; 1 -> the coerced value itself; more -> an array shaped like the
    // declared result (wrapped in a tuple_value for (tuple N)). Throws incompatible_return_error.
    value_ptr coerce(const BindingDescriptor& d, const std::vector<value_ptr>& raw) const;

    // One value against one declared type. null passes through.
    value_ptr coerce_value(const value_ptr& v, TypeId t) const;

    // Runtime assignment compatibility for non-primitive declared types.
    bool assignable(const value& v, TypeId t) const;

private:
    value_ptr coerce_primitive(const value_ptr& v, BaseType b) const;

    const TypeContext& ctx_;
};

} // namespace rlink
