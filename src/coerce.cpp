#include "rlink/coerce.hpp"
#include "rlink/bridged.hpp"
#include "rlink/errors.hpp"

namespace rlink {

bool ReturnCoercer::assignable(const value& v, TypeId t) const {
    const Type& ty = ctx_.at(t);
    switch(ty.kind){
    case Type::Kind::Any: return true;
    case Type::Kind::Void: return false;
    case Type::Kind::String: return std::holds_alternative<std::string>(v.data);
    case Type::Kind::Primitive:
    case Type::Kind::Scalar: {
        auto b = scalar_base(v);
        return b && *b == ty.base;
    }
    case Type::Kind::Array: {
        const Type& elem = ctx_.at(ty.elem);
        if(elem.kind == Type::Kind::Primitive){
            auto b = array_base(v);
            return b && *b == elem.base;
        }
        auto* arr = std::get_if<object_array>(&v.data);
        if(!arr) return false;
        for(auto &e: arr->elems){
            if(e && !assignable(*e, ty.elem)) return false;
        }
        return true;
    }
    case Type::Kind::Tuple: {
        auto* tup = std::get_if<tuple_value>(&v.data);
        return tup && tup->elems.size() == ty.arity;
    }
    case Type::Kind::Bridged:
    case Type::Kind::Variable: {
        auto* b = std::get_if<bridged_ptr>(&v.data);
        if(!b || !*b) return false;
        bool isVariable = dynamic_cast<const RemoteVariable*>(b->get()) != nullptr;
        if(ty.kind == Type::Kind::Variable) return isVariable;
        return !isVariable && (*b)->type_name() == ty.bridged_name;
    }
    }
    return false;
}

value_ptr ReturnCoercer::coerce_primitive(const value_ptr& v, BaseType b) const {
    if(auto sb = scalar_base(*v); sb && *sb == b) return v;
    if(auto ab = array_base(*v); ab && *ab == b){
        if(array_length(*v) != 1)
            throw incompatible_return_error(std::string("Array of ") + base_name(b) + " does not have exactly 1 value.");
        return with_base_type(b, [&](auto tag) -> value_ptr {
            using T = decltype(tag);
            return make_value(static_cast<T>(std::get<array_of<T>>(v->data).elems[0]));
        });
    }
    throw incompatible_return_error(base_name(b), runtime_type_name(v));
}

value_ptr ReturnCoercer::coerce_value(const value_ptr& v, TypeId t) const {
    if(!v) return nullptr;
    if(ctx_.is_primitive(t)) return coerce_primitive(v, ctx_.at(t).base);
    if(!assignable(*v, t)) throw incompatible_return_error(ctx_.to_string(t), runtime_type_name(v));
    return v;
}

value_ptr ReturnCoercer::coerce(const BindingDescriptor& d, const std::vector<value_ptr>& raw) const {
    if(raw.empty()) return make_value(object_array{});
    if(raw.size() == 1) return coerce_value(raw[0], d.return_types.at(0));
    if(raw.size() > d.return_types.size())
        throw incompatible_return_error("engine returned " + std::to_string(raw.size()) + " values for " +
                                        std::to_string(d.return_types.size()) + " declared return values");

    const Type& rt = ctx_.at(d.result_type);
    // Primitive component: fill a primitive array, null slots keep the zero value
    if(rt.kind == Type::Kind::Array && ctx_.is_primitive(rt.elem)){
        BaseType b = ctx_.at(rt.elem).base;
        return with_base_type(b, [&](auto tag) -> value_ptr {
            using T = decltype(tag);
            std::vector<T> elems(raw.size());
            for(size_t i=0;i<raw.size(); ++i){
                if(!raw[i]) continue;
                auto c = coerce_value(raw[i], d.return_types[i]);
                elems[i] = std::get<T>(c->data);
            }
            return v_array<T>(std::move(elems));
        });
    }

    object_array out;
    out.elems.resize(raw.size());
    for(size_t i=0;i<raw.size(); ++i) out.elems[i] = coerce_value(raw[i], d.return_types[i]);
    if(rt.kind == Type::Kind::Tuple) return make_value(tuple_value{std::move(out.elems)});
    return make_value(std::move(out));
}

} // namespace rlink
