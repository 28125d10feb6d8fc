#include "rlink/types.hpp"

namespace rlink
{

    const char *base_name(BaseType b)
    {
        switch (b)
        {
        case BaseType::Bool:
            return "bool";
        case BaseType::Char:
            return "char";
        case BaseType::I8:
            return "i8";
        case BaseType::I16:
            return "i16";
        case BaseType::I32:
            return "i32";
        case BaseType::I64:
            return "i64";
        case BaseType::F32:
            return "f32";
        case BaseType::F64:
            return "f64";
        }
        return "?";
    }

    std::optional<BaseType> base_from_name(std::string_view name)
    {
        static const BaseType all[] = {BaseType::Bool, BaseType::Char, BaseType::I8, BaseType::I16,
                                       BaseType::I32, BaseType::I64, BaseType::F32, BaseType::F64};
        for (auto b : all)
            if (name == base_name(b))
                return b;
        return std::nullopt;
    }

    TypeContext::TypeContext()
    { // seed fixed types so ids are stable per context
        Type t{};
        t.kind = Type::Kind::Void;
        void_ = add_type(t);
        t.kind = Type::Kind::Any;
        any_ = add_type(t);
        t.kind = Type::Kind::String;
        string_ = add_type(t);
        t.kind = Type::Kind::Variable;
        variable_ = add_type(t);
    }

    TypeId TypeContext::add_type(Type t)
    {
        TypeId id = static_cast<TypeId>(types_.size());
        types_.push_back(std::move(t));
        return id;
    }

    TypeId TypeContext::get_primitive(BaseType b)
    {
        auto key = static_cast<int>(b);
        if (auto it = primitive_cache_.find(key); it != primitive_cache_.end())
            return it->second;
        Type t{};
        t.kind = Type::Kind::Primitive;
        t.base = b;
        return primitive_cache_[key] = add_type(std::move(t));
    }

    TypeId TypeContext::get_scalar(BaseType b)
    {
        auto key = static_cast<int>(b);
        if (auto it = scalar_cache_.find(key); it != scalar_cache_.end())
            return it->second;
        Type t{};
        t.kind = Type::Kind::Scalar;
        t.base = b;
        return scalar_cache_[key] = add_type(std::move(t));
    }

    TypeId TypeContext::get_array(TypeId elem)
    {
        if (auto it = array_cache_.find(elem); it != array_cache_.end())
            return it->second;
        Type t{};
        t.kind = Type::Kind::Array;
        t.elem = elem;
        return array_cache_[elem] = add_type(std::move(t));
    }

    TypeId TypeContext::get_tuple(uint32_t arity)
    {
        if (auto it = tuple_cache_.find(arity); it != tuple_cache_.end())
            return it->second;
        Type t{};
        t.kind = Type::Kind::Tuple;
        t.arity = arity;
        return tuple_cache_[arity] = add_type(std::move(t));
    }

    TypeId TypeContext::get_bridged(const std::string &name)
    {
        if (auto it = bridged_cache_.find(name); it != bridged_cache_.end())
            return it->second;
        Type t{};
        t.kind = Type::Kind::Bridged;
        t.bridged_name = name;
        return bridged_cache_[name] = add_type(std::move(t));
    }

    std::string TypeContext::to_string(TypeId id) const
    {
        const Type &t = at(id);
        switch (t.kind)
        {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::Primitive:
            return base_name(t.base);
        case Type::Kind::Scalar:
            return std::string("(scalar ") + base_name(t.base) + ")";
        case Type::Kind::String:
            return "string";
        case Type::Kind::Any:
            return "any";
        case Type::Kind::Array:
            return "(array " + to_string(t.elem) + ")";
        case Type::Kind::Tuple:
            return "(tuple " + std::to_string(t.arity) + ")";
        case Type::Kind::Bridged:
            return "(bridged " + t.bridged_name + ")";
        case Type::Kind::Variable:
            return "variable";
        }
        return "<bad-type>";
    }

    TypeId TypeContext::parse_type(const form_ptr &n)
    {
        if (!n)
            throw decl_parse_error("missing type form");
        if (auto *s = std::get_if<symbol>(&n->data))
        {
            const std::string &name = s->name;
            if (name == "void")
                return get_void();
            if (name == "any")
                return get_any();
            if (name == "string")
                return get_string();
            if (name == "variable")
                return get_variable();
            if (auto b = base_from_name(name))
                return get_primitive(*b);
            // Fallback: treat as a bridged type name, checked against the registry at link time
            return get_bridged(name);
        }
        auto *l = as_list(*n);
        if (!l)
            throw decl_parse_error("unsupported type form " + rlink::to_string(*n), n->line, n->col);
        auto &elems = l->elems;
        if (elems.size() != 2 || !is_symbol(*elems[0]))
            throw decl_parse_error("type form must be (head arg): " + rlink::to_string(*n), n->line, n->col);
        std::string head = std::get<symbol>(elems[0]->data).name;
        const form_ptr &arg = elems[1];
        if (head == "array")
        {
            TypeId elem = parse_type(arg);
            if (is_void(elem) || is_tuple(elem))
                throw decl_parse_error("array component cannot be " + to_string(elem), n->line, n->col);
            return get_array(elem);
        }
        if (head == "scalar")
        {
            auto b = is_symbol(*arg) ? base_from_name(std::get<symbol>(arg->data).name) : std::nullopt;
            if (!b)
                throw decl_parse_error("scalar expects a primitive base type", n->line, n->col);
            return get_scalar(*b);
        }
        if (head == "tuple")
        {
            auto *arity = std::get_if<int64_t>(&arg->data);
            if (!arity || *arity < 2)
                throw decl_parse_error("tuple arity must be an integer >= 2", n->line, n->col);
            return get_tuple(static_cast<uint32_t>(*arity));
        }
        if (head == "bridged")
        {
            std::string name = text_of(arg);
            if (name.empty())
                throw decl_parse_error("bridged expects a type name", n->line, n->col);
            return get_bridged(name);
        }
        throw decl_parse_error("unknown type form: " + head, n->line, n->col);
    }

} // namespace rlink
