// Type tags for declared parameters and returns
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include "rlink/form.hpp"

namespace rlink
{

    using TypeId = uint32_t;

    enum class BaseType
    {
        Bool,
        Char,
        I8,
        I16,
        I32,
        I64,
        F32,
        F64
    };

    struct Type
    {
        enum class Kind
        {
            Void,
            Primitive,
            Scalar,
            String,
            Any,
            Array,
            Tuple,
            Bridged,
            Variable
        } kind;
        BaseType base{};          // Primitive, Scalar
        TypeId elem{0};           // Array
        uint32_t arity{0};        // Tuple
        std::string bridged_name; // Bridged
    };

    const char *base_name(BaseType b);
    std::optional<BaseType> base_from_name(std::string_view name);

    class TypeContext
    {
    public:
        TypeContext();

        TypeId get_void() const { return void_; }
        TypeId get_any() const { return any_; }
        TypeId get_string() const { return string_; }
        TypeId get_variable() const { return variable_; }
        TypeId get_primitive(BaseType b);
        TypeId get_scalar(BaseType b);
        TypeId get_array(TypeId elem);
        TypeId get_tuple(uint32_t arity);
        TypeId get_bridged(const std::string &name);

        const Type &at(TypeId id) const { return types_.at(id); }
        std::string to_string(TypeId id) const;

        bool is_void(TypeId id) const { return at(id).kind == Type::Kind::Void; }
        bool is_primitive(TypeId id) const { return at(id).kind == Type::Kind::Primitive; }
        bool is_array(TypeId id) const { return at(id).kind == Type::Kind::Array; }
        bool is_tuple(TypeId id) const { return at(id).kind == Type::Kind::Tuple; }
        // Bridged types and the named remote reference need the custom protocol.
        bool is_bridged(TypeId id) const
        {
            auto k = at(id).kind;
            return k == Type::Kind::Bridged || k == Type::Kind::Variable;
        }

        // Parse a type form:
        //   void any string variable bool char i8 i16 i32 i64 f32 f64
        //   (scalar <prim>) (array <type>) (tuple N) (bridged Name)
        // A bare unknown symbol is read as a bridged type name.
        TypeId parse_type(const form_ptr &n);
        TypeId parse_type(std::string_view text) { return parse_type(read_form(text)); }

    private:
        TypeId add_type(Type t);

        std::vector<Type> types_;
        TypeId void_{0}, any_{0}, string_{0}, variable_{0};
        std::unordered_map<int, TypeId> primitive_cache_;
        std::unordered_map<int, TypeId> scalar_cache_;
        std::unordered_map<TypeId, TypeId> array_cache_;
        std::unordered_map<uint32_t, TypeId> tuple_cache_;
        std::unordered_map<std::string, TypeId> bridged_cache_;
    };

    // C++ type -> BaseType for the primitives a value can carry.
    template <typename T>
    struct base_type_of
    {
    };
    template <>
    struct base_type_of<bool>
    {
        static constexpr BaseType value = BaseType::Bool;
    };
    template <>
    struct base_type_of<char>
    {
        static constexpr BaseType value = BaseType::Char;
    };
    template <>
    struct base_type_of<int8_t>
    {
        static constexpr BaseType value = BaseType::I8;
    };
    template <>
    struct base_type_of<int16_t>
    {
        static constexpr BaseType value = BaseType::I16;
    };
    template <>
    struct base_type_of<int32_t>
    {
        static constexpr BaseType value = BaseType::I32;
    };
    template <>
    struct base_type_of<int64_t>
    {
        static constexpr BaseType value = BaseType::I64;
    };
    template <>
    struct base_type_of<float>
    {
        static constexpr BaseType value = BaseType::F32;
    };
    template <>
    struct base_type_of<double>
    {
        static constexpr BaseType value = BaseType::F64;
    };

    template <typename T, typename = void>
    struct is_base_type : std::false_type
    {
    };
    template <typename T>
    struct is_base_type<T, std::void_t<decltype(base_type_of<T>::value)>> : std::true_type
    {
    };

    // Call f with a value-initialized object of the C++ type carrying base b.
    template <typename F>
    decltype(auto) with_base_type(BaseType b, F &&f)
    {
        switch (b)
        {
        case BaseType::Bool:
            return f(bool{});
        case BaseType::Char:
            return f(char{});
        case BaseType::I8:
            return f(int8_t{});
        case BaseType::I16:
            return f(int16_t{});
        case BaseType::I32:
            return f(int32_t{});
        case BaseType::I64:
            return f(int64_t{});
        case BaseType::F32:
            return f(float{});
        case BaseType::F64:
            break;
        }
        return f(double{});
    }

} // namespace rlink
