// Loosely typed values exchanged with the remote engine
#pragma once
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "rlink/types.hpp"

namespace rlink
{

    class BridgedValue;
    struct value;

    // nullptr is the engine's null value.
    using value_ptr = std::shared_ptr<value>;
    using bridged_ptr = std::shared_ptr<BridgedValue>;

    template <typename T>
    struct array_of
    {
        std::vector<T> elems;
    };
    // Reference array; elements may be null.
    struct object_array
    {
        std::vector<value_ptr> elems;
    };
    // Fixed-arity aggregate produced for (tuple N) results.
    struct tuple_value
    {
        std::vector<value_ptr> elems;
    };

    using value_data = std::variant<bool, char, int8_t, int16_t, int32_t, int64_t, float, double, std::string,
                                    array_of<bool>, array_of<char>, array_of<int8_t>, array_of<int16_t>,
                                    array_of<int32_t>, array_of<int64_t>, array_of<float>, array_of<double>,
                                    object_array, tuple_value, bridged_ptr>;

    struct value
    {
        value_data data;
    };

    inline value_ptr make_value(value_data d) { return std::make_shared<value>(value{std::move(d)}); }

    inline value_ptr v_bool(bool b) { return make_value(b); }
    inline value_ptr v_char(char c) { return make_value(c); }
    inline value_ptr v_i32(int32_t i) { return make_value(i); }
    inline value_ptr v_i64(int64_t i) { return make_value(i); }
    inline value_ptr v_f32(float f) { return make_value(f); }
    inline value_ptr v_f64(double d) { return make_value(d); }
    inline value_ptr v_str(std::string s) { return make_value(std::move(s)); }
    inline value_ptr v_bridged(bridged_ptr b) { return make_value(std::move(b)); }

    template <typename T>
    value_ptr v_array(std::vector<T> elems) { return make_value(array_of<T>{std::move(elems)}); }
    inline value_ptr v_objects(std::vector<value_ptr> elems) { return make_value(object_array{std::move(elems)}); }
    inline value_ptr v_objects(std::initializer_list<value_ptr> elems) { return make_value(object_array{std::vector<value_ptr>(elems)}); }
    inline value_ptr v_strings(const std::vector<std::string> &elems)
    {
        object_array a;
        for (auto &s : elems)
            a.elems.push_back(v_str(s));
        return make_value(std::move(a));
    }

    // Base type of a primitive scalar, if v holds one.
    std::optional<BaseType> scalar_base(const value &v);
    // Base type of a primitive array, if v holds one.
    std::optional<BaseType> array_base(const value &v);
    std::size_t array_length(const value &v);

    // Runtime type as a type form, e.g. "f64", "(array f64)", "(bridged point)", "null".
    std::string runtime_type_name(const value_ptr &v);

    // Structural deep equality; bridged values compare through BridgedValue::equals.
    bool equal(const value_ptr &a, const value_ptr &b);

    std::string to_string(const value_ptr &v);

} // namespace rlink
