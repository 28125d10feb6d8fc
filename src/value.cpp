#include "rlink/value.hpp"
#include "rlink/bridged.hpp"
#include <sstream>
#include <type_traits>

namespace rlink
{

    namespace
    {
        // value_data lists the eight scalars, then string, then the eight primitive arrays,
        // both in BaseType order.
        constexpr std::size_t kFirstArray = 9;
        constexpr std::size_t kBaseCount = 8;
        static_assert(std::is_same_v<std::variant_alternative_t<7, value_data>, double>);
        static_assert(std::is_same_v<std::variant_alternative_t<kFirstArray + 7, value_data>, array_of<double>>);

        template <typename T>
        std::string elem_to_string(const T &e)
        {
            std::ostringstream oss;
            if constexpr (std::is_same_v<T, bool>)
                oss << (e ? "true" : "false");
            else if constexpr (std::is_same_v<T, char>)
                oss << '\'' << e << '\'';
            else if constexpr (std::is_same_v<T, int8_t>)
                oss << static_cast<int>(e);
            else
                oss << e;
            return oss.str();
        }

        std::string join(const std::vector<value_ptr> &elems, const char *open, const char *close)
        {
            std::string out = open;
            for (size_t i = 0; i < elems.size(); ++i)
            {
                if (i)
                    out += ' ';
                out += to_string(elems[i]);
            }
            return out + close;
        }
    } // namespace

    std::optional<BaseType> scalar_base(const value &v)
    {
        if (v.data.index() < kBaseCount)
            return static_cast<BaseType>(v.data.index());
        return std::nullopt;
    }

    std::optional<BaseType> array_base(const value &v)
    {
        auto i = v.data.index();
        if (i >= kFirstArray && i < kFirstArray + kBaseCount)
            return static_cast<BaseType>(i - kFirstArray);
        return std::nullopt;
    }

    std::size_t array_length(const value &v)
    {
        return std::visit([](const auto &d) -> std::size_t {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, object_array> || std::is_same_v<D, tuple_value>)
                return d.elems.size();
            else if constexpr (std::is_class_v<D> && !std::is_same_v<D, std::string> && !std::is_same_v<D, bridged_ptr>)
                return d.elems.size();
            else
                return 0;
        },
                          v.data);
    }

    std::string runtime_type_name(const value_ptr &v)
    {
        if (!v)
            return "null";
        if (auto b = scalar_base(*v))
            return base_name(*b);
        if (auto b = array_base(*v))
            return std::string("(array ") + base_name(*b) + ")";
        if (std::holds_alternative<std::string>(v->data))
            return "string";
        if (std::holds_alternative<object_array>(v->data))
            return "(array any)";
        if (auto *t = std::get_if<tuple_value>(&v->data))
            return "(tuple " + std::to_string(t->elems.size()) + ")";
        auto &b = std::get<bridged_ptr>(v->data);
        if (!b)
            return "null";
        if (dynamic_cast<const RemoteVariable *>(b.get()))
            return "variable";
        return "(bridged " + b->type_name() + ")";
    }

    bool equal(const value_ptr &a, const value_ptr &b)
    {
        if (!a || !b)
            return !a && !b;
        if (a->data.index() != b->data.index())
            return false;
        if (auto *oa = std::get_if<object_array>(&a->data))
        {
            auto &ob = std::get<object_array>(b->data);
            if (oa->elems.size() != ob.elems.size())
                return false;
            for (size_t i = 0; i < oa->elems.size(); ++i)
                if (!equal(oa->elems[i], ob.elems[i]))
                    return false;
            return true;
        }
        if (auto *ta = std::get_if<tuple_value>(&a->data))
        {
            auto &tb = std::get<tuple_value>(b->data);
            if (ta->elems.size() != tb.elems.size())
                return false;
            for (size_t i = 0; i < ta->elems.size(); ++i)
                if (!equal(ta->elems[i], tb.elems[i]))
                    return false;
            return true;
        }
        if (auto *ba = std::get_if<bridged_ptr>(&a->data))
        {
            auto &bb = std::get<bridged_ptr>(b->data);
            if (!*ba || !bb)
                return !*ba && !bb;
            return (*ba)->equals(*bb);
        }
        return std::visit([&](const auto &x) -> bool {
            using D = std::decay_t<decltype(x)>;
            const D &y = std::get<D>(b->data);
            if constexpr (std::is_same_v<D, object_array> || std::is_same_v<D, tuple_value> || std::is_same_v<D, bridged_ptr>)
                return false; // handled above
            else if constexpr (std::is_class_v<D> && !std::is_same_v<D, std::string>)
                return x.elems == y.elems;
            else
                return x == y;
        },
                          a->data);
    }

    std::string to_string(const value_ptr &v)
    {
        if (!v)
            return "null";
        return std::visit([](const auto &d) -> std::string {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, std::string>)
                return '"' + d + '"';
            else if constexpr (std::is_same_v<D, object_array>)
                return join(d.elems, "{", "}");
            else if constexpr (std::is_same_v<D, tuple_value>)
                return join(d.elems, "(", ")");
            else if constexpr (std::is_same_v<D, bridged_ptr>)
                return d ? "#" + d->type_name() : std::string("null");
            else if constexpr (std::is_class_v<D>)
            {
                std::string out = "[";
                for (size_t i = 0; i < d.elems.size(); ++i)
                {
                    if (i)
                        out += ' ';
                    out += elem_to_string(static_cast<typename decltype(d.elems)::value_type>(d.elems[i]));
                }
                return out + "]";
            }
            else
                return elem_to_string(d);
        },
                          v->data);
    }

} // namespace rlink
