// Typed adapter over Linker::invoke: C++ signatures checked against declared contracts
#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include "rlink/bridged.hpp"
#include "rlink/errors.hpp"
#include "rlink/linker.hpp"
#include "rlink/value.hpp"

namespace rlink {

// value_traits<T>: form() is the declared type T stands for, matches() decides whether a
// declared type may be bound to T, to_value/from_value convert.
template <typename T, typename = void>
struct value_traits;

namespace detail {
[[noreturn]] inline void bad_return(const std::string& required, const value_ptr& v){
    throw incompatible_return_error(required, runtime_type_name(v));
}
} // namespace detail

template <typename T>
struct value_traits<T, std::enable_if_t<is_base_type<T>::value>> {
    static std::string form(){ return base_name(base_type_of<T>::value); }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(T v){ return make_value(v); }
    static T from_value(const value_ptr& v){
        if(auto* p = v ? std::get_if<T>(&v->data) : nullptr) return *p;
        detail::bad_return(form(), v);
    }
};

template <typename T>
struct value_traits<std::optional<T>, std::enable_if_t<is_base_type<T>::value>> {
    static std::string form(){ return std::string("(scalar ") + base_name(base_type_of<T>::value) + ")"; }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(const std::optional<T>& v){ return v ? make_value(*v) : nullptr; }
    static std::optional<T> from_value(const value_ptr& v){
        if(!v) return std::nullopt;
        if(auto* p = std::get_if<T>(&v->data)) return *p;
        detail::bad_return(form(), v);
    }
};

template <>
struct value_traits<std::string> {
    static std::string form(){ return "string"; }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(const std::string& s){ return v_str(s); }
    static std::string from_value(const value_ptr& v){
        if(auto* p = v ? std::get_if<std::string>(&v->data) : nullptr) return *p;
        detail::bad_return(form(), v);
    }
};

template <typename T>
struct value_traits<std::vector<T>, std::enable_if_t<is_base_type<T>::value>> {
    static std::string form(){ return std::string("(array ") + base_name(base_type_of<T>::value) + ")"; }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(const std::vector<T>& v){ return v_array<T>(v); }
    static std::vector<T> from_value(const value_ptr& v){
        if(auto* p = v ? std::get_if<array_of<T>>(&v->data) : nullptr) return p->elems;
        detail::bad_return(form(), v);
    }
};

// Null elements read back as empty strings.
template <>
struct value_traits<std::vector<std::string>> {
    static std::string form(){ return "(array string)"; }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(const std::vector<std::string>& v){ return v_strings(v); }
    static std::vector<std::string> from_value(const value_ptr& v){
        auto* arr = v ? std::get_if<object_array>(&v->data) : nullptr;
        if(!arr) detail::bad_return(form(), v);
        std::vector<std::string> out;
        for(auto &e: arr->elems){
            if(!e){ out.emplace_back(); continue; }
            auto* s = std::get_if<std::string>(&e->data);
            if(!s) detail::bad_return("string", e);
            out.push_back(*s);
        }
        return out;
    }
};

// The untyped value binds to any declared type.
template <>
struct value_traits<value_ptr> {
    static std::string form(){ return "any"; }
    static bool matches(const std::string& declared){ return declared != "void"; }
    static value_ptr to_value(const value_ptr& v){ return v; }
    static value_ptr from_value(const value_ptr& v){ return v; }
};

template <typename T>
struct value_traits<std::shared_ptr<T>, std::enable_if_t<std::is_base_of<BridgedValue, T>::value>> {
    static std::string form(){
        if constexpr (std::is_same<T, RemoteVariable>::value) return "variable";
        else return std::string("(bridged ") + T::kTypeName + ")";
    }
    static bool matches(const std::string& declared){ return declared == form(); }
    static value_ptr to_value(const std::shared_ptr<T>& b){ return b ? v_bridged(b) : nullptr; }
    static std::shared_ptr<T> from_value(const value_ptr& v){
        if(!v) return nullptr;
        auto* b = std::get_if<bridged_ptr>(&v->data);
        std::shared_ptr<T> out = b ? std::dynamic_pointer_cast<T>(*b) : nullptr;
        if(!out) detail::bad_return(form(), v);
        return out;
    }
};

// Multiple results of a (tuple N) declaration.
template <typename... Ts>
struct value_traits<std::tuple<Ts...>> {
    static std::string form(){ return "(tuple " + std::to_string(sizeof...(Ts)) + ")"; }
    static bool matches(const std::string& declared){ return declared == form(); }
    static std::tuple<Ts...> from_value(const value_ptr& v){
        auto* t = v ? std::get_if<tuple_value>(&v->data) : nullptr;
        if(!t || t->elems.size() != sizeof...(Ts)) detail::bad_return(form(), v);
        return unpack(t->elems, std::index_sequence_for<Ts...>{});
    }
private:
    template <std::size_t... I>
    static std::tuple<Ts...> unpack(const std::vector<value_ptr>& elems, std::index_sequence<I...>){
        return std::tuple<Ts...>(value_traits<Ts>::from_value(elems[I])...);
    }
};

template <typename Sig> class Function;

// A linked call with a fixed C++ signature.
template <typename R, typename... Args>
class Function<R(Args...)> {
public:
    Function(std::shared_ptr<const Linker> linker, std::string id)
        : linker_(std::move(linker)), id_(std::move(id)) {}

    R operator()(const std::decay_t<Args>&... args) const {
        std::vector<value_ptr> values{ value_traits<std::decay_t<Args>>::to_value(args)... };
        value_ptr result = linker_->invoke(id_, std::move(values));
        if constexpr (std::is_void<R>::value) (void)result;
        else return value_traits<R>::from_value(result);
    }

    const std::string& id() const { return id_; }

private:
    std::shared_ptr<const Linker> linker_;
    std::string id_;
};

template <typename Sig>
Function<Sig> Linker::bind(const std::string& id) const {
    return bind_checked(static_cast<Sig*>(nullptr), id);
}

namespace detail {

template <typename R>
bool return_matches(const std::string& declared){
    if constexpr (std::is_void<R>::value) return declared == "void";
    else return value_traits<R>::matches(declared);
}

template <typename R>
std::string return_form(){
    if constexpr (std::is_void<R>::value) return "void";
    else return value_traits<R>::form();
}

} // namespace detail

template <typename R, typename... Args>
Function<R(Args...)> Linker::bind_checked(R (*)(Args...), const std::string& id) const {
    const BindingDescriptor& d = descriptor(id);
    LinkResult r;
    ErrorReporter rep{&r};
    if(d.parameter_types.size() != sizeof...(Args)){
        rep.emit_error(rep.make("E2060", id, "declared with " + std::to_string(d.parameter_types.size()) +
                                " parameters but bound with " + std::to_string(sizeof...(Args)), "", -1, -1));
    } else {
        std::size_t i = 0;
        auto check = [&](bool matched, const std::string& cxxForm){
            if(!matched)
                rep.emit_error(rep.make("E2061", id, "parameter " + std::to_string(i) + " declared " +
                                        types_.to_string(d.parameter_types[i]) + " but bound as " + cxxForm, "", -1, -1));
            ++i;
        };
        (check(value_traits<std::decay_t<Args>>::matches(types_.to_string(d.parameter_types[i])),
               value_traits<std::decay_t<Args>>::form()), ...);
        (void)check;
    }
    std::string declaredRet = types_.to_string(d.result_type);
    if(!detail::return_matches<R>(declaredRet))
        rep.emit_error(rep.make("E2061", id, "return declared " + declaredRet + " but bound as " + detail::return_form<R>(), "", -1, -1));
    if(!r.success) throw linking_error(std::move(r));
    return Function<R(Args...)>(shared_from_this(), id);
}

} // namespace rlink
