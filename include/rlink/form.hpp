// EDN subset reader used for binding declarations and type forms
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rlink
{

    struct decl_parse_error : std::runtime_error
    {
        decl_parse_error(const std::string &msg, int line = -1, int col = -1)
            : std::runtime_error(line >= 0 ? msg + " at " + std::to_string(line) + ":" + std::to_string(col) : msg), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct form;
    using form_ptr = std::shared_ptr<form>;

    struct form_list
    {
        std::vector<form_ptr> elems;
    };
    struct form_vector
    {
        std::vector<form_ptr> elems;
    };

    using form_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, form_list, form_vector>;

    struct form
    {
        form_data data;
        int line = -1;
        int col = -1;
    };

    // Read exactly one form from src; trailing non-whitespace is an error.
    form_ptr read_form(std::string_view src);

    std::string to_string(const form &f);
    inline std::string to_string(const form_ptr &f) { return f ? to_string(*f) : std::string("nil"); }

    inline bool is_symbol(const form &f) { return std::holds_alternative<symbol>(f.data); }
    inline bool is_keyword(const form &f) { return std::holds_alternative<keyword>(f.data); }
    inline const form_list *as_list(const form &f) { return std::get_if<form_list>(&f.data); }
    inline const form_vector *as_vector(const form &f) { return std::get_if<form_vector>(&f.data); }

    // Symbol or string text, empty otherwise.
    inline std::string text_of(const form_ptr &f)
    {
        if (!f)
            return {};
        if (auto *s = std::get_if<symbol>(&f->data))
            return s->name;
        if (auto *s = std::get_if<std::string>(&f->data))
            return *s;
        return {};
    }

} // namespace rlink
