#include "rlink/form.hpp"
#include <cctype>
#include <sstream>

namespace rlink
{

    namespace
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
                char c = d[p++];
                if (c == '\n')
                {
                    ++line;
                    col = 1;
                }
                else
                {
                    ++col;
                }
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    if (std::isspace((unsigned char)c) || c == ',')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const { throw decl_parse_error(msg, line, col); }
        };

        bool is_digit(char c) { return c >= '0' && c <= '9'; }
        bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
        bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#'; }

        form_ptr make_form(form_data d, int line, int col) { return std::make_shared<form>(form{std::move(d), line, col}); }

        form_ptr read_value(reader &r);

        form_ptr read_seq(reader &r, char end, int sl, int sc)
        {
            std::vector<form_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(read_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                throw decl_parse_error("unterminated collection", sl, sc);
            if (end == ')')
                return make_form(form_list{std::move(elems)}, sl, sc);
            return make_form(form_vector{std::move(elems)}, sl, sc);
        }

        form_ptr read_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get();
            std::string out;
            for (;;)
            {
                if (r.eof())
                    throw decl_parse_error("unterminated string", sl, sc);
                char c = r.get();
                if (c == '"')
                    break;
                if (c != '\\')
                {
                    out += c;
                    continue;
                }
                char e = r.get();
                switch (e)
                {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case '\0':
                    throw decl_parse_error("bad escape", sl, sc);
                default:
                    out += e;
                    break;
                }
            }
            return make_form(std::move(out), sl, sc);
        }

        form_ptr read_number(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            try
            {
                if (is_float)
                    return make_form(std::stod(num), sl, sc);
                return make_form((int64_t)std::stoll(num), sl, sc);
            }
            catch (const std::logic_error &)
            {
                throw decl_parse_error("invalid number '" + num + "'", sl, sc);
            }
        }

        form_ptr read_atom(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':')
            {
                kw = true;
                r.get();
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            if (s.empty())
                r.fail("empty symbol");
            if (kw)
                return make_form(keyword{s}, sl, sc);
            if (s == "nil")
                return make_form(std::monostate{}, sl, sc);
            if (s == "true")
                return make_form(true, sl, sc);
            if (s == "false")
                return make_form(false, sl, sc);
            return make_form(symbol{s}, sl, sc);
        }

        form_ptr read_value(reader &r)
        {
            r.skip_ws();
            char c = r.peek();
            int sl = r.line, sc = r.col;
            switch (c)
            {
            case '"':
                return read_string(r);
            case '(':
                r.get();
                return read_seq(r, ')', sl, sc);
            case '[':
                r.get();
                return read_seq(r, ']', sl, sc);
            case '\0':
                r.fail("unexpected end of input");
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
                return read_number(r);
            if (c == ':' || is_symbol_start(c))
                return read_atom(r);
            r.fail(std::string("unexpected character '") + c + "'");
        }
    } // namespace

    form_ptr read_form(std::string_view src)
    {
        reader r(src);
        auto v = read_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("unexpected trailing characters");
        return v;
    }

    std::string to_string(const form &f)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string join(const std::vector<form_ptr> &elems, char open, char close) const
            {
                std::string out(1, open);
                for (size_t i = 0; i < elems.size(); ++i)
                {
                    if (i)
                        out += ' ';
                    out += to_string(elems[i]);
                }
                out += close;
                return out;
            }
            std::string operator()(const form_list &l) const { return join(l.elems, '(', ')'); }
            std::string operator()(const form_vector &v) const { return join(v.elems, '[', ']'); }
        };
        return std::visit(V{}, f.data);
    }

} // namespace rlink
