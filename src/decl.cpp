#include "rlink/decl.hpp"
#include "rlink/form.hpp"
#include <limits>

namespace rlink {

static std::vector<std::string> forms_text(const form_ptr& v, const char* kw){
    auto* vec = v ? as_vector(*v) : nullptr;
    if(!vec) throw decl_parse_error(std::string(":") + kw + " expects a vector", v ? v->line : -1, v ? v->col : -1);
    std::vector<std::string> out;
    for(auto &e: vec->elems) out.push_back(to_string(e));
    return out;
}

static FunctionDecl parse_fn(const form& n){
    auto &l = as_list(n)->elems;
    FunctionDecl d; d.line = n.line; d.col = n.col;
    for(size_t j=1;j<l.size(); ++j){
        if(!l[j] || !is_keyword(*l[j])) throw decl_parse_error("expected keyword in fn", l[j]->line, l[j]->col);
        std::string kw = std::get<keyword>(l[j]->data).name;
        if(++j>=l.size()) throw decl_parse_error(":" + kw + " missing value", n.line, n.col);
        auto val = l[j];
        if(kw=="id") d.id = text_of(val);
        else if(kw=="name") d.name = text_of(val);
        else if(kw=="absolute-path") d.absolutePath = text_of(val);
        else if(kw=="relative-path") d.relativePath = text_of(val);
        else if(kw=="nargout"){
            auto* i = std::get_if<int64_t>(&val->data);
            if(!i) throw decl_parse_error(":nargout expects an integer", val->line, val->col);
            if(*i < std::numeric_limits<int>::min() || *i > std::numeric_limits<int>::max())
                throw decl_parse_error(":nargout out of range", val->line, val->col);
            d.nargout = static_cast<int>(*i);
        }
        else if(kw=="ret") d.ret = to_string(val);
        else if(kw=="returns") d.returns = forms_text(val, "returns");
        else if(kw=="params") d.params = forms_text(val, "params");
        else if(kw=="throws") d.throws = forms_text(val, "throws");
        else throw decl_parse_error("unknown fn keyword :" + kw, l[j-1]->line, l[j-1]->col);
    }
    // Default the identifier to the bare name or the script file stem
    if(d.id.empty()){
        std::string loc = !d.name.empty() ? d.name : !d.absolutePath.empty() ? d.absolutePath : d.relativePath;
        auto slash = loc.find_last_of("/\\");
        if(slash != std::string::npos) loc = loc.substr(slash+1);
        auto dot = loc.rfind('.');
        if(dot != std::string::npos && dot > 0) loc = loc.substr(0, dot);
        d.id = loc;
    }
    return d;
}

std::vector<FunctionDecl> parse_bindings(std::string_view src){
    auto root = read_form(src);
    auto* l = as_list(*root);
    if(!l || l->elems.empty() || text_of(l->elems[0]) != "bindings" || !is_symbol(*l->elems[0]))
        throw decl_parse_error("expected (bindings ...)", root->line, root->col);
    std::vector<FunctionDecl> out;
    for(size_t i=1;i<l->elems.size(); ++i){
        auto &n = l->elems[i];
        auto* fl = as_list(*n);
        if(!fl || fl->elems.empty() || !is_symbol(*fl->elems[0]) || text_of(fl->elems[0]) != "fn")
            throw decl_parse_error("expected (fn ...) in bindings", n->line, n->col);
        out.push_back(parse_fn(*n));
    }
    return out;
}

} // namespace rlink
