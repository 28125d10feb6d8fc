#include "rlink/link_checker.hpp"
#include <algorithm>

namespace rlink {

void LinkChecker::error_code(ErrorReporter& rep, const FunctionDecl& d, std::string code, std::string msg, std::string hint){
    rep.emit_error(rep.make(std::move(code), d.id, std::move(msg), std::move(hint), d.line, d.col));
}

std::vector<TypeId> derive_return_types(const TypeContext& ctx, TypeId ret, int nargout, const std::vector<TypeId>& explicitReturns){
    if(nargout == 0 || nargout == 1) return {ret};
    if(explicitReturns.empty()) return std::vector<TypeId>(static_cast<size_t>(nargout), ctx.at(ret).elem);
    return explicitReturns;
}

std::vector<BindingDescriptor> LinkChecker::check(const std::vector<FunctionDecl>& decls, LinkResult& r){
    ErrorReporter rep{&r};
    seen_ids_.clear();
    std::vector<BindingDescriptor> out;
    for(auto &d: decls){
        if(auto desc = check_decl(d, rep)) out.push_back(std::move(*desc));
    }
    return out;
}

std::optional<TypeId> LinkChecker::parse(const FunctionDecl& d, const std::string& text, const std::string& role, ErrorReporter& rep){
    try { return ctx_.parse_type(text); }
    catch(const decl_parse_error& ex){
        auto e = rep.make("E2050", d.id, "invalid " + role + " type: " + text, "", d.line, d.col);
        e.notes.push_back({ex.what(), -1, -1});
        rep.emit_error(e);
        return std::nullopt;
    }
}

// Every named bridged type, including array components, must be registered. Variable is built in.
bool LinkChecker::check_registered(const FunctionDecl& d, TypeId t, const std::string& role, ErrorReporter& rep){
    const Type* ty = &ctx_.at(t);
    while(ty->kind == Type::Kind::Array) ty = &ctx_.at(ty->elem);
    if(ty->kind != Type::Kind::Bridged || registry_.contains(ty->bridged_name)) return true;
    error_code(rep, d, "E2051", role + " uses unregistered bridged type " + ty->bridged_name,
               "register it with BridgedTypeRegistry::register_type");
    return false;
}

bool LinkChecker::check_location(const FunctionDecl& d, ErrorReporter& rep){
    int given = int(!d.name.empty()) + int(!d.absolutePath.empty()) + int(!d.relativePath.empty());
    if(given != 1){
        error_code(rep, d, "E2001", "declaration must specify exactly one of :name, :absolute-path or :relative-path",
                   given == 0 ? "add :name for a function on the remote search path" : "remove the extra location");
        return false;
    }
    return true;
}

bool LinkChecker::check_return(const FunctionDecl& d, TypeId ret, const std::vector<TypeId>& explicitReturns, ErrorReporter& rep){
    if(d.nargout < 0){
        error_code(rep, d, "E2020", "negative nargout of " + std::to_string(d.nargout), "nargout must be 0 or greater");
        return false;
    }
    const Type& rt = ctx_.at(ret);
    if(rt.kind == Type::Kind::Variable){
        error_code(rep, d, "E2023", "variable cannot be a return type");
        return false;
    }
    if(rt.kind == Type::Kind::Void && d.nargout != 0){
        error_code(rep, d, "E2021", "void return type with non-zero nargout " + std::to_string(d.nargout), "set :nargout 0 or declare :ret");
        return false;
    }
    if(rt.kind != Type::Kind::Void && d.nargout == 0){
        error_code(rep, d, "E2022", "non-void return type " + ctx_.to_string(ret) + " with nargout 0", "set :nargout to the number of returned values");
        return false;
    }

    if(!explicitReturns.empty()){
        bool untypedArray = rt.kind == Type::Kind::Array && ctx_.at(rt.elem).kind == Type::Kind::Any;
        if(!untypedArray && rt.kind != Type::Kind::Tuple){
            error_code(rep, d, "E2030", ":returns given but the return type is " + ctx_.to_string(ret),
                       "declare :ret (array any) or (tuple N)");
            return false;
        }
        if(explicitReturns.size() != static_cast<size_t>(d.nargout)){
            auto e = rep.make("E2031", d.id, "differing amount of return values between nargout and :returns", "", d.line, d.col);
            e.notes.push_back({"nargout: " + std::to_string(d.nargout), -1, -1});
            e.notes.push_back({"number of :returns: " + std::to_string(explicitReturns.size()), -1, -1});
            rep.emit_error(e);
            return false;
        }
        for(auto t: explicitReturns){
            if(ctx_.is_primitive(t)){
                error_code(rep, d, "E2032", "primitive type " + ctx_.to_string(t) + " in :returns",
                           "use (scalar " + ctx_.to_string(t) + ") instead");
                return false;
            }
            if(ctx_.at(t).kind == Type::Kind::Variable){
                error_code(rep, d, "E2023", "variable cannot be a return type");
                return false;
            }
        }
    }

    if(rt.kind == Type::Kind::Tuple){
        if(explicitReturns.size() != rt.arity){
            error_code(rep, d, "E2033", "return type " + ctx_.to_string(ret) + " needs " + std::to_string(rt.arity) +
                       " :returns but has " + std::to_string(explicitReturns.size()));
            return false;
        }
        if(rt.arity != static_cast<uint32_t>(d.nargout)){
            error_code(rep, d, "E2034", "return type " + ctx_.to_string(ret) + " with nargout " + std::to_string(d.nargout));
            return false;
        }
    }
    else if(d.nargout > 1 && rt.kind != Type::Kind::Array){
        error_code(rep, d, "E2035", "nargout " + std::to_string(d.nargout) + " requires an array or (tuple N) return type, not " +
                   ctx_.to_string(ret));
        return false;
    }
    return true;
}

bool LinkChecker::check_throws(const FunctionDecl& d, ErrorReporter& rep){
    if(std::find(d.throws.begin(), d.throws.end(), kInvocationFailure) != d.throws.end()) return true;
    error_code(rep, d, "E2040", "declaration does not list invocation-failure in :throws",
               "add :throws [invocation-failure]");
    return false;
}

std::optional<BindingDescriptor> LinkChecker::check_decl(const FunctionDecl& d, ErrorReporter& rep){
    bool ok = true;
    if(d.id.empty()){
        error_code(rep, d, "E2003", "declaration has an empty call identifier", "add :id");
        ok = false;
    } else if(!seen_ids_.insert(d.id).second){
        error_code(rep, d, "E2002", "duplicate call identifier " + d.id);
        ok = false;
    }
    ok = check_location(d, rep) && ok;

    // Types
    auto ret = parse(d, d.ret, "return", rep);
    std::vector<TypeId> params, explicitReturns;
    bool typesOk = ret.has_value();
    for(size_t i=0;i<d.params.size(); ++i){
        auto p = parse(d, d.params[i], "parameter " + std::to_string(i), rep);
        if(!p){ typesOk = false; continue; }
        if(ctx_.is_void(*p) || ctx_.is_tuple(*p)){
            error_code(rep, d, "E2050", "parameter " + std::to_string(i) + " cannot have type " + ctx_.to_string(*p));
            typesOk = false;
            continue;
        }
        typesOk = check_registered(d, *p, "parameter " + std::to_string(i), rep) && typesOk;
        params.push_back(*p);
    }
    for(auto &text: d.returns){
        auto t = parse(d, text, "return", rep);
        if(!t){ typesOk = false; continue; }
        explicitReturns.push_back(*t);
    }
    if(!typesOk){ check_throws(d, rep); return std::nullopt; }

    ok = check_return(d, *ret, explicitReturns, rep) && ok;
    ok = check_throws(d, rep) && ok;
    if(!ok) return std::nullopt;

    if(d.nargout == 1 && !explicitReturns.empty()){
        rep.emit_warning(rep.make("W2101", d.id, ":returns is ignored for nargout 1",
                                  "the single value is coerced to " + ctx_.to_string(*ret), d.line, d.col));
    }

    BindingDescriptor desc;
    desc.id = d.id;
    desc.nargout = d.nargout;
    desc.result_type = *ret;
    desc.parameter_types = params;
    desc.return_types = derive_return_types(ctx_, *ret, d.nargout, explicitReturns);

    for(size_t i=0;i<desc.return_types.size(); ++i){
        TypeId t = desc.return_types[i];
        std::string role = "return " + std::to_string(i);
        if(!check_registered(d, t, role, rep)){ ok = false; continue; }
        const Type& ty = ctx_.at(t);
        if(ty.kind == Type::Kind::Bridged && !registry_.has_getter(ty.bridged_name)){
            error_code(rep, d, "E2052", role + " uses bridged type " + ty.bridged_name + " which has no serialized getter",
                       "register a getter factory for " + ty.bridged_name);
            ok = false;
        }
    }
    if(!ok) return std::nullopt;

    desc.uses_bridged_types =
        std::any_of(params.begin(), params.end(), [&](TypeId t){ return ctx_.is_bridged(t); }) ||
        std::any_of(desc.return_types.begin(), desc.return_types.end(), [&](TypeId t){ return ctx_.is_bridged(t); });

    if(!d.name.empty()){
        desc.name = d.name;
        return desc;
    }
    auto script = resolver_.resolve(d, rep);
    if(!script) return std::nullopt;
    if(script->function_name.empty()){
        error_code(rep, d, "E2003", "script file has an empty function name");
        return std::nullopt;
    }
    desc.name = script->function_name;
    desc.containing_directory = script->directory;
    return desc;
}

} // namespace rlink
