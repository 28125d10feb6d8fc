#include "rlink/linker.hpp"
#include "rlink/coerce.hpp"
#include "rlink/diagnostics_json.hpp"
#include "rlink/env.hpp"
#include "rlink/invocation.hpp"
#include "rlink/link_checker.hpp"
#include "rlink/script_resolver.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace rlink {

LinkOptions LinkOptions::from_env(){
    LinkEnv env = detect_env();
    LinkOptions o;
    o.scriptExtension = env.scriptExtension;
    o.tempDir = env.tempDir;
    o.diagJson = env.diagJson;
    return o;
}

LinkResult Linker::check(const std::vector<FunctionDecl>& decls, const ScriptOrigin& origin,
                         const BridgedTypeRegistry& registry, const LinkOptions& options){
    TypeContext ctx;
    ScriptResolver resolver(origin, options.scriptExtension, options.tempDir);
    LinkChecker checker(ctx, registry, resolver);
    LinkResult r;
    auto descs = checker.check(decls, r);
    if(trace_enabled()){
        for(auto &d: descs) std::fprintf(stderr, "[rlink][check] %s\n", describe(d, ctx).c_str());
    }
    return r;
}

std::shared_ptr<Linker> Linker::link(const std::vector<FunctionDecl>& decls, std::shared_ptr<Engine> engine,
                                     ScriptOrigin origin, BridgedTypeRegistry registry, LinkOptions options){
    if(!engine) throw linking_error("no engine to link against");
    std::shared_ptr<Linker> linker(new Linker(std::move(engine), std::move(registry)));

    ScriptResolver resolver(std::move(origin), options.scriptExtension, options.tempDir);
    LinkChecker checker(linker->types_, linker->registry_, resolver);
    LinkResult r;
    auto descs = checker.check(decls, r);
    if(options.diagJson && (!r.errors.empty() || !r.warnings.empty()))
        std::fprintf(stderr, "%s\n", diagnostics_to_json(r).c_str());
    if(!r.success) throw linking_error(std::move(r));

    for(auto &d: descs){
        if(trace_enabled()) std::fprintf(stderr, "[rlink][link] %s\n", describe(d, linker->types_).c_str());
        std::string id = d.id;
        linker->descriptors_.emplace(std::move(id), std::move(d));
    }
    linker->diagnostics_ = std::move(r);
    return linker;
}

const BindingDescriptor& Linker::descriptor(const std::string& id) const {
    auto it = descriptors_.find(id);
    if(it == descriptors_.end()) throw linking_error("no function linked as " + id);
    return it->second;
}

std::vector<std::string> Linker::ids() const {
    std::vector<std::string> out;
    for(auto &kv: descriptors_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void Linker::check_arguments(const BindingDescriptor& d, const std::vector<value_ptr>& args) const {
    if(args.size() != d.parameter_types.size())
        throw std::invalid_argument(d.id + " expects " + std::to_string(d.parameter_types.size()) +
                                    " arguments, got " + std::to_string(args.size()));
    ReturnCoercer compat(types_);
    for(size_t i=0;i<args.size(); ++i){
        TypeId t = d.parameter_types[i];
        if(!types_.is_bridged(t)) continue;
        if(!args[i] || !compat.assignable(*args[i], t))
            throw std::invalid_argument(d.id + " argument " + std::to_string(i) + " must be " + types_.to_string(t) +
                                        ", got " + runtime_type_name(args[i]));
    }
}

static bool holds_bridged(const std::vector<value_ptr>& args){
    return std::any_of(args.begin(), args.end(), [](const value_ptr& a){
        return a && std::holds_alternative<bridged_ptr>(a->data);
    });
}

value_ptr Linker::invoke(const std::string& id, std::vector<value_ptr> args) const {
    const BindingDescriptor& d = descriptor(id);
    check_arguments(d, args);

    std::vector<value_ptr> raw;
    // A bridged object passed where the declaration allows any value still needs its setter
    if(d.uses_bridged_types || holds_bridged(args)){
        CustomInvocation task(d, types_, registry_, std::move(args));
        raw = engine_->invoke_and_wait(task);
        raw = task.finish(std::move(raw));
    } else {
        StandardInvocation task(d, std::move(args));
        raw = engine_->invoke_and_wait(task);
    }
    return ReturnCoercer(types_).coerce(d, raw);
}

} // namespace rlink
