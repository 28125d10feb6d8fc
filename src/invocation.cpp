#include "rlink/invocation.hpp"
#include "rlink/env.hpp"
#include "rlink/errors.hpp"
#include "rlink/names.hpp"
#include <cstdio>
#include <exception>

namespace rlink {

std::optional<std::string> enter_directory(Session& session, const std::optional<std::string>& dir){
    if(!dir) return std::nullopt;
    auto pwd = session.returning_feval("pwd", 1, {});
    const std::string* initial = (!pwd.empty() && pwd[0]) ? std::get_if<std::string>(&pwd[0]->data) : nullptr;
    if(!initial) throw invocation_error("pwd did not return a directory");
    if(*initial == *dir) return std::nullopt;
    if(trace_enabled()) std::fprintf(stderr, "[rlink][dir] cd %s (from %s)\n", dir->c_str(), initial->c_str());
    std::string restore = *initial;
    session.feval("cd", {v_str(*dir)});
    return restore;
}

void restore_directory(Session& session, const std::string& dir){
    if(trace_enabled()) std::fprintf(stderr, "[rlink][dir] cd %s\n", dir.c_str());
    session.feval("cd", {v_str(dir)});
}

// Called from a catch block: keep the active exception unless an earlier one is pending,
// in which case only trace it.
static void keep_first(std::exception_ptr& failure, const char* area, const char* step){
    if(!failure){
        failure = std::current_exception();
        return;
    }
    if(!trace_enabled()) return;
    try { throw; }
    catch(const std::exception& ex){ std::fprintf(stderr, "[rlink][%s] %s failed after earlier failure: %s\n", area, step, ex.what()); }
    catch(...){ std::fprintf(stderr, "[rlink][%s] %s failed after earlier failure: unknown exception\n", area, step); }
}

std::vector<value_ptr> StandardInvocation::call(Session& session){
    auto initial = enter_directory(session, desc_.containing_directory);
    if(trace_enabled())
        std::fprintf(stderr, "[rlink][standard] %s nargin=%zu nargout=%d\n", desc_.name.c_str(), args_.size(), desc_.nargout);
    std::vector<value_ptr> results;
    try {
        if(desc_.nargout == 0) session.feval(desc_.name, args_);
        else results = session.returning_feval(desc_.name, desc_.nargout, args_);
    } catch(...) {
        // The call failure wins over a failure to change back
        if(initial){
            std::exception_ptr failure = std::current_exception();
            try { restore_directory(session, *initial); }
            catch(...) { keep_first(failure, "dir", "restore"); }
        }
        throw;
    }
    if(initial) restore_directory(session, *initial);
    return results;
}

void CustomInvocation::bind_argument(Session& session, std::size_t i, const std::string& name){
    const value_ptr& arg = args_[i];
    const bridged_ptr* b = arg ? std::get_if<bridged_ptr>(&arg->data) : nullptr;
    if(b && *b){
        (*b)->serialized_setter()->set_in(session, name);
        return;
    }
    session.set_variable(name, arg);
}

std::vector<value_ptr> CustomInvocation::run(Session& session){
    auto argNames = generate_names(session, kArgPrefix, args_.size());
    names_ = argNames;
    for(size_t i=0;i<args_.size(); ++i) bind_argument(session, i, argNames[i]);

    std::vector<std::string> retNames;
    if(desc_.nargout != 0){
        retNames = generate_names(session, kRetPrefix, static_cast<size_t>(desc_.nargout));
        names_.insert(names_.end(), retNames.begin(), retNames.end());
    }

    statement_ = build_call_statement(desc_.name, argNames, retNames);
    if(trace_enabled()) std::fprintf(stderr, "[rlink][custom] %s\n", statement_.c_str());
    session.eval(statement_);

    std::vector<value_ptr> results(retNames.size());
    pending_.clear();
    pending_.resize(retNames.size());
    for(size_t i=0;i<retNames.size(); ++i){
        const Type& t = ctx_.at(desc_.return_types[i]);
        if(t.kind == Type::Kind::Bridged){
            auto getter = registry_.create_getter(t.bridged_name);
            getter->get_in(session, retNames[i]);
            pending_[i] = std::move(getter);
        } else {
            results[i] = session.get_variable(retNames[i]);
        }
    }
    return results;
}

std::vector<value_ptr> CustomInvocation::call(Session& session){
    names_.clear();
    statement_.clear();
    auto initial = enter_directory(session, desc_.containing_directory);

    std::exception_ptr failure;
    std::vector<value_ptr> results;
    try { results = run(session); }
    catch(...) { failure = std::current_exception(); }

    // Cleanup runs on every path; the first failure is the one reported
    if(!names_.empty()){
        try { session.eval(build_clear_statement(names_)); }
        catch(...) { keep_first(failure, "custom", "clear"); }
    }
    if(initial){
        try { restore_directory(session, *initial); }
        catch(...) { keep_first(failure, "dir", "restore"); }
    }
    if(failure) std::rethrow_exception(failure);
    return results;
}

std::vector<value_ptr> CustomInvocation::finish(std::vector<value_ptr> raw){
    for(size_t i=0;i<pending_.size() && i<raw.size(); ++i){
        if(pending_[i]) raw[i] = pending_[i]->deserialize();
    }
    pending_.clear();
    return raw;
}

} // namespace rlink
