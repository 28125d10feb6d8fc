#include "rlink/local/local_engine.hpp"
#include "rlink/env.hpp"
#include "grammar.hpp"
#include <cstdio>
#include <string>

namespace rlink {

namespace {

struct parsed_arg {
    enum class kind { identifier, number, string } k;
    std::string text;
};

struct parsed_statement {
    std::vector<std::string> targets;
    bool is_call = false;
    bool is_clear = false;
    std::string callee;
    std::vector<parsed_arg> args;
    std::string source;
    std::vector<std::string> clear_names;
};

template <typename Rule> struct action : tao::pegtl::nothing<Rule> {};

template <> struct action<grammar::target_name> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.targets.push_back(in.string()); }
};
template <> struct action<grammar::callee> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.callee = in.string(); s.is_call = true; }
};
template <> struct action<grammar::arg_identifier> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.args.push_back({parsed_arg::kind::identifier, in.string()}); }
};
template <> struct action<grammar::arg_number> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.args.push_back({parsed_arg::kind::number, in.string()}); }
};
template <> struct action<grammar::arg_string> {
    template <typename In> static void apply(const In& in, parsed_statement& s){
        std::string raw = in.string();
        std::string text;
        // strip the quotes, '' -> '
        for(size_t i=1;i+1<raw.size(); ++i){
            text += raw[i];
            if(raw[i]=='\'') ++i;
        }
        s.args.push_back({parsed_arg::kind::string, text});
    }
};
template <> struct action<grammar::source_identifier> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.source = in.string(); }
};
template <> struct action<grammar::clear_kw> {
    template <typename In> static void apply(const In&, parsed_statement& s){ s.is_clear = true; }
};
template <> struct action<grammar::clear_name> {
    template <typename In> static void apply(const In& in, parsed_statement& s){ s.clear_names.push_back(in.string()); }
};

template <typename Rule>
parsed_statement parse_text(const std::string& text, const char* what){
    parsed_statement st;
    tao::pegtl::memory_input<> in(text, what);
    if(!tao::pegtl::parse<Rule, action>(in, st))
        throw invocation_error(std::string("Parse error in ") + what + ": " + text);
    return st;
}

std::string describe_call(const std::string& name, const std::vector<value_ptr>& args){
    std::string out = name + "(";
    for(size_t i=0;i<args.size(); ++i){
        if(i) out += ", ";
        out += to_string(args[i]);
    }
    return out + ")";
}

} // namespace

LocalEngine::LocalEngine(std::string cwd) : cwd_(std::move(cwd)) {}

void LocalEngine::define(const std::string& name, NativeFunction fn){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    path_functions_[name] = std::move(fn);
}

void LocalEngine::define_in(const std::string& directory, const std::string& name, NativeFunction fn){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    dir_functions_[directory][name] = std::move(fn);
}

void LocalEngine::set_failure_hook(FailureHook hook){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    hook_ = std::move(hook);
}

std::vector<value_ptr> LocalEngine::invoke_and_wait(Invocation& task){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    ++tasks_;
    return task.call(*this);
}

void LocalEngine::record(const std::string& op, const std::string& detail){
    calls_.push_back({op, detail});
    if(trace_enabled()) std::fprintf(stderr, "[rlink][local] %s %s\n", op.c_str(), detail.c_str());
    if(hook_){
        FailureHook hook = hook_;
        hook(op, detail);
    }
}

std::vector<value_ptr> LocalEngine::call_builtin(const std::string& name, const std::vector<value_ptr>& args, bool& found){
    found = true;
    if(name == "pwd"){
        if(!args.empty()) throw invocation_error("Too many input arguments for pwd");
        return {v_str(cwd_)};
    }
    if(name == "cd"){
        const std::string* dir = (args.size()==1 && args[0]) ? std::get_if<std::string>(&args[0]->data) : nullptr;
        if(!dir) throw invocation_error("cd expects one directory name");
        cwd_ = *dir;
        return {};
    }
    if(name == "clear"){
        for(auto &a: args){
            const std::string* n = a ? std::get_if<std::string>(&a->data) : nullptr;
            if(!n) throw invocation_error("clear expects variable names");
            vars_.erase(*n);
        }
        if(args.empty()) vars_.clear();
        return {};
    }
    if(name == "who"){
        std::vector<std::string> names;
        for(auto &kv: vars_) names.push_back(kv.first);
        return {v_strings(names)};
    }
    found = false;
    return {};
}

std::vector<value_ptr> LocalEngine::call_function(const std::string& name, const std::vector<value_ptr>& args, int nargout){
    bool builtin = false;
    auto out = call_builtin(name, args, builtin);
    if(!builtin){
        NativeFunction fn;
        if(auto d = dir_functions_.find(cwd_); d != dir_functions_.end()){
            if(auto f = d->second.find(name); f != d->second.end()) fn = f->second;
        }
        if(!fn){
            if(auto f = path_functions_.find(name); f != path_functions_.end()) fn = f->second;
        }
        if(!fn) throw invocation_error("Undefined function '" + name + "'");
        out = fn(args, nargout);
    }
    if(out.size() < static_cast<size_t>(nargout))
        throw invocation_error("Too many output arguments for " + name);
    out.resize(static_cast<size_t>(nargout));
    return out;
}

static std::vector<value_ptr> argument_values(const std::vector<parsed_arg>& args, const std::map<std::string, value_ptr>& vars){
    std::vector<value_ptr> out;
    for(auto &a: args){
        switch(a.k){
        case parsed_arg::kind::number: out.push_back(v_f64(std::stod(a.text))); break;
        case parsed_arg::kind::string: out.push_back(v_str(a.text)); break;
        case parsed_arg::kind::identifier: {
            auto it = vars.find(a.text);
            if(it == vars.end()) throw invocation_error("Undefined variable '" + a.text + "'");
            out.push_back(it->second);
            break;
        }
        }
    }
    return out;
}

void LocalEngine::eval(const std::string& statement){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("eval", statement);
    auto st = parse_text<grammar::statement>(statement, "statement");

    if(st.is_clear){
        if(st.clear_names.empty()) vars_.clear();
        for(auto &n: st.clear_names) vars_.erase(n);
        return;
    }
    if(st.targets.empty()){
        call_function(st.callee, argument_values(st.args, vars_), 0);
        return;
    }
    std::vector<value_ptr> results;
    if(st.is_call) results = call_function(st.callee, argument_values(st.args, vars_), static_cast<int>(st.targets.size()));
    else {
        if(st.targets.size() != 1) throw invocation_error("Too many output arguments: " + statement);
        auto it = vars_.find(st.source);
        if(it == vars_.end()) throw invocation_error("Undefined variable '" + st.source + "'");
        results.push_back(it->second);
    }
    for(size_t i=0;i<st.targets.size(); ++i) vars_[st.targets[i]] = results[i];
}

std::vector<value_ptr> LocalEngine::returning_eval(const std::string& expression, int nargout){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("returning_eval", expression);
    auto st = parse_text<grammar::expression>(expression, "expression");
    if(st.is_call) return call_function(st.callee, argument_values(st.args, vars_), nargout);
    if(nargout > 1) throw invocation_error("Too many output arguments: " + expression);
    auto it = vars_.find(st.source);
    if(it != vars_.end()) return std::vector<value_ptr>(static_cast<size_t>(nargout), it->second);
    // A bare name may also be a function called without arguments
    return call_function(st.source, {}, nargout);
}

void LocalEngine::feval(const std::string& name, const std::vector<value_ptr>& args){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("feval", describe_call(name, args));
    call_function(name, args, 0);
}

std::vector<value_ptr> LocalEngine::returning_feval(const std::string& name, int nargout, const std::vector<value_ptr>& args){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("returning_feval", describe_call(name, args));
    return call_function(name, args, nargout);
}

void LocalEngine::set_variable(const std::string& name, const value_ptr& v){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("set_variable", name);
    vars_[name] = v;
}

value_ptr LocalEngine::get_variable(const std::string& name){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("get_variable", name);
    auto it = vars_.find(name);
    if(it == vars_.end()) throw invocation_error("Undefined variable '" + name + "'");
    return it->second;
}

std::set<std::string> LocalEngine::who(){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    record("who", "");
    std::set<std::string> out;
    for(auto &kv: vars_) out.insert(kv.first);
    return out;
}

std::vector<LocalEngine::CallRecord> LocalEngine::calls() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return calls_;
}

std::vector<std::string> LocalEngine::statements() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    std::vector<std::string> out;
    for(auto &c: calls_) if(c.op == "eval") out.push_back(c.detail);
    return out;
}

void LocalEngine::clear_calls(){
    std::lock_guard<std::recursive_mutex> lk(mu_);
    calls_.clear();
}

std::string LocalEngine::cwd() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return cwd_;
}

bool LocalEngine::has_variable(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return vars_.count(name) != 0;
}

std::size_t LocalEngine::variable_count() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return vars_.size();
}

std::size_t LocalEngine::task_count() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return tasks_;
}

} // namespace rlink
