// In-process reference engine: a variable namespace, a working directory and native functions
#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "rlink/engine.hpp"
#include "rlink/errors.hpp"
#include "rlink/value.hpp"

namespace rlink {

// Statement language:
//   [a, b] = f(x, 1.5, 'txt');   a = f(x);   a = b;   f(x);   clear a b
// Identifier arguments read variables; numbers are f64; '' escapes a quote in a string.
class LocalEngine final : public Engine, public Session {
public:
    // Receives the arguments and the number of requested results; returns at least that many values.
    using NativeFunction = std::function<std::vector<value_ptr>(const std::vector<value_ptr>& args, int nargout)>;
    // Runs before every session operation; throw to make the operation fail.
    using FailureHook = std::function<void(const std::string& op, const std::string& detail)>;

    struct CallRecord { std::string op; std::string detail; };

    explicit LocalEngine(std::string cwd = "/");

    // Function on the search path.
    void define(const std::string& name, NativeFunction fn);
    // Function visible only while `directory` is the working directory.
    void define_in(const std::string& directory, const std::string& name, NativeFunction fn);
    void set_failure_hook(FailureHook hook);

    // Engine
    std::vector<value_ptr> invoke_and_wait(Invocation& task) override;

    // Session
    void eval(const std::string& statement) override;
    std::vector<value_ptr> returning_eval(const std::string& expression, int nargout) override;
    void feval(const std::string& name, const std::vector<value_ptr>& args) override;
    std::vector<value_ptr> returning_feval(const std::string& name, int nargout, const std::vector<value_ptr>& args) override;
    void set_variable(const std::string& name, const value_ptr& v) override;
    value_ptr get_variable(const std::string& name) override;
    std::set<std::string> who() override;

    // Inspection
    std::vector<CallRecord> calls() const;
    // Statements passed to eval, in order.
    std::vector<std::string> statements() const;
    void clear_calls();
    std::string cwd() const;
    bool has_variable(const std::string& name) const;
    std::size_t variable_count() const;
    std::size_t task_count() const;

private:
    std::vector<value_ptr> call_function(const std::string& name, const std::vector<value_ptr>& args, int nargout);
    std::vector<value_ptr> call_builtin(const std::string& name, const std::vector<value_ptr>& args, bool& found);
    void record(const std::string& op, const std::string& detail);

    mutable std::recursive_mutex mu_;
    std::string cwd_;
    std::map<std::string, value_ptr> vars_;
    std::map<std::string, NativeFunction> path_functions_;
    std::map<std::string, std::map<std::string, NativeFunction>> dir_functions_;
    FailureHook hook_;
    std::vector<CallRecord> calls_;
    std::size_t tasks_ = 0;
};

} // namespace rlink
