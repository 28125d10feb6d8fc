// Boundary with the remote engine channel
#pragma once
#include <set>
#include <string>
#include <vector>
#include "rlink/value.hpp"

namespace rlink {

// Engine-thread view of the remote engine. Every operation may throw invocation_error;
// rlink never interprets or retries it.
class Session {
public:
    virtual ~Session() = default;

    virtual void eval(const std::string& statement) = 0;
    virtual std::vector<value_ptr> returning_eval(const std::string& expression, int nargout) = 0;
    virtual void feval(const std::string& name, const std::vector<value_ptr>& args) = 0;
    virtual std::vector<value_ptr> returning_feval(const std::string& name, int nargout, const std::vector<value_ptr>& args) = 0;
    virtual void set_variable(const std::string& name, const value_ptr& v) = 0;
    virtual value_ptr get_variable(const std::string& name) = 0;
    // Names currently bound in the remote namespace.
    virtual std::set<std::string> who() = 0;
};

// One unit of work executed atomically on the engine.
class Invocation {
public:
    virtual ~Invocation() = default;
    virtual std::vector<value_ptr> call(Session& session) = 0;
};

// The channel: serializes invocations onto the single remote context and blocks until done.
class Engine {
public:
    virtual ~Engine() = default;
    virtual std::vector<value_ptr> invoke_and_wait(Invocation& task) = 0;
};

} // namespace rlink
