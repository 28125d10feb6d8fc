// Error conditions raised by linking and invocation
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace rlink {

struct DiagNote { std::string message; int line=-1; int col=-1; };
struct LinkDiagnostic { std::string code; std::string message; std::string hint; std::string function; int line=-1; int col=-1; std::vector<DiagNote> notes; };

struct LinkResult { bool success=true; std::vector<LinkDiagnostic> errors; std::vector<LinkDiagnostic> warnings; };

// Central reporter so the checker and the resolver share formatting
struct ErrorReporter {
    LinkResult* result=nullptr;
    void emit_error(const LinkDiagnostic& e){ if(result){ result->errors.push_back(e); result->success=false; } }
    void emit_warning(const LinkDiagnostic& w){ if(result) result->warnings.push_back(w); }
    LinkDiagnostic make(std::string code, std::string function, std::string message, std::string hint, int line, int col){
        return LinkDiagnostic{std::move(code),std::move(message),std::move(hint),std::move(function),line,col,{}};
    }
};

// One line per error: "E2001 f: message (hint)"
std::string format_diagnostics(const LinkResult& r);

// Raised once by Linker::link when any declaration of the binding set is invalid.
class linking_error : public std::runtime_error {
public:
    explicit linking_error(const std::string& msg) : std::runtime_error(msg) {}
    explicit linking_error(LinkResult r) : std::runtime_error("binding set failed to link\n" + format_diagnostics(r)), result_(std::move(r)) {}
    const LinkResult& result() const { return result_; }
private:
    LinkResult result_;
};

// Raised by the engine channel; propagated verbatim.
struct invocation_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Remote result does not fit the declared return type.
class incompatible_return_error : public std::runtime_error {
public:
    explicit incompatible_return_error(const std::string& msg) : std::runtime_error(msg) {}
    incompatible_return_error(const std::string& required, const std::string& returned)
        : std::runtime_error("Required return type is incompatible with the type actually returned\n"
                             "Required type: " + required + "\n"
                             "Returned type: " + returned),
          required_(required), returned_(returned) {}
    const std::string& required_type() const { return required_; }
    const std::string& returned_type() const { return returned_; }
private:
    std::string required_;
    std::string returned_;
};

} // namespace rlink
