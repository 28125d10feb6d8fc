// Link-time validation of declared call contracts
#pragma once
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "rlink/bridged.hpp"
#include "rlink/decl.hpp"
#include "rlink/descriptor.hpp"
#include "rlink/errors.hpp"
#include "rlink/script_resolver.hpp"
#include "rlink/types.hpp"

namespace rlink {

class LinkChecker {
public:
    LinkChecker(TypeContext& ctx, const BridgedTypeRegistry& registry, ScriptResolver& resolver)
        : ctx_(ctx), registry_(registry), resolver_(resolver) {}

    // Validate every declaration. Descriptors are returned only for declarations that
    // passed; callers must treat any error in `r` as fatal for the whole set.
    std::vector<BindingDescriptor> check(const std::vector<FunctionDecl>& decls, LinkResult& r);

private:
    std::optional<BindingDescriptor> check_decl(const FunctionDecl& d, ErrorReporter& rep);
    bool check_location(const FunctionDecl& d, ErrorReporter& rep);
    bool check_return(const FunctionDecl& d, TypeId ret, const std::vector<TypeId>& explicitReturns, ErrorReporter& rep);
    bool check_throws(const FunctionDecl& d, ErrorReporter& rep);
    std::optional<TypeId> parse(const FunctionDecl& d, const std::string& text, const std::string& role, ErrorReporter& rep);
    bool check_registered(const FunctionDecl& d, TypeId t, const std::string& role, ErrorReporter& rep);
    void error_code(ErrorReporter& rep, const FunctionDecl& d, std::string code, std::string msg, std::string hint = "");

    TypeContext& ctx_;
    const BridgedTypeRegistry& registry_;
    ScriptResolver& resolver_;
    std::unordered_set<std::string> seen_ids_;
};

// Per-position return types: [ret] for nargout 0/1, the array component repeated for
// nargout > 1 without explicit types, the explicit types otherwise.
std::vector<TypeId> derive_return_types(const TypeContext& ctx, TypeId ret, int nargout, const std::vector<TypeId>& explicitReturns);

} // namespace rlink
