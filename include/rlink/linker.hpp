// Binding set: link once, then dispatch calls by identifier
#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "rlink/bridged.hpp"
#include "rlink/decl.hpp"
#include "rlink/descriptor.hpp"
#include "rlink/engine.hpp"
#include "rlink/errors.hpp"
#include "rlink/types.hpp"

namespace rlink {

struct LinkOptions {
    std::string scriptExtension = ".m";
    std::string tempDir;       // base for extracted scripts; empty = system temporary directory
    bool diagJson = false;     // print diagnostics as JSON when linking fails

    // Defaults from RLINK_SCRIPT_EXT, RLINK_TMPDIR and RLINK_DIAG_JSON.
    static LinkOptions from_env();
};

template <typename Sig> class Function;

class Linker : public std::enable_shared_from_this<Linker> {
public:
    // Validate and resolve every declaration. Throws linking_error carrying all diagnostics if
    // any declaration is invalid; nothing of a failed set can be called.
    static std::shared_ptr<Linker> link(const std::vector<FunctionDecl>& decls, std::shared_ptr<Engine> engine,
                                        ScriptOrigin origin = {}, BridgedTypeRegistry registry = {},
                                        LinkOptions options = LinkOptions::from_env());

    // Diagnostics only; nothing is thrown for invalid declarations. Relative paths of an
    // archive origin are still extracted (see remove_extracted_scripts).
    static LinkResult check(const std::vector<FunctionDecl>& decls, const ScriptOrigin& origin,
                            const BridgedTypeRegistry& registry, const LinkOptions& options = LinkOptions::from_env());

    // Dispatch one call. Throws std::invalid_argument for a wrong argument count or a bridged
    // parameter given the wrong kind of value, linking_error for an unknown id, invocation_error
    // from the engine and incompatible_return_error from coercion.
    value_ptr invoke(const std::string& id, std::vector<value_ptr> args) const;

    // Typed adapter, defined in rlink/typed.hpp.
    template <typename Sig>
    Function<Sig> bind(const std::string& id) const;

    const BindingDescriptor& descriptor(const std::string& id) const;
    bool contains(const std::string& id) const { return descriptors_.count(id) != 0; }
    std::vector<std::string> ids() const;
    const TypeContext& types() const { return types_; }
    const LinkResult& diagnostics() const { return diagnostics_; }

private:
    Linker(std::shared_ptr<Engine> engine, BridgedTypeRegistry registry)
        : engine_(std::move(engine)), registry_(std::move(registry)) {}

    template <typename R, typename... Args>
    Function<R(Args...)> bind_checked(R (*)(Args...), const std::string& id) const;

    void check_arguments(const BindingDescriptor& d, const std::vector<value_ptr>& args) const;

    std::shared_ptr<Engine> engine_;
    BridgedTypeRegistry registry_;
    TypeContext types_;
    std::unordered_map<std::string, BindingDescriptor> descriptors_;
    LinkResult diagnostics_;
};

} // namespace rlink
