// The two remote invocation protocols
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "rlink/bridged.hpp"
#include "rlink/descriptor.hpp"
#include "rlink/engine.hpp"
#include "rlink/types.hpp"

namespace rlink {

// Switch to `dir` unless the session is already there. Returns the directory to restore.
std::optional<std::string> enter_directory(Session& session, const std::optional<std::string>& dir);
void restore_directory(Session& session, const std::string& dir);

// Native call-by-name with positional arguments.
class StandardInvocation final : public Invocation {
public:
    StandardInvocation(const BindingDescriptor& desc, std::vector<value_ptr> args)
        : desc_(desc), args_(std::move(args)) {}
    std::vector<value_ptr> call(Session& session) override;

private:
    const BindingDescriptor& desc_;
    std::vector<value_ptr> args_;
};

// Arguments bound to generated remote variables, one generated call statement, results read
// back through variables or bridged getters, generated names always cleared.
class CustomInvocation final : public Invocation {
public:
    CustomInvocation(const BindingDescriptor& desc, const TypeContext& ctx, const BridgedTypeRegistry& registry,
                     std::vector<value_ptr> args)
        : desc_(desc), ctx_(ctx), registry_(registry), args_(std::move(args)) {}

    std::vector<value_ptr> call(Session& session) override;

    // Deserialize pending bridged getters into `raw`. Runs after the engine task completed.
    std::vector<value_ptr> finish(std::vector<value_ptr> raw);

    const std::vector<std::string>& generated_names() const { return names_; }
    const std::string& statement() const { return statement_; }

private:
    std::vector<value_ptr> run(Session& session);
    void bind_argument(Session& session, std::size_t i, const std::string& name);

    const BindingDescriptor& desc_;
    const TypeContext& ctx_;
    const BridgedTypeRegistry& registry_;
    std::vector<value_ptr> args_;
    std::vector<std::string> names_;
    std::string statement_;
    std::vector<std::unique_ptr<SerializedGetter>> pending_;
};

} // namespace rlink
