#include "rlink/bridged.hpp"
#include "grammar.hpp"
#include <stdexcept>

namespace rlink {

bool is_valid_identifier(std::string_view name){
    tao::pegtl::memory_input<> in(name.data(), name.size(), "identifier");
    return tao::pegtl::parse< grammar::identifier_only >(in);
}

namespace {
class RemoteVariableSetter final : public SerializedSetter {
public:
    explicit RemoteVariableSetter(std::string name) : name_(std::move(name)) {}
    void set_in(Session& session, const std::string& variable) override {
        session.eval(variable + " = " + name_ + ";");
    }
private:
    std::string name_;
};
} // namespace

RemoteVariable::RemoteVariable(std::string name) : name_(std::move(name)) {
    if(!is_valid_identifier(name_)) throw std::invalid_argument("Invalid remote variable name: " + name_);
}

std::unique_ptr<SerializedSetter> RemoteVariable::serialized_setter() const {
    return std::make_unique<RemoteVariableSetter>(name_);
}

bool RemoteVariable::equals(const BridgedValue& other) const {
    auto* o = dynamic_cast<const RemoteVariable*>(&other);
    return o && o->name_ == name_;
}

void BridgedTypeRegistry::register_type(const std::string& name, GetterFactory getter){
    if(name.empty() || name == RemoteVariable::kTypeName)
        throw std::invalid_argument("cannot register bridged type '" + name + "'");
    types_[name] = std::move(getter);
}

bool BridgedTypeRegistry::has_getter(const std::string& name) const {
    auto it = types_.find(name);
    return it != types_.end() && static_cast<bool>(it->second);
}

std::unique_ptr<SerializedGetter> BridgedTypeRegistry::create_getter(const std::string& name) const {
    auto it = types_.find(name);
    if(it == types_.end() || !it->second) throw std::out_of_range("no serialized getter registered for bridged type " + name);
    return it->second();
}

} // namespace rlink
