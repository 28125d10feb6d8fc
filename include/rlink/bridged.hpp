// Bridged values: types that write themselves into the remote namespace
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include "rlink/engine.hpp"
#include "rlink/value.hpp"

namespace rlink {

class SerializedSetter {
public:
    virtual ~SerializedSetter() = default;
    // Materialize the value as remote variable `variable`.
    virtual void set_in(Session& session, const std::string& variable) = 0;
};

class SerializedGetter {
public:
    virtual ~SerializedGetter() = default;
    // Pull remote variable `variable` into this intermediate; runs on the engine.
    virtual void get_in(Session& session, const std::string& variable) = 0;
    // Build the final value once the engine task has completed.
    virtual value_ptr deserialize() = 0;
};

class BridgedValue {
public:
    virtual ~BridgedValue() = default;
    virtual std::string type_name() const = 0;
    virtual std::unique_ptr<SerializedSetter> serialized_setter() const = 0;
    virtual bool equals(const BridgedValue& other) const { return this == &other; }
};

// True for a letter followed by letters, digits or '_'.
bool is_valid_identifier(std::string_view name);

// Reference to a variable that already exists in the remote namespace. Never copied by value;
// binding it as an argument evaluates `<generated> = <name>;`. Cannot be a return type.
class RemoteVariable final : public BridgedValue {
public:
    static constexpr const char* kTypeName = "variable";

    explicit RemoteVariable(std::string name);
    const std::string& name() const { return name_; }

    std::string type_name() const override { return kTypeName; }
    std::unique_ptr<SerializedSetter> serialized_setter() const override;
    bool equals(const BridgedValue& other) const override;

private:
    std::string name_;
};

// Plugin-registered set of bridged types usable in declarations as (bridged Name).
class BridgedTypeRegistry {
public:
    using GetterFactory = std::function<std::unique_ptr<SerializedGetter>()>;

    // A type registered without a getter may only be used as a parameter.
    void register_type(const std::string& name, GetterFactory getter = {});

    // T supplies kTypeName and, when usable as a return, static create_getter().
    template <typename T>
    void register_type()
    {
        if constexpr (provides_getter<T>::value)
            register_type(T::kTypeName, [] { return T::create_getter(); });
        else
            register_type(T::kTypeName);
    }

    bool contains(const std::string& name) const { return types_.count(name) != 0; }
    bool has_getter(const std::string& name) const;
    // Throws std::out_of_range for an unknown or setter-only type.
    std::unique_ptr<SerializedGetter> create_getter(const std::string& name) const;

private:
    template <typename T, typename = void>
    struct provides_getter : std::false_type {};
    template <typename T>
    struct provides_getter<T, std::void_t<decltype(T::create_getter())>> : std::true_type {};

    std::unordered_map<std::string, GetterFactory> types_;
};

} // namespace rlink
