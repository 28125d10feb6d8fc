// Declared call contracts and where their scripts come from
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlink {

// The failure mode every declaration must list in `throws`.
inline constexpr const char* kInvocationFailure = "invocation-failure";

// One declared call, read-only input to the linker. Type fields hold type forms
// (see TypeContext::parse_type).
struct FunctionDecl {
    std::string id;             // call identifier used by Linker::invoke / bind
    // Exactly one of the three locations must be set.
    std::string name;           // on the remote search path
    std::string absolutePath;   // script file
    std::string relativePath;   // script file relative to the binding set's origin
    int nargout = 0;
    std::string ret = "void";             // declared result shape
    std::vector<std::string> returns;     // optional explicit per-position return types
    std::vector<std::string> params;
    std::vector<std::string> throws;
    int line = -1, col = -1;              // source position when read from EDN
};

// Packaged scripts, e.g. an archive shipped next to the binary.
class ScriptArchive {
public:
    virtual ~ScriptArchive() = default;
    // Human readable location used in diagnostics.
    virtual std::string location() const = 0;
    // Contents of `entry`, or nullopt when absent. Throws std::runtime_error on read failure.
    virtual std::optional<std::string> read_entry(const std::string& entry) const = 0;
};

// In-memory archive, used for scripts embedded in the program.
class MemoryArchive : public ScriptArchive {
public:
    explicit MemoryArchive(std::string location) : location_(std::move(location)) {}
    void add(std::string entry, std::string contents){ entries_[std::move(entry)] = std::move(contents); }
    std::string location() const override { return location_; }
    std::optional<std::string> read_entry(const std::string& entry) const override {
        auto it = entries_.find(entry);
        if(it == entries_.end()) return std::nullopt;
        return it->second;
    }
private:
    std::string location_;
    std::map<std::string, std::string> entries_;
};

// Base for relative paths: a directory on disk or an archive.
struct ScriptOrigin {
    std::string directory;
    std::shared_ptr<const ScriptArchive> archive;

    static ScriptOrigin from_directory(std::string dir){ ScriptOrigin o; o.directory = std::move(dir); return o; }
    static ScriptOrigin from_archive(std::shared_ptr<const ScriptArchive> a){ ScriptOrigin o; o.archive = std::move(a); return o; }
};

// Read a binding set:
//   (bindings
//     (fn :id roots :name "roots" :nargout 1 :ret (array f64) :params [(array f64)]
//         :throws [invocation-failure]) ...)
// Throws decl_parse_error on malformed text; contract validation is the linker's job.
std::vector<FunctionDecl> parse_bindings(std::string_view src);

} // namespace rlink
