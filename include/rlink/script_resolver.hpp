// Locating backing script files on disk or inside an archive
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "rlink/decl.hpp"
#include "rlink/errors.hpp"

namespace rlink {

struct ResolvedScript {
    std::string function_name;  // file stem
    std::string directory;      // canonical containing directory
};

// Resolves :absolute-path and :relative-path declarations. Failures are reported as link
// diagnostics (E2010-E2016) and yield nullopt.
class ScriptResolver {
public:
    // `extension` includes the dot; an empty `temp_base` uses the system temporary directory.
    explicit ScriptResolver(ScriptOrigin origin, std::string extension = ".m", std::string temp_base = {});

    std::optional<ResolvedScript> resolve(const FunctionDecl& d, ErrorReporter& r);

private:
    std::optional<ResolvedScript> resolve_file(const FunctionDecl& d, const std::string& path, ErrorReporter& r);
    std::optional<std::string> extract(const FunctionDecl& d, ErrorReporter& r);

    ScriptOrigin origin_;
    std::string extension_;
    std::string temp_base_;
};

// Directories created for extracted scripts that have not been removed yet.
std::size_t pending_extractions();
// Remove every extracted script directory now. Also runs at process exit.
void remove_extracted_scripts();

} // namespace rlink
