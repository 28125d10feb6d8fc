#include "rlink/env.hpp"
#include <cstdlib>
#include <string>

namespace rlink {

LinkEnv detect_env(){
    LinkEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    e.trace = flag_enabled("RLINK_TRACE");
    e.diagJson = flag_enabled("RLINK_DIAG_JSON");

    // Extension is accepted with or without the leading dot
    if (const char* v = get("RLINK_SCRIPT_EXT")) {
        e.scriptExtension = v;
        if (e.scriptExtension[0] != '.') e.scriptExtension.insert(e.scriptExtension.begin(), '.');
    }

    if (const char* v = get("RLINK_TMPDIR")) e.tempDir = v;

    return e;
}

bool trace_enabled(){ return flag_enabled("RLINK_TRACE"); }

} // namespace rlink
