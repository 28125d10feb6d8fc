#pragma once
#include <cstdlib>
#include <string>

namespace rlink {

struct LinkEnv {
    bool trace = false;     // RLINK_TRACE=1: log strategy choices and generated statements
    bool diagJson = false;  // RLINK_DIAG_JSON=1: print link diagnostics as JSON
    std::string scriptExtension = ".m";
    std::string tempDir;    // empty = system temporary directory
};

// Detect configuration from process env vars:
// RLINK_TRACE, RLINK_DIAG_JSON, RLINK_SCRIPT_EXT, RLINK_TMPDIR.
LinkEnv detect_env();

inline bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

// Cheap per-call check used by the invocation strategies.
bool trace_enabled();

} // namespace rlink
