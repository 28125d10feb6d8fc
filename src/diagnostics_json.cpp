#include "rlink/diagnostics_json.hpp"
#include "rlink/env.hpp"
#include <sstream>
#include <cstdio>

namespace rlink {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_diagnostic_json(std::ostringstream& os, const LinkDiagnostic& d){
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"function\":"<<json_escape(d.function)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)
          <<",\"line\":"<<d.notes[i].line
          <<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"]}";
}

std::string diagnostics_to_json(const LinkResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){ if(i) os<<","; append_diagnostic_json(os, r.errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){ if(i) os<<","; append_diagnostic_json(os, r.warnings[i]); }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const LinkResult& r){
    if(flag_enabled("RLINK_DIAG_JSON")){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

std::string format_diagnostics(const LinkResult& r){
    std::ostringstream os;
    for(auto &e: r.errors){
        os<<e.code<<" "<<(e.function.empty()?"<binding>":e.function)<<": "<<e.message;
        if(!e.hint.empty()) os<<" ("<<e.hint<<")";
        if(e.line>=0) os<<" at "<<e.line<<":"<<e.col;
        os<<"\n";
        for(auto &n: e.notes) os<<"    "<<n.message<<"\n";
    }
    return os.str();
}

} // namespace rlink
