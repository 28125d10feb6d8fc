#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "rlink/rlink.hpp"

using namespace rlink;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static void usage(){
    std::cerr << "usage: rlink_check <bindings.edn> [script-dir] [--bridged Name]... [--bridged-param Name]...\n"
                 "  --bridged Name        bridged type usable as parameter and return\n"
                 "  --bridged-param Name  bridged type usable as parameter only\n";
}

int main(int argc, char** argv){
    if(argc<2){ usage(); return 1; }
    std::string file = argv[1];
    std::string dir;
    BridgedTypeRegistry registry;
    try {
        for(int i=2;i<argc; ++i){
            std::string a = argv[i];
            if(a=="--bridged" || a=="--bridged-param"){
                if(i+1>=argc){ usage(); return 1; }
                if(a=="--bridged")
                    registry.register_type(argv[++i], []() -> std::unique_ptr<SerializedGetter> {
                        throw std::logic_error("rlink_check never invokes");
                    });
                else registry.register_type(argv[++i]);
            } else if(dir.empty()) dir = a;
            else { usage(); return 1; }
        }
    } catch(const std::invalid_argument& e){ std::cerr << e.what() << "\n"; return 1; }

    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }
    std::vector<FunctionDecl> decls;
    try { decls = parse_bindings(src); }
    catch(const decl_parse_error& e){ std::cerr << file << ": " << e.what() << "\n"; return 2; }

    ScriptOrigin origin;
    if(!dir.empty()) origin = ScriptOrigin::from_directory(dir);
    LinkOptions options = LinkOptions::from_env();
    LinkResult r = Linker::check(decls, origin, registry, options);
    maybe_print_json(r);
    for(auto &w: r.warnings) std::cerr << w.code << " " << w.function << ": " << w.message << "\n";
    if(!r.success){ std::cerr << "Link check failed:\n" << format_diagnostics(r); return 3; }
    std::cout << "OK: " << decls.size() << " binding(s)\n";
    return 0;
}
