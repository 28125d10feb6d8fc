#include "rlink/names.hpp"

namespace rlink {

std::vector<std::string> generate_names(const std::set<std::string>& taken, const std::string& root, std::size_t amount){
    std::vector<std::string> out;
    out.reserve(amount);
    std::size_t seq = 0;
    while(out.size() != amount){
        std::string name = root + std::to_string(seq++);
        if(taken.count(name)) continue;
        out.push_back(std::move(name));
    }
    return out;
}

std::vector<std::string> generate_names(Session& session, const std::string& root, std::size_t amount){
    if(amount == 0) return {};
    return generate_names(session.who(), root, amount);
}

static std::string join(const std::vector<std::string>& xs, const char* sep){
    std::string out;
    for(size_t i=0;i<xs.size(); ++i){
        if(i) out += sep;
        out += xs[i];
    }
    return out;
}

std::string build_call_statement(const std::string& fn, const std::vector<std::string>& args, const std::vector<std::string>& rets){
    std::string call = fn + "(" + join(args, ", ") + ");";
    if(rets.empty()) return call;
    return "[" + join(rets, ", ") + "] = " + call;
}

std::string build_clear_statement(const std::vector<std::string>& names){
    return "clear " + join(names, " ");
}

} // namespace rlink
