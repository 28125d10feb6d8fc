#include "rlink/descriptor.hpp"

namespace rlink {

std::string describe(const BindingDescriptor& d, const TypeContext& ctx){
    std::string out = d.id + ": " + ctx.to_string(d.result_type) + " <- [";
    for(size_t i=0;i<d.parameter_types.size(); ++i){
        if(i) out += ' ';
        out += ctx.to_string(d.parameter_types[i]);
    }
    out += "] nargout=" + std::to_string(d.nargout);
    if(d.nargout > 1){
        out += " returns=[";
        for(size_t i=0;i<d.return_types.size(); ++i){
            if(i) out += ' ';
            out += ctx.to_string(d.return_types[i]);
        }
        out += "]";
    }
    if(d.name != d.id) out += " fn=" + d.name;
    if(d.containing_directory) out += " @ " + *d.containing_directory;
    if(d.uses_bridged_types) out += " (custom)";
    return out;
}

} // namespace rlink
