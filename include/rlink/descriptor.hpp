// Resolved, immutable form of one declared call
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "rlink/types.hpp"

namespace rlink {

struct BindingDescriptor {
    std::string id;
    std::string name;                                // remote function name
    std::optional<std::string> containing_directory; // empty: resolved via the remote search path
    int nargout = 0;
    TypeId result_type = 0;                          // declared result shape
    std::vector<TypeId> return_types;                // one per position; [result_type] for nargout 0/1
    std::vector<TypeId> parameter_types;
    bool uses_bridged_types = false;
};

// "roots: (array f64) <- [(array f64)] nargout=1 @ /dir"
std::string describe(const BindingDescriptor& d, const TypeContext& ctx);

} // namespace rlink
