// Collision-free remote variable names and the statements that use them
#pragma once
#include <cstddef>
#include <set>
#include <string>
#include <vector>
#include "rlink/engine.hpp"

namespace rlink {

inline constexpr const char* kArgPrefix = "rlink_arg_";
inline constexpr const char* kRetPrefix = "rlink_ret_";

// `amount` names root0, root1, ... skipping every name in `taken`.
std::vector<std::string> generate_names(const std::set<std::string>& taken, const std::string& root, std::size_t amount);
// Same, against the names currently bound in the session.
std::vector<std::string> generate_names(Session& session, const std::string& root, std::size_t amount);

// "[r0, r1] = fn(a0, a1);" with the bracketed list omitted when rets is empty.
std::string build_call_statement(const std::string& fn, const std::vector<std::string>& args, const std::vector<std::string>& rets);
// "clear a b c"
std::string build_clear_statement(const std::vector<std::string>& names);

} // namespace rlink
