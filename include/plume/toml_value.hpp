#pragma once

#include <plume/value.hpp>
#include <toml++/toml.hpp>

namespace plume {

// Convert a parsed TOML node into a Value tree. TOML times and date-times
// have no Value kind of their own and become strings in TOML notation.
Value value_from_toml(const toml::node& node);

} // namespace plume
