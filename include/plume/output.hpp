#pragma once

#include <plume/result.hpp>
#include <string>

namespace plume {

// Write text to path through a sibling "<path>.plume-tmp" that is renamed
// into place once fully written and closed. On failure the temp file is
// removed and any existing file at path is left untouched.
Status write_file_atomic(const std::string& path, const std::string& text);

} // namespace plume
