#pragma once

#include <plume/template/token.hpp>
#include <plume/result.hpp>
#include <string>

namespace plume {

// Tokenize template text into a flat token sequence with loop bodies
// resolved to index spans. Single forward pass; the first syntax error
// (UnterminatedPlaceholder, UnterminatedLoop, UnmatchedLoopEnd,
// InvalidSyntax) aborts with its line, column and byte offset.
Result<Template> tokenize(const std::string& source,
                          const std::string& filename = "<template>");

} // namespace plume
