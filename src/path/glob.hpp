#pragma once
#include <string>

// Glob dialect of fnmatch(3): "*", "?" and "[...]" are special, a backslash
// makes the next character literal.
namespace cfgval::glob {

// Escapes every glob metacharacter so `segment` only matches itself
[[nodiscard]] std::string escape(const std::string &segment);

// Matches `path` against `pattern`; wildcards do not cross "/"
[[nodiscard]] bool matches(const std::string &pattern, const std::string &path);

} // namespace cfgval::glob
