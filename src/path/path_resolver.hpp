#pragma once
#include <optional>
#include <string>

namespace cfgval {

// Turns `text` into an absolute, normalized path.
//
// Absolute text (after trimming) is returned unchanged. Relative text is
// resolved against the directory containing `origin`: "/a/b/origin.cfg" and
// "/a/b/" both resolve relative to "/a/b". A relative origin is taken relative
// to the working directory. With escapeOrigin the directory part is
// glob-escaped, the text itself never is since it may be a pattern.
//
// An empty origin stands for the working directory. Throws MissingOriginError
// if the text is relative and origin is absent.
[[nodiscard]] std::string resolvePath(const std::string &text, const std::optional<std::string> &origin = std::nullopt,
                                      bool escapeOrigin = false);

[[nodiscard]] std::string resolveGlobPath(const std::string &text,
                                          const std::optional<std::string> &origin = std::nullopt);

} // namespace cfgval
