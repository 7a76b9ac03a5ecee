#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace cfgval::utils::string {

std::string to_lower(const std::string &src);

bool iequals(const std::string &a, const std::string &b);

std::string trim(const std::string &src);

// Splits `src` at every occurrence of any of `delimiters` that is not preceded
// by a backslash. Backslashes are kept in the returned pieces. With
// max_split > 0 at most max_split splits are performed.
std::vector<std::string> unescaped_split(const std::string &src, const std::vector<std::string> &delimiters,
                                         std::size_t max_split = 0);

// Removes one level of backslash escaping ("\," -> ",", "\\" -> "\").
std::string unescape(const std::string &src);

std::string join(const std::vector<std::string> &parts, const std::string &separator);

} // namespace cfgval::utils::string
