#include "glob.hpp"
#include <boost/regex.hpp>
#include <fmt/core.h>
#include <fnmatch.h>
#include <stdexcept>

namespace cfgval::glob {

std::string escape(const std::string &segment)
{
    static const boost::regex special_chars(R"([\\*?\[\]])");
    return boost::regex_replace(segment, special_chars, R"(\\$&)");
}


bool matches(const std::string &pattern, const std::string &path)
{
    const int rc = ::fnmatch(pattern.c_str(), path.c_str(), FNM_PATHNAME);
    if (rc == 0)
        return true;
    if (rc == FNM_NOMATCH)
        return false;
    throw std::invalid_argument(fmt::format("fnmatch() failed for pattern \"{}\" (error code: {})", pattern, rc));
}

} // namespace cfgval::glob
