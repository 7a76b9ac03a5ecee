#include "string.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <string>

namespace cfgval::utils::string {

std::string to_lower(const std::string &src)
{
    return boost::algorithm::to_lower_copy(src);
}


bool iequals(const std::string &a, const std::string &b)
{
    return boost::algorithm::iequals(a, b);
}


std::string trim(const std::string &src)
{
    return boost::algorithm::trim_copy(src);
}


std::vector<std::string> unescaped_split(const std::string &src, const std::vector<std::string> &delimiters,
                                         std::size_t max_split)
{
    std::vector<std::string> result;
    std::string current;
    std::size_t splits = 0;

    for (std::size_t i = 0; i < src.size();) {
        if (src[i] == '\\') {
            current += src[i++];
            if (i < src.size())
                current += src[i++];
            continue;
        }

        // longest matching delimiter wins, so "::" beats ":" when both are configured
        std::size_t matched = 0;
        if (max_split == 0 || splits < max_split) {
            for (const auto &delim: delimiters)
                if (!delim.empty() && delim.size() > matched && src.compare(i, delim.size(), delim) == 0)
                    matched = delim.size();
        }

        if (matched != 0) {
            result.push_back(std::move(current));
            current.clear();
            ++splits;
            i += matched;
        } else {
            current += src[i++];
        }
    }

    result.push_back(std::move(current));
    return result;
}


std::string unescape(const std::string &src)
{
    std::string result;
    result.reserve(src.size());
    for (std::size_t i = 0; i < src.size(); ++i) {
        if (src[i] == '\\' && i + 1 < src.size())
            ++i;
        result += src[i];
    }
    return result;
}


std::string join(const std::vector<std::string> &parts, const std::string &separator)
{
    return boost::algorithm::join(parts, separator);
}

} // namespace cfgval::utils::string
