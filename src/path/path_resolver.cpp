#include "path_resolver.hpp"
#include "glob.hpp"
#include "setting/exceptions.hpp"
#include "utils/string.hpp"
#include <filesystem>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace cfgval {

namespace fs = std::filesystem;

namespace {

// lexically_normal() keeps a trailing separator ("/a/b/.." -> "/a/"), drop it
std::string normalize(const fs::path &p)
{
    std::string result = p.lexically_normal().string();
    while (result.size() > 1 && result.back() == '/')
        result.pop_back();
    return result.empty() ? "." : result;
}


std::string originDirectory(const std::string &origin)
{
    fs::path dir = fs::path(origin).parent_path();
    if (dir.empty())
        dir = fs::current_path();
    else if (!dir.is_absolute())
        dir = fs::current_path() / dir;
    return normalize(dir);
}

} // namespace


std::string resolvePath(const std::string &text, const std::optional<std::string> &origin, bool escapeOrigin)
{
    const std::string stripped = utils::string::trim(text);
    if (fs::path(stripped).is_absolute())
        return stripped;

    if (!origin)
        throw MissingOriginError(fmt::format("Cannot determine path of \"{}\" without origin", stripped));

    // the directory must be absolute before escaping, otherwise characters
    // that normalization removes later would get escaped too
    std::string dir = originDirectory(*origin);
    if (escapeOrigin)
        dir = glob::escape(dir);

    std::string result = normalize(fs::path(dir) / stripped);
    spdlog::debug("Resolved path \"{}\" relative to \"{}\" as \"{}\"", stripped, *origin, result);
    return result;
}


std::string resolveGlobPath(const std::string &text, const std::optional<std::string> &origin)
{
    return resolvePath(text, origin, true);
}

} // namespace cfgval
