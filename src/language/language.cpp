#include "language.hpp"
#include "setting/exceptions.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace cfgval {

namespace ustr = utils::string;

namespace {

using Languages = std::vector<Language>;

Languages builtinLanguages()
{
    return {
        {"Unknown", {}, {}, {}},
        {"C", {}, {"89", "90", "99", "11", "17"}, {}},
        {"CPP", {"C++", "cxx"}, {"98", "03", "11", "14", "17", "20"}, {}},
        {"CSharp", {"C#"}, {}, {}},
        {"Python", {"py"}, {"2.7", "3.3", "3.4", "3.5", "3.6", "3.7", "3.8", "3.9", "3.10", "3.11", "3.12"}, {}},
        {"Java", {}, {"8", "11", "17", "21"}, {}},
        {"JavaScript", {"js", "ECMAScript"}, {}, {}},
        {"Go", {"golang"}, {}, {}},
        {"Rust", {}, {}, {}},
        {"Shell", {"sh", "bash"}, {}, {}},
    };
}

Languages &languages()
{
    static Languages registry = builtinLanguages();
    return registry;
}

bool answersTo(const Language &lang, const std::string &name)
{
    if (ustr::iequals(lang.name, name))
        return true;
    return std::any_of(lang.aliases.begin(), lang.aliases.end(),
                       [&name](const auto &alias) { return ustr::iequals(alias, name); });
}

const Language *findLanguage(const std::string &name)
{
    for (const auto &lang: languages())
        if (answersTo(lang, name))
            return &lang;
    return nullptr;
}

} // namespace


void LanguageRegistry::registerLanguage(const std::string &name, const std::vector<std::string> &aliases,
                                        const std::vector<std::string> &versions)
{
    if (ustr::trim(name).empty())
        throw std::invalid_argument("Language name must not be empty");

    std::vector<std::string> all_names{name};
    all_names.insert(all_names.end(), aliases.begin(), aliases.end());
    for (const auto &n: all_names)
        if (const Language *existing = findLanguage(n))
            throw std::runtime_error(
                fmt::format("Duplicate language registration: \"{}\" is already used by {}", n, existing->name));

    languages().push_back(Language{name, aliases, versions, {}});
    spdlog::debug("Registered language {} (aliases: {})", name, ustr::join(aliases, ", "));
}


Language LanguageRegistry::lookup(const std::string &spec)
{
    const std::string trimmed = ustr::trim(spec);
    if (const Language *lang = findLanguage(trimmed))
        return *lang;

    // "<name> <version>"
    const auto pos = trimmed.find_last_of(" \t");
    if (pos != std::string::npos) {
        const std::string name = ustr::trim(trimmed.substr(0, pos));
        const std::string version = trimmed.substr(pos + 1);
        if (const Language *lang = findLanguage(name)) {
            if (std::find(lang->versions.begin(), lang->versions.end(), version) == lang->versions.end())
                throw UnknownLanguageError(
                    fmt::format("Version {} of language {} is not supported", version, lang->name));
            Language result = *lang;
            result.version = version;
            return result;
        }
    }

    throw UnknownLanguageError(fmt::format("Language \"{}\" is not known", trimmed));
}


bool LanguageRegistry::hasLanguage(const std::string &name)
{
    return findLanguage(ustr::trim(name)) != nullptr;
}


std::vector<std::string> LanguageRegistry::names()
{
    std::vector<std::string> result;
    for (const auto &lang: languages())
        result.push_back(lang.name);
    return result;
}


Language toLanguage(const std::string &name)
{
    try {
        return LanguageRegistry::lookup(name);
    } catch (const UnknownLanguageError &e) {
        throw InvalidLanguageError(e.what());
    }
}

} // namespace cfgval
