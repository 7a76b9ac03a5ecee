#pragma once

#include "setting/converter.hpp"
#include "setting/typed_converter.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cfgval {

struct Language {
    std::string name;
    std::vector<std::string> aliases;
    std::vector<std::string> versions; // supported versions, empty if unversioned
    std::string version; // version selected by the lookup, empty if none

    // "Python 3.6", or just the name without a selected version
    std::string toString() const { return version.empty() ? name : name + " " + version; }

    bool operator==(const Language &other) const { return name == other.name && version == other.version; }
    bool operator!=(const Language &other) const { return !(*this == other); }
};


class UnknownLanguageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};


// Registry of known languages. Comes with a built-in set; more languages can
// be registered at startup.
class LanguageRegistry {
public:
    // Throws std::runtime_error if the name or an alias is already taken
    static void registerLanguage(const std::string &name, const std::vector<std::string> &aliases = {},
                                 const std::vector<std::string> &versions = {});

    // Case-insensitive lookup by name or alias, optionally followed by a
    // version ("python 3.6"). Throws UnknownLanguageError.
    static Language lookup(const std::string &spec);

    static bool hasLanguage(const std::string &name);
    static std::vector<std::string> names();
};


// Converts a language name, throwing InvalidLanguageError if it is unknown
[[nodiscard]] Language toLanguage(const std::string &name);


class LanguageConverter final : public Converter<Language> {
public:
    Language parse(const std::string &text) const override { return toLanguage(utils::string::trim(text)); }
    std::string typeName() const override { return "language"; }
};

inline const TypedListConverter<Language> languageList =
    typedList<Language>(std::make_shared<const LanguageConverter>());

} // namespace cfgval
