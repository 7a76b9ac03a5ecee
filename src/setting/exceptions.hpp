#pragma once
#include <stdexcept>
#include <string>

namespace cfgval {

// Base of every error raised while reading or converting a setting.
class SettingError : public std::runtime_error {
public:
    explicit SettingError(const std::string &what)
        : runtime_error{what}
    { }
};


class InvalidKeyError : public SettingError {
public:
    using SettingError::SettingError;
};


// The setting is a fragment that must be merged with a default first.
class IncompleteValueError : public SettingError {
public:
    using SettingError::SettingError;
};


class MissingOriginError : public SettingError {
public:
    using SettingError::SettingError;
};


class InvalidLanguageError : public SettingError {
public:
    using SettingError::SettingError;
};


class LineNumberUnavailableError : public SettingError {
public:
    using SettingError::SettingError;
};


// Text could not be converted to the requested type.
class ParseError : public SettingError {
public:
    ParseError(const std::string &text, const std::string &type_name)
        : SettingError{"Cannot convert \"" + text + "\" to " + type_name}, text_{text}, type_name_{type_name}
    { }

    const std::string &text() const noexcept { return text_; }
    const std::string &typeName() const noexcept { return type_name_; }

private:
    std::string text_;
    std::string type_name_;
};

} // namespace cfgval
