#include "setting.hpp"
#include "exceptions.hpp"
#include "path/path_resolver.hpp"
#include <fmt/core.h>

namespace cfgval {

Setting::Setting(std::string key, std::string value, Origin origin, FormatOptions format, bool fromCli,
                 bool toAppend)
    : text_(std::move(value), std::move(format)), origin_(std::move(origin)), from_cli_(fromCli),
      to_append_(toAppend)
{
    setKey(std::move(key));
}


void Setting::setKey(std::string key)
{
    if (key.empty())
        throw InvalidKeyError(fmt::format("An empty key is not allowed for a setting ({})", location()));
    key_ = std::move(key);
}


const std::string &Setting::value() const
{
    checkComplete();
    return text_.value();
}


void Setting::setValue(std::string value)
{
    text_.setValue(std::move(value));
}


std::vector<std::string> Setting::toList() const
{
    checkComplete();
    return text_.toList();
}


KeyValueList Setting::toDict() const
{
    checkComplete();
    return text_.toDict();
}


bool Setting::toBool() const
{
    checkComplete();
    return text_.toBool();
}


long Setting::toInt() const
{
    checkComplete();
    return text_.toInt();
}


double Setting::toFloat() const
{
    checkComplete();
    return text_.toFloat();
}


std::string Setting::toUrl() const
{
    checkComplete();
    return text_.toUrl();
}


std::string Setting::toPath(const std::optional<std::string> &explicitOrigin) const
{
    return resolve(value(), explicitOrigin, false);
}


std::string Setting::toGlob(const std::optional<std::string> &explicitOrigin) const
{
    return resolve(value(), explicitOrigin, true);
}


std::vector<std::string> Setting::toPathList() const
{
    std::vector<std::string> result;
    for (const auto &elem: toList())
        result.push_back(resolve(elem, origin(), false));
    return result;
}


std::vector<std::string> Setting::toGlobList() const
{
    std::vector<std::string> result;
    for (const auto &elem: toList())
        result.push_back(resolve(elem, origin(), true));
    return result;
}


int Setting::lineNumber() const
{
    if (const auto *pos = std::get_if<SourcePosition>(&origin_))
        return pos->line;
    throw LineNumberUnavailableError(
        fmt::format(R"(Setting "{}" was declared with the plain origin "{}" which has no line numbers)", key_,
                    location()));
}


int Setting::endLineNumber() const
{
    return length_ + lineNumber() - 1;
}


void Setting::setLength(int length)
{
    if (length < 1)
        throw SettingError(fmt::format(R"(Setting "{}" must span at least one line, got {})", key_, length));
    length_ = length;
}


std::string Setting::describe() const
{
    return fmt::format("<Setting key='{}', value='{}', origin='{}', from_cli={}, to_append={}>", key_, text_.value(),
                       location(), from_cli_, to_append_);
}


void Setting::checkComplete() const
{
    if (to_append_)
        throw IncompleteValueError(fmt::format(R"(Setting "{}" ({}) is incomplete: it has to be appended to the )"
                                               "default value of its section before it can be used",
                                               key_, location()));
}


std::string Setting::resolve(const std::string &text, const std::optional<std::string> &explicitOrigin,
                             bool escapeOrigin) const
{
    std::optional<std::string> effective = explicitOrigin;
    if (!origin().empty())
        effective = origin();

    try {
        return resolvePath(text, effective, escapeOrigin);
    } catch (const MissingOriginError &e) {
        throw MissingOriginError(fmt::format(R"(Setting "{}": {})", key_, e.what()));
    }
}

} // namespace cfgval
