#include "text_value.hpp"
#include "converter.hpp"
#include "exceptions.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <boost/regex.hpp>

namespace cfgval {

namespace ustr = utils::string;

TextValue::TextValue(std::string value, FormatOptions options)
    : options_(std::move(options))
{
    setValue(std::move(value));
}


void TextValue::setValue(std::string value)
{
    value_ = options_.stripWhitespace ? ustr::trim(value) : std::move(value);
}


std::vector<std::string> TextValue::toList(bool removeBackslashes) const
{
    std::vector<std::string> result;
    for (auto &elem: ustr::unescaped_split(value_, options_.listDelimiters)) {
        if (options_.stripWhitespace)
            elem = ustr::trim(elem);
        if (removeBackslashes)
            elem = ustr::unescape(elem);
        if (options_.removeEmptyElements && elem.empty())
            continue;
        result.push_back(std::move(elem));
    }
    return result;
}


KeyValueList TextValue::toDict() const
{
    KeyValueList result;
    for (const auto &elem: toList(false)) {
        auto parts = ustr::unescaped_split(elem, {options_.dictDelimiter}, 1);
        std::string key = ustr::unescape(ustr::trim(parts[0]));
        std::string value = parts.size() > 1 ? ustr::unescape(ustr::trim(parts[1])) : std::string{};

        auto it = std::find_if(result.begin(), result.end(), [&key](const auto &kv) { return kv.first == key; });
        if (it != result.end())
            it->second = std::move(value);
        else
            result.emplace_back(std::move(key), std::move(value));
    }
    return result;
}


bool TextValue::toBool() const
{
    return parseBool(value_);
}


long TextValue::toInt() const
{
    return fromString<long>(value_);
}


double TextValue::toFloat() const
{
    return fromString<double>(value_);
}


std::string TextValue::toUrl() const
{
    static const boost::regex url_pattern(R"(^(?:(?:http|ftp)s?://)?)"
                                          R"((?:(?:[A-Z0-9](?:[A-Z0-9-]{0,61}[A-Z0-9])?\.)+)"
                                          R"((?:[A-Z]{2,6}\.?|[A-Z0-9-]{2,}\.?)|)"
                                          R"(localhost|)"
                                          R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))"
                                          R"((?::\d+)?)"
                                          R"((?:/?|[/?]\S+)$)",
                                          boost::regex::perl | boost::regex::icase);

    if (!boost::regex_match(value_, url_pattern))
        throw ParseError(value_, "url");
    return value_;
}

} // namespace cfgval
