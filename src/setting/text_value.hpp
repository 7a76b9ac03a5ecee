#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cfgval {

// How raw text is split and cleaned up by the list and dict views
struct FormatOptions {
    bool stripWhitespace = true;
    std::vector<std::string> listDelimiters{",", ";"};
    std::string dictDelimiter = ":";
    bool removeEmptyElements = true;
};

using KeyValueList = std::vector<std::pair<std::string, std::string>>;

// Raw configuration text together with the rules used to read it as a list,
// a mapping or a scalar. All views are computed on demand from the stored text.
class TextValue {
public:
    explicit TextValue(std::string value, FormatOptions options = {});

    const std::string &value() const { return value_; }
    void setValue(std::string value);

    const FormatOptions &options() const { return options_; }

    // Elements split on any unescaped list delimiter. Elements are trimmed if
    // stripWhitespace is set and dropped when empty if removeEmptyElements is
    // set. removeBackslashes strips one level of escaping from each element.
    std::vector<std::string> toList(bool removeBackslashes = true) const;

    // "a: 1, b: 2" as {{"a", "1"}, {"b", "2"}} in declaration order. An element
    // without dict delimiter maps to an empty value. A repeated key keeps its
    // first position and takes the last value.
    KeyValueList toDict() const;

    bool toBool() const;
    long toInt() const;
    double toFloat() const;

    // Returns the value if it looks like a URL, throws ParseError otherwise
    std::string toUrl() const;

private:
    std::string value_;
    FormatOptions options_;
};

} // namespace cfgval
