#pragma once

#include "origin.hpp"
#include "text_value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cfgval {

// A key/value pair read from a configuration file or the command line.
//
// The value is stored once as text and converted on demand. The origin
// anchors relative paths and is reported in error messages. A setting marked
// toAppend is a fragment that still has to be concatenated with a default
// value; every read of its value throws IncompleteValueError until the owner
// merged it and cleared the flag.
class Setting {
public:
    Setting(std::string key, std::string value, Origin origin = std::string{}, FormatOptions format = {},
            bool fromCli = false, bool toAppend = false);

    const std::string &key() const { return key_; }
    void setKey(std::string key);

    // Throws IncompleteValueError while toAppend is set
    const std::string &value() const;
    void setValue(std::string value);

    std::vector<std::string> toList() const;
    KeyValueList toDict() const;
    bool toBool() const;
    long toInt() const;
    double toFloat() const;
    std::string toUrl() const;

    // Absolute path of the value. The setting's own origin is used if it has
    // one, explicitOrigin otherwise. Throws MissingOriginError if neither is
    // available and the value is relative.
    std::string toPath(const std::optional<std::string> &explicitOrigin = std::nullopt) const;

    // Like toPath() with glob metacharacters of the origin directory escaped
    std::string toGlob(const std::optional<std::string> &explicitOrigin = std::nullopt) const;

    // Every list element resolved against this setting's own origin, the
    // working directory if that is empty
    std::vector<std::string> toPathList() const;
    std::vector<std::string> toGlobList() const;

    // File name of the origin, empty if unknown
    const std::string &origin() const { return originFile(origin_); }
    const Origin &originValue() const { return origin_; }
    std::string location() const { return originToString(origin_); }

    // Only available for SourcePosition origins, throw LineNumberUnavailableError otherwise
    int lineNumber() const;
    int endLineNumber() const;

    int length() const { return length_; }
    void setLength(int length);

    bool fromCli() const { return from_cli_; }
    bool toAppend() const { return to_append_; }
    void setToAppend(bool toAppend) { to_append_ = toAppend; }

    const FormatOptions &format() const { return text_.options(); }

    // One-line representation for logs; never throws
    std::string describe() const;

private:
    void checkComplete() const;
    std::string resolve(const std::string &text, const std::optional<std::string> &explicitOrigin,
                        bool escapeOrigin) const;

    std::string key_;
    TextValue text_;
    Origin origin_;
    int length_ = 1;
    bool from_cli_;
    bool to_append_;
};

} // namespace cfgval
