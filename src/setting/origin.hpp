#pragma once
#include <fmt/core.h>
#include <optional>
#include <string>
#include <variant>

namespace cfgval {

// Position of a declaration inside a configuration file
struct SourcePosition {
    std::string file;
    int line = 1;
    std::optional<int> column;

    bool operator==(const SourcePosition &other) const
    {
        return file == other.file && line == other.line && column == other.column;
    }
    bool operator!=(const SourcePosition &other) const { return !(*this == other); }
};

// Where a setting was declared: a plain file path (empty if unknown) or a
// position carrying the line number as well.
using Origin = std::variant<std::string, SourcePosition>;

[[nodiscard]] inline const std::string &originFile(const Origin &origin)
{
    if (const auto *pos = std::get_if<SourcePosition>(&origin))
        return pos->file;
    return std::get<std::string>(origin);
}

// "file:line[:column]", "file" or "<unknown origin>", for messages
[[nodiscard]] inline std::string originToString(const Origin &origin)
{
    if (const auto *pos = std::get_if<SourcePosition>(&origin)) {
        if (pos->column)
            return fmt::format("{}:{}:{}", pos->file, pos->line, *pos->column);
        return fmt::format("{}:{}", pos->file, pos->line);
    }

    const auto &file = std::get<std::string>(origin);
    return file.empty() ? "<unknown origin>" : file;
}

} // namespace cfgval
