#include <cstdio>

#include "chunk/naming.hpp"
#include "util/constants.hpp"

namespace chunk
{

static bool ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::optional<std::uint32_t> parse_ordinal(std::string_view digits)
{
    // 9 digits keeps the value inside uint32
    if (digits.size() < constants::ORDINAL_WIDTH || digits.size() > 9)
        return std::nullopt;
    std::uint32_t v = 0;
    for (char c : digits)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<std::uint32_t>(c - '0');
    }
    if (v == 0)
        return std::nullopt;
    // reject non-canonical padding such as "0001"
    if (digits.size() > constants::ORDINAL_WIDTH && digits.front() == '0')
        return std::nullopt;
    return v;
}

NameStyle style_for(std::string_view source_name)
{
    return ends_with(source_name, constants::ARCHIVE_EXT) ? NameStyle::Raw : NameStyle::Archived;
}

std::string split_base(std::string_view source_name, NameStyle style)
{
    std::string base(source_name);
    if (style == NameStyle::Archived)
        base += constants::ARCHIVE_EXT;
    return base;
}

std::string format_chunk_name(std::string_view source_name, NameStyle style, std::uint32_t ordinal)
{
    char num[16];
    std::snprintf(num, sizeof(num), "%0*u", static_cast<int>(constants::ORDINAL_WIDTH), ordinal);
    return split_base(source_name, style) + "." + num;
}

std::optional<ParsedName> parse_chunk_name(std::string_view artifact, std::string_view source_name)
{
    const auto dot = artifact.rfind('.');
    if (dot == std::string_view::npos)
        return std::nullopt;
    const std::string_view stem = artifact.substr(0, dot);

    auto ord = parse_ordinal(artifact.substr(dot + 1));
    if (!ord)
        return std::nullopt;

    if (stem == split_base(source_name, NameStyle::Archived))
        return ParsedName{NameStyle::Archived, *ord};
    if (stem == source_name)
        return ParsedName{NameStyle::Raw, *ord};
    return std::nullopt;
}

}  // namespace chunk
