#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/*
Sidecar artifact names for a source item `name`:

  Archived   name.zip.001, name.zip.002, ...   (source was wrapped in a stored .zip first)
  Raw        name.001, name.002, ...           (source already is a .zip, split as-is)

Ordinals start at 1, are zero-padded to at least 3 digits and map 1:1 onto names.
*/

namespace chunk
{

enum class NameStyle
{
    Archived,
    Raw
};

struct ParsedName
{
    NameStyle     style{NameStyle::Archived};
    std::uint32_t ordinal{0};
};

// Raw when the source already carries the archive extension.
NameStyle style_for(std::string_view source_name);

// Name of the stream that gets split: "name.zip" for Archived, "name" for Raw.
std::string split_base(std::string_view source_name, NameStyle style);

std::string format_chunk_name(std::string_view source_name, NameStyle style, std::uint32_t ordinal);

// nullopt unless `artifact` is a canonical chunk name of `source_name` in either style.
std::optional<ParsedName> parse_chunk_name(std::string_view artifact, std::string_view source_name);

}  // namespace chunk
