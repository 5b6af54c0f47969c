// include/syndrql/config/config.hpp
// @brief INI-like configuration for the SyndrQL language service.
// @invariant Unknown sections and keys are ignored; unparsable values keep
//            their defaults.
// @ownership Config is a plain value type.
#pragma once

#include "syndrql/highlight/syntax_highlighter.hpp"
#include "syndrql/highlight/theme.hpp"
#include "syndrql/support/log.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace syndrql::config
{

/// @brief Settings read from the [editor] section.
struct EditorConfig
{
    unsigned debounce_ms = 200;
    std::size_t cache_max_entries = highlight::CachePolicy{}.maxEntries;
    std::size_t cache_max_bytes = highlight::CachePolicy{}.maxBytes;
};

struct Config
{
    EditorConfig editor{};
    highlight::Theme theme{};
    support::LogConfig log{};
};

/// @brief Load configuration from the file at @p path into @p out.
/// @return False if the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out);

/// @brief Parse configuration text into @p out.
/// @return Always true; malformed lines are skipped.
bool loadFromString(std::string_view text, Config &out);

/// @brief Highlighter options described by @p cfg.
[[nodiscard]] highlight::HighlighterOptions highlighterOptions(const Config &cfg);

} // namespace syndrql::config
