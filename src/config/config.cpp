// src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [editor], [theme], and [log].
// @ownership Loader does not own external resources beyond file path.

#include "syndrql/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace syndrql::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_size(const std::string &s, std::size_t &out)
{
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front())))
    {
        return false;
    }
    try
    {
        size_t parsed = 0;
        const unsigned long long v = std::stoull(s, &parsed);
        if (parsed != s.size())
        {
            return false;
        }
        out = static_cast<std::size_t>(v);
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

void apply(const std::string &section, const std::string &key, const std::string &value, Config &out)
{
    if (section == "editor")
    {
        std::size_t n = 0;
        if (!parse_size(value, n))
        {
            return;
        }
        if (key == "debounce_ms")
            out.editor.debounce_ms = static_cast<unsigned>(n);
        else if (key == "cache_max_entries")
            out.editor.cache_max_entries = n;
        else if (key == "cache_max_bytes")
            out.editor.cache_max_bytes = n;
    }
    else if (section == "theme")
    {
        const auto col = highlight::parseColor(value);
        if (!col)
        {
            return;
        }
        out.theme.set(key, *col);
    }
    else if (section == "log")
    {
        if (key == "level")
        {
            if (const auto level = support::parseLogLevel(lower(value)))
                out.log.level = *level;
        }
    }
}

} // namespace

bool loadFromString(std::string_view text, Config &out)
{
    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        apply(section, lower(trim(trimmed.substr(0, eq))), trim(trimmed.substr(eq + 1)), out);
    }
    return true;
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return loadFromString(contents.str(), out);
}

highlight::HighlighterOptions highlighterOptions(const Config &cfg)
{
    highlight::HighlighterOptions opts;
    opts.debounce = highlight::Millis(cfg.editor.debounce_ms);
    opts.cache.maxEntries = cfg.editor.cache_max_entries;
    opts.cache.maxBytes = cfg.editor.cache_max_bytes;
    opts.theme = cfg.theme;
    return opts;
}

} // namespace syndrql::config
