// tests/test_config.cpp
// @brief Verify configuration loader parses editor, theme, and log settings.
// @invariant Parsed values match the sample config; bad values keep defaults.
// @ownership Test owns configuration data only.

#include <gtest/gtest.h>

#include "syndrql/config/config.hpp"

using syndrql::config::Config;
using syndrql::config::highlighterOptions;
using syndrql::config::loadFromFile;
using syndrql::config::loadFromString;
using syndrql::highlight::Millis;
using syndrql::highlight::RGBA;
using syndrql::highlight::Theme;
using syndrql::support::LogConfig;

TEST(Config, LoadsSampleFile)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(CONFIG_INI, cfg));

    EXPECT_EQ(cfg.editor.debounce_ms, 150u);
    EXPECT_EQ(cfg.editor.cache_max_entries, 64u);
    EXPECT_EQ(cfg.editor.cache_max_bytes, 65536u);

    EXPECT_EQ(cfg.theme.keyword, (RGBA{0x11, 0x22, 0x33, 255}));
    EXPECT_EQ(cfg.theme.error, (RGBA{0xAA, 0x00, 0x00, 255}));
    EXPECT_EQ(cfg.theme.string, (RGBA{0x00, 0xFF, 0x00, 255}));
    EXPECT_EQ(cfg.theme.comment, Theme{}.comment);

    EXPECT_EQ(cfg.log.level, LogConfig::Debug);
}

TEST(Config, InvalidValuesKeepDefaults)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(CONFIG_BAD_VALUES_INI, cfg));

    const Config defaults;
    EXPECT_EQ(cfg.editor.debounce_ms, defaults.editor.debounce_ms);
    EXPECT_EQ(cfg.editor.cache_max_entries, defaults.editor.cache_max_entries);
    EXPECT_EQ(cfg.editor.cache_max_bytes, 2048u);
    EXPECT_EQ(cfg.theme.keyword, defaults.theme.keyword);
    EXPECT_EQ(cfg.theme.number, defaults.theme.number);
    EXPECT_EQ(cfg.theme.comment, (RGBA{0x0A, 0x0B, 0x0C, 255}));
    EXPECT_EQ(cfg.log.level, LogConfig::Off);
}

TEST(Config, MissingFileFails)
{
    Config cfg;
    EXPECT_FALSE(loadFromFile("/nonexistent/syndrql.ini", cfg));
    EXPECT_EQ(cfg.editor.debounce_ms, 200u);
}

TEST(Config, StringInputAndHighlighterOptions)
{
    Config cfg;
    EXPECT_TRUE(loadFromString("[editor]\ndebounce_ms=75\nunknown=1\n[other]\nx=y\nnot a pair\n", cfg));
    const auto opts = highlighterOptions(cfg);
    EXPECT_EQ(opts.debounce, Millis(75));
    EXPECT_EQ(opts.cache.maxEntries, cfg.editor.cache_max_entries);
    EXPECT_EQ(opts.theme, cfg.theme);
}
