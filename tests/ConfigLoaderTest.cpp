#include "config/ConfigLoader.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

TEST(ConfigLoaderTest, DefaultsMatchNormalizationRules) {
    const Config config;
    EXPECT_TRUE(config.lowercase);
    EXPECT_EQ(config.tokenizer, TokenizerMode::Space);
    EXPECT_EQ(config.punctuation, "!\"#$%&()*+,-./:;<=>?@^_`{|}~[]");
}

TEST(ConfigLoaderTest, ParsesAllKeys) {
    Config config;
    ASSERT_TRUE(parseConfig(R"({"punctuation": ".,", "lowercase": false, "tokenizer": "whitespace"})", config));
    EXPECT_EQ(config.punctuation, ".,");
    EXPECT_FALSE(config.lowercase);
    EXPECT_EQ(config.tokenizer, TokenizerMode::Whitespace);
}

TEST(ConfigLoaderTest, MissingKeysKeepDefaults) {
    Config config;
    ASSERT_TRUE(parseConfig(R"({"lowercase": false})", config));
    EXPECT_FALSE(config.lowercase);
    EXPECT_EQ(config.tokenizer, TokenizerMode::Space);
    EXPECT_EQ(config.punctuation, Config().punctuation);
}

TEST(ConfigLoaderTest, UnknownKeysAreIgnored) {
    Config config;
    EXPECT_TRUE(parseConfig(R"({"colour": "blue"})", config));
}

TEST(ConfigLoaderTest, RejectsInvalidDocumentsWithoutChanges) {
    Config config;
    EXPECT_FALSE(parseConfig(R"({"lowercase": "yes"})", config));
    EXPECT_FALSE(parseConfig(R"({"punctuation": 42})", config));
    EXPECT_FALSE(parseConfig(R"({"tokenizer": "tabs"})", config));
    EXPECT_FALSE(parseConfig(R"({"lowercase": false, "tokenizer": "tabs"})", config));
    EXPECT_FALSE(parseConfig(R"(["space"])", config));
    EXPECT_FALSE(parseConfig(R"({"lowercase": )", config));

    EXPECT_TRUE(config.lowercase);
    EXPECT_EQ(config.tokenizer, TokenizerMode::Space);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "word_index_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"tokenizer": "whitespace"})";
    }

    Config config;
    EXPECT_TRUE(loadConfigFile(path.string(), config));
    EXPECT_EQ(config.tokenizer, TokenizerMode::Whitespace);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ConfigLoaderTest, MissingFileFails) {
    Config config;
    EXPECT_FALSE(loadConfigFile("/nonexistent/dir/config.json", config));
}

TEST(ConfigLoaderTest, TokenizerModeNames) {
    TokenizerMode mode = TokenizerMode::Space;
    EXPECT_TRUE(parseTokenizerMode("whitespace", mode));
    EXPECT_EQ(mode, TokenizerMode::Whitespace);
    EXPECT_TRUE(parseTokenizerMode("space", mode));
    EXPECT_EQ(mode, TokenizerMode::Space);
    EXPECT_FALSE(parseTokenizerMode("Space", mode));
}
