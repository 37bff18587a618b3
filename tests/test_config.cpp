#include <gtest/gtest.h>
#include <nl2cmd/config/config.hpp>
#include <cstdlib>
#include <sstream>

using namespace nl2cmd;
using namespace nl2cmd::config;

TEST(Config, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.os_family, "auto");
    EXPECT_EQ(cfg.classifier, "keyword");
    EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.6);
    EXPECT_EQ(cfg.llm.provider, "none");
    EXPECT_EQ(resolve_os(cfg), host_os_family());
}

TEST(Config, LoadsKeyValueLines) {
    std::istringstream in(
        "# nl2cmd settings\n"
        "os_family = windows\n"
        "classifier=llm\n"
        "confidence_threshold=0.75\n"
        "color=off\n"
        "debug=true\n"
        "\n"
        "llm_provider=ollama\n"
        "llm_model=llama3\n"
        "llm_timeout=30\n"
        "not a setting\n");
    Config cfg;
    load_config(in, cfg);
    EXPECT_EQ(resolve_os(cfg), OsFamily::Windows);
    EXPECT_EQ(cfg.classifier, "llm");
    EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.75);
    EXPECT_FALSE(cfg.color);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.llm.provider, "ollama");
    EXPECT_EQ(cfg.llm.model, "llama3");
    EXPECT_EQ(cfg.llm.timeout_seconds, 30);
}

TEST(Config, BadValuesKeepDefaults) {
    Config cfg;
    EXPECT_FALSE(apply_setting(cfg, "confidence_threshold", "abc"));
    EXPECT_FALSE(apply_setting(cfg, "confidence_threshold", "1.5"));
    EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.6);
    EXPECT_FALSE(apply_setting(cfg, "os_family", "beos"));
    EXPECT_EQ(cfg.os_family, "auto");
    EXPECT_FALSE(apply_setting(cfg, "classifier", "neural"));
    EXPECT_FALSE(apply_setting(cfg, "llm_timeout", "soon"));
    EXPECT_EQ(cfg.llm.timeout_seconds, 10);
    EXPECT_FALSE(apply_setting(cfg, "prompt_format", "x"));
}

TEST(Config, MissingFile) {
    Config cfg;
    EXPECT_FALSE(load_config_file("/nonexistent/.nl2cmdrc", cfg));
    EXPECT_FALSE(default_config_path().empty());
}

#ifndef _WIN32
TEST(Config, EnvironmentOverridesDataset) {
    setenv("NL2CMD_DATASET", "/tmp/custom.json", 1);
    Config cfg;
    apply_environment(cfg);
    EXPECT_EQ(cfg.dataset_path, "/tmp/custom.json");
    unsetenv("NL2CMD_DATASET");
    Config untouched;
    apply_environment(untouched);
    EXPECT_EQ(untouched.dataset_path, "data/training_data.json");
}
#endif
