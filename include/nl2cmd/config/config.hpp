/*
 * Configuration (~/.nl2cmdrc) - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/ai/llm.hpp>
#include <nl2cmd/util/os_family.hpp>
#include <istream>
#include <string>

namespace nl2cmd::config {

struct Config {
    std::string os_family = "auto";            // auto|windows|linux
    std::string dataset_path = "data/training_data.json";
    std::string classifier = "keyword";        // none|keyword|llm
    double confidence_threshold = 0.6;
    bool color = true;
    bool debug = false;
    ai::LLMConfig llm;                         // llm_provider, llm_model, llm_endpoint, ...
};

// Applies one key=value pair; returns false for unknown keys or bad values.
bool apply_setting(Config& cfg, const std::string& key, const std::string& value);

// Reads key=value lines ('#' comments) into cfg. Missing stream leaves cfg untouched.
void load_config(std::istream& in, Config& cfg);
// false when the file does not exist.
bool load_config_file(const std::string& path, Config& cfg);

// NL2CMD_DATASET overrides dataset_path.
void apply_environment(Config& cfg);

std::string default_config_path();

// "auto" maps to the host platform.
OsFamily resolve_os(const Config& cfg);

} // namespace nl2cmd::config
