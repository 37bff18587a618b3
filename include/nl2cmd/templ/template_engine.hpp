/*
 * Command templates - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/engine/candidate.hpp>
#include <nl2cmd/templ/parameter_extractor.hpp>
#include <nl2cmd/util/os_family.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::templ {

class TemplateEngine {
public:
    static constexpr double kTemplateConfidence = 0.95;

    TemplateEngine();

    // git intent name, "create_nested", or "{intent}_{first target}".
    std::optional<std::string> template_key(const Analysis& analysis) const;

    bool has_template(const std::string& key, OsFamily os) const;

    // Fills the first template of `key`; nullopt when a placeholder has no value.
    std::optional<std::string> fill(const std::string& key, std::map<std::string, std::string> params, OsFamily os) const;

    std::optional<engine::CandidateResolution> generate(const Analysis& analysis, OsFamily os) const;

    static const std::map<std::string, std::string>& git_defaults();

private:
    using Table = std::map<std::string, std::vector<std::string>>;
    Table m_windows;
    Table m_linux;

    const Table& table(OsFamily os) const { return os == OsFamily::Windows ? m_windows : m_linux; }
};

} // namespace nl2cmd::templ
