/*
 * Command risk assessment - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::safety {

// Ordered from most to least severe.
enum class Severity { Critical, High, Medium, Low };

const char* to_string(Severity s);

struct RiskPattern {
    std::string keyword;
    Severity severity;
    std::string explanation;
    std::string alternative;
};

struct RiskMatch {
    std::string keyword;
    Severity severity;
    std::string explanation;
    std::string alternative;
};

struct RiskAssessment {
    bool is_risky = false;
    std::optional<Severity> severity;   // highest matched
    std::vector<RiskMatch> matches;
};

const std::vector<RiskPattern>& risk_patterns();

RiskAssessment assess_risk(const std::string& command);
bool is_risky_command(const std::string& command);
std::string safety_report(const std::string& command);

} // namespace nl2cmd::safety
