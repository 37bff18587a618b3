// Terminal rendering of decisions, chains and risk prompts.
#pragma once
#include <nl2cmd/engine/candidate.hpp>
#include <nl2cmd/engine/multi_command.hpp>
#include <nl2cmd/safety/risk.hpp>
#include <string>

namespace nl2cmd::cli {

struct FormatOptions {
    bool color = true;
    bool explain = false;       // list rejected candidates too
};

std::string colorize(const std::string& s, const char* code, bool enabled);
std::string method_badge(engine::Method m, bool color);
std::string format_percent(double confidence);      // 0.874 -> "87.4%"

std::string format_decision(const engine::ArbitrationDecision& d, const FormatOptions& opt);
std::string format_chain(const engine::CommandChain& chain, const FormatOptions& opt);
std::string format_risk_banner(const std::string& command, const safety::RiskAssessment& risk, bool color);

} // namespace nl2cmd::cli
