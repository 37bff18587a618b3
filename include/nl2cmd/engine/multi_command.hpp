/*
 * Multi-command orchestration - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/engine/arbitrator.hpp>
#include <nl2cmd/engine/candidate.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::engine {

struct CommandSegment {
    int order = 1;                  // 1-based
    std::string source_text;        // as split from the request
    std::string resolved_text;      // after folder-reference rewriting
    ArbitrationDecision decision;

    bool success() const { return decision.success(); }
};

struct CommandChain {
    std::string query;
    bool is_multi_command = false;
    std::vector<CommandSegment> segments;
    std::optional<std::string> chained_command;     // set only when every segment succeeded
    double confidence = 0.0;
    std::optional<ErrorKind> error_kind;
    std::string error;

    bool success() const { return chained_command.has_value(); }
};

inline constexpr const char* kChainSeparator = " && ";

class MultiCommandProcessor {
public:
    explicit MultiCommandProcessor(const Arbitrator& arbitrator);

    static int count_action_verbs(const std::string& query);
    static std::optional<std::string> find_conjunction(const std::string& query);
    static bool is_multi_command(const std::string& query);
    static std::vector<std::string> split(const std::string& query);

    // Last directory created by an earlier successful segment, quotes stripped.
    static std::optional<std::string> created_folder(const std::vector<CommandSegment>& previous);

    std::string resolve_context(const std::string& segment, const std::vector<CommandSegment>& previous) const;

    CommandChain process(const std::string& query, std::optional<Method> force_method = std::nullopt) const;

private:
    const Arbitrator& m_arbitrator;
};

} // namespace nl2cmd::engine
