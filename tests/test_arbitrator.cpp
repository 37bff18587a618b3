/*
 * Resolution arbitrator tests - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <nl2cmd/ai/classifier.hpp>
#include <nl2cmd/config/config.hpp>
#include <nl2cmd/engine/arbitrator.hpp>
#include <nl2cmd/engine/context.hpp>
#include <nl2cmd/match/approx_matcher.hpp>
#include <nl2cmd/rules/rule_matcher.hpp>
#include <nl2cmd/templ/parameter_extractor.hpp>
#include <nl2cmd/templ/template_engine.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace nl2cmd;
using namespace nl2cmd::engine;

namespace {

class FakeClassifier : public ai::Classifier {
public:
    FakeClassifier(std::string label, double conf, std::string cmd, bool throws = false)
        : m_label(std::move(label)), m_conf(conf), m_cmd(std::move(cmd)), m_throws(throws) {}

    std::optional<ai::Prediction> predict(const std::string&) const override {
        ++calls;
        if (m_throws) throw std::runtime_error("model offline");
        ai::Prediction p; p.label = m_label; p.confidence_per_label[m_label] = m_conf;
        return p;
    }
    std::optional<std::string> label_to_command(const std::string&, OsFamily) const override {
        if (m_cmd.empty()) return std::nullopt;
        return m_cmd;
    }
    std::string name() const override { return "fake"; }

    mutable int calls = 0;
private:
    std::string m_label;
    double m_conf;
    std::string m_cmd;
    bool m_throws;
};

std::optional<data::Dataset> test_dataset() { return data::load_dataset(NL2CMD_TEST_DATA); }

} // namespace

TEST(Arbitrator, StopWordsOnlyIsInvalidInput) {
    FakeClassifier clf("list_files", 0.9, "dir");
    Collaborators parts; parts.classifier = &clf;
    Arbitrator arb(OsFamily::Windows, parts);
    auto d = arb.resolve("the and of");
    EXPECT_EQ(d.status, DecisionStatus::InvalidInput);
    EXPECT_EQ(d.error_kind, ErrorKind::InvalidInput);
    EXPECT_EQ(d.error, "Invalid or empty request");
    EXPECT_FALSE(d.success());
    EXPECT_EQ(clf.calls, 0);
    EXPECT_EQ(arb.resolve("   ").status, DecisionStatus::InvalidInput);
}

TEST(Arbitrator, ConfidentClassifierWins) {
    FakeClassifier clf("list_files", 0.8, "dir");
    rules::RuleMatcher rules;
    Collaborators parts; parts.classifier = &clf; parts.rules = &rules;
    Arbitrator arb(OsFamily::Windows, parts);
    auto d = arb.resolve("list files");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.status, DecisionStatus::Resolved);
    EXPECT_EQ(d.method(), Method::Ml);
    EXPECT_EQ(d.command().value_or(""), "dir");
    EXPECT_DOUBLE_EQ(d.confidence(), 0.8);
    EXPECT_EQ(d.chosen->metadata.at("intent"), "list_files");
}

TEST(Arbitrator, TemplateBeatsWeakClassifier) {
    FakeClassifier clf("create_folder", 0.4, "mkdir new_folder");
    templ::ParameterExtractor ex; templ::TemplateEngine te;
    Collaborators parts; parts.classifier = &clf; parts.extractor = &ex; parts.templates = &te;
    Arbitrator arb(OsFamily::Linux, parts);
    auto d = arb.resolve("create a folder named proj");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.method(), Method::Template);
    EXPECT_EQ(d.command().value_or(""), "mkdir proj");
    ASSERT_EQ(d.rejected.size(), 1u);
    EXPECT_EQ(d.rejected[0].method, Method::Ml);
    EXPECT_FALSE(d.rejected[0].success);
    EXPECT_FALSE(d.rejected[0].command.has_value());
    EXPECT_EQ(d.rejected[0].metadata.at("suggested_command"), "mkdir new_folder");
}

TEST(Arbitrator, WeakClassifierGuessIsNeverPromoted) {
    FakeClassifier clf("list_files", 0.4, "dir");
    templ::ParameterExtractor ex; templ::TemplateEngine te;
    Collaborators parts; parts.classifier = &clf; parts.extractor = &ex; parts.templates = &te;
    Arbitrator arb(OsFamily::Windows, parts);
    auto d = arb.resolve("zzqx blorp");
    EXPECT_EQ(d.status, DecisionStatus::Unresolved);
    EXPECT_FALSE(d.fallback_used);
    EXPECT_FALSE(d.command().has_value());
    EXPECT_EQ(d.error_kind, ErrorKind::NoResolution);
    ASSERT_EQ(d.rejected.size(), 1u);
    auto& ml = d.rejected[0];
    EXPECT_EQ(ml.method, Method::Ml);
    EXPECT_FALSE(ml.usable());
    EXPECT_DOUBLE_EQ(ml.confidence, 0.0);
    EXPECT_EQ(ml.metadata.at("intent"), "list_files");
    EXPECT_EQ(ml.metadata.at("raw_confidence"), "0.400");
}

TEST(Arbitrator, WeakFuzzyMatchBecomesFlaggedFallback) {
    auto ds = std::make_shared<const data::Dataset>(
        std::vector<data::DatasetRecord>{},
        std::vector<data::DatasetRecord>{{"compress the backup folder", "compress_folder", "tar -czf backup.tar.gz backup"}},
        std::vector<data::DatasetRecord>{});
    match::ApproximateMatcher matcher(ds);
    FakeClassifier clf("list_files", 0.5, "ls");
    Collaborators parts; parts.classifier = &clf; parts.matcher = &matcher;
    Arbitrator arb(OsFamily::Linux, parts);
    auto d = arb.resolve("archive backup folder");
    EXPECT_EQ(d.status, DecisionStatus::ResolvedFallback);
    EXPECT_TRUE(d.fallback_used);
    EXPECT_EQ(d.method(), Method::Fuzzy);
    EXPECT_EQ(d.command().value_or(""), "tar -czf backup.tar.gz backup");
    EXPECT_EQ(d.warning, "Low confidence (72.6%), please verify");
    ASSERT_EQ(d.rejected.size(), 1u);
    EXPECT_EQ(d.rejected[0].method, Method::Ml);
}

TEST(Arbitrator, ClassifierWithoutCommandIsNotAFallback) {
    FakeClassifier clf("mystery", 0.3, "");
    Collaborators parts; parts.classifier = &clf;
    Arbitrator arb(OsFamily::Linux, parts);
    auto d = arb.resolve("zzqx blorp");
    EXPECT_EQ(d.status, DecisionStatus::Unresolved);
    EXPECT_EQ(d.error, kNoResolutionMessage);
    EXPECT_EQ(d.error_kind, ErrorKind::NoResolution);
    ASSERT_EQ(d.rejected.size(), 1u);
    EXPECT_DOUBLE_EQ(d.rejected[0].confidence, 0.0);
    EXPECT_TRUE(d.rejected[0].error.has_value());
}

TEST(Arbitrator, ThrowingStrategyDoesNotStopCascade) {
    FakeClassifier clf("x", 0.9, "x", true);
    templ::ParameterExtractor ex; templ::TemplateEngine te;
    Collaborators parts; parts.classifier = &clf; parts.extractor = &ex; parts.templates = &te;
    Arbitrator arb(OsFamily::Linux, parts);
    auto d = arb.resolve("create a folder named x");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.method(), Method::Template);
    ASSERT_EQ(d.rejected.size(), 1u);
    EXPECT_EQ(d.rejected[0].method, Method::Ml);
    EXPECT_EQ(d.rejected[0].error.value_or(""), "model offline");
    EXPECT_EQ(d.rejected[0].metadata.at("error_kind"), "strategy_error");
}

TEST(Arbitrator, ExactRuleAsLastResort) {
    rules::RuleMatcher rules;
    Collaborators parts; parts.rules = &rules;
    Arbitrator arb(OsFamily::Windows, parts);
    auto d = arb.resolve("show my ip address");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.method(), Method::Rule);
    EXPECT_EQ(d.command().value_or(""), "ipconfig");
    EXPECT_DOUBLE_EQ(d.confidence(), 1.0);

    auto miss = arb.resolve("zzqx blorp");
    EXPECT_EQ(miss.status, DecisionStatus::Unresolved);
    ASSERT_EQ(miss.rejected.size(), 1u);
    EXPECT_EQ(miss.rejected[0].method, Method::Rule);
    EXPECT_FALSE(miss.rejected[0].usable());
}

TEST(Arbitrator, ForcedMethodSkipsStages) {
    FakeClassifier clf("ip_address", 0.3, "ipconfig /all");
    rules::RuleMatcher rules;
    Collaborators parts; parts.classifier = &clf; parts.rules = &rules;
    Arbitrator arb(OsFamily::Windows, parts);

    auto by_rule = arb.resolve("show my ip address", Method::Rule);
    EXPECT_EQ(by_rule.method(), Method::Rule);
    EXPECT_EQ(clf.calls, 0);

    // restricted to a weak classifier: no rule rescue, no fallback
    auto by_ml = arb.resolve("show my ip address", Method::Ml);
    EXPECT_EQ(clf.calls, 1);
    EXPECT_EQ(by_ml.status, DecisionStatus::Unresolved);
    ASSERT_EQ(by_ml.rejected.size(), 1u);
    EXPECT_EQ(by_ml.rejected[0].metadata.at("suggested_command"), "ipconfig /all");
}

TEST(Arbitrator, RestrictableMethods) {
    EXPECT_EQ(parse_method("ml"), Method::Ml);
    EXPECT_EQ(parse_method("fuzzy"), Method::Fuzzy);
    EXPECT_EQ(parse_method("rule"), Method::Rule);
    EXPECT_FALSE(parse_method("template").has_value());
    EXPECT_FALSE(parse_method("RULE").has_value());
}

TEST(Arbitrator, LowConfidenceWarningFormat) {
    EXPECT_EQ(Arbitrator::low_confidence_warning(0.734), "Low confidence (73.4%), please verify");
}

TEST(EngineContextTest, FuzzyAndDiagnosisThroughContext) {
    auto ds = test_dataset();
    ASSERT_TRUE(ds.has_value());
    EngineContext linux_ctx(OsFamily::Linux, ds, nullptr);
    auto typo = linux_ctx.arbitrator().resolve("lst all fils");
    ASSERT_TRUE(typo.success());
    EXPECT_EQ(typo.method(), Method::Fuzzy);
    EXPECT_EQ(typo.command().value_or(""), "ls -la");
    EXPECT_EQ(typo.chosen->metadata.at("translated"), "true");
    EXPECT_NEAR(typo.confidence(), 0.923, 0.001);

    EngineContext win_ctx(OsFamily::Windows, ds, nullptr);
    auto diag = win_ctx.arbitrator().resolve("internet not wrking");
    ASSERT_TRUE(diag.success());
    EXPECT_EQ(diag.method(), Method::ProblemDiagnosis);
    EXPECT_EQ(diag.command().value_or(""), "ipconfig /release && ipconfig /renew && ipconfig /flushdns");
    EXPECT_DOUBLE_EQ(diag.confidence(), 0.9);
    EXPECT_EQ(diag.chosen->metadata.at("category"), "network");
}

TEST(EngineContextTest, ConfiguredKeywordClassifier) {
    config::Config cfg;
    cfg.dataset_path = NL2CMD_TEST_DATA;
    cfg.os_family = "linux";
    EngineContext ctx(cfg);
    ASSERT_NE(ctx.classifier(), nullptr);
    EXPECT_EQ(ctx.classifier()->name(), "keyword");
    EXPECT_EQ(ctx.os(), OsFamily::Linux);
    auto d = ctx.arbitrator().resolve("show my ip address");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.method(), Method::Ml);
    EXPECT_EQ(d.command().value_or(""), "ip addr show");
    EXPECT_EQ(ctx.status_lines().size(), 5u);
    auto vocab = ctx.vocabulary();
    EXPECT_NE(std::find(vocab.begin(), vocab.end(), "hidden"), vocab.end());
}

TEST(EngineContextTest, MissingDatasetDegradesGracefully) {
    config::Config cfg;
    cfg.dataset_path = "/nonexistent/nl2cmd.json";
    cfg.os_family = "windows";
    EngineContext ctx(cfg);
    EXPECT_EQ(ctx.dataset(), nullptr);
    EXPECT_EQ(ctx.classifier(), nullptr);
    EXPECT_EQ(ctx.matcher(), nullptr);
    auto d = ctx.arbitrator().resolve("show my ip address");
    ASSERT_TRUE(d.success());
    EXPECT_EQ(d.method(), Method::Rule);
    EXPECT_EQ(d.command().value_or(""), "ipconfig");
}
