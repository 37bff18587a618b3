/*
 * Approximate matcher and diagnosis tests - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <nl2cmd/data/dataset.hpp>
#include <nl2cmd/match/approx_matcher.hpp>
#include <nl2cmd/match/diagnosis.hpp>
#include <algorithm>

using namespace nl2cmd;
using namespace nl2cmd::match;

class MatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ds = data::load_dataset(NL2CMD_TEST_DATA);
        ASSERT_TRUE(ds.has_value());
        matcher = std::make_unique<ApproximateMatcher>(std::make_shared<const data::Dataset>(std::move(*ds)));
    }
    std::unique_ptr<ApproximateMatcher> matcher;
};

TEST_F(MatcherTest, IndexesUniqueQueries) {
    EXPECT_GT(matcher->index_size(), 50u);
    EXPECT_LT(matcher->index_size(), 120u);
    auto vocab = matcher->vocabulary();
    EXPECT_NE(std::find(vocab.begin(), vocab.end(), "files"), vocab.end());
}

TEST_F(MatcherTest, SearchFindsTypoQuery) {
    auto res = matcher->search("lst all fils", 60.0, 5);
    ASSERT_FALSE(res.empty());
    EXPECT_EQ(res[0].key, "list all files");
    EXPECT_GE(res[0].score, 90.0);
    EXPECT_LE(res.size(), 5u);
    for (size_t i = 1; i < res.size(); ++i) EXPECT_GE(res[i - 1].score, res[i].score);
}

TEST_F(MatcherTest, SearchEmptyAndThreshold) {
    EXPECT_TRUE(matcher->search("   ").empty());
    EXPECT_TRUE(matcher->search("qqqqqqqqqqqqqqqqqqqqqq", 99.0).empty());
}

TEST_F(MatcherTest, RaisingThresholdNeverAddsResults) {
    for (const std::string q : {"lst all fils", "show ip", "kill chrome", "create folder"}) {
        size_t previous = matcher->search(q, 0.0, 1000).size();
        for (double t = 10.0; t <= 100.0; t += 10.0) {
            size_t n = matcher->search(q, t, 1000).size();
            EXPECT_LE(n, previous) << q << " at " << t;
            previous = n;
        }
    }
}

TEST_F(MatcherTest, SmartSearchTranslatesToRequestedOs) {
    auto win = matcher->smart_search("lst all fils", OsFamily::Windows);
    ASSERT_TRUE(win.best.has_value());
    EXPECT_EQ(win.best->source, MatchSource::Similarity);
    EXPECT_EQ(win.best->command, "dir");
    EXPECT_FALSE(win.best->translated);

    auto lin = matcher->smart_search("lst all fils", OsFamily::Linux);
    ASSERT_TRUE(lin.best.has_value());
    EXPECT_EQ(lin.best->command, "ls -la");
    EXPECT_TRUE(lin.best->translated);
    EXPECT_GE(lin.confidence, 85.0);
}

TEST_F(MatcherTest, SmartSearchPrefersStrongDiagnosis) {
    auto res = matcher->smart_search("internet not wrking", OsFamily::Windows);
    ASSERT_TRUE(res.best.has_value());
    EXPECT_EQ(res.best->source, MatchSource::ProblemDiagnosis);
    EXPECT_EQ(res.best->command, "ipconfig /release && ipconfig /renew && ipconfig /flushdns");
    EXPECT_EQ(res.best->category, "network");
    EXPECT_DOUBLE_EQ(res.confidence, 90.0);
}

TEST_F(MatcherTest, NothingMatches) {
    auto res = matcher->smart_search("zzqx blorp", OsFamily::Linux);
    EXPECT_FALSE(res.best.has_value());
    EXPECT_DOUBLE_EQ(res.confidence, 0.0);
}

TEST(Diagnosis, RanksByRelevanceAndCapsAtThree) {
    auto sol = diagnose("internet not wrking", OsFamily::Windows);
    ASSERT_FALSE(sol.empty());
    EXPECT_LE(sol.size(), 3u);
    EXPECT_EQ(sol[0].problem, "internet not working");
    EXPECT_EQ(sol[0].relevance, 3);
    for (size_t i = 1; i < sol.size(); ++i) EXPECT_GE(sol[i - 1].relevance, sol[i].relevance);

    auto lin = diagnose("internet not wrking", OsFamily::Linux);
    ASSERT_FALSE(lin.empty());
    EXPECT_EQ(lin[0].command, "sudo systemctl restart NetworkManager");
}

TEST(Diagnosis, NoKeywordNoRemedy) {
    EXPECT_TRUE(diagnose("list all files", OsFamily::Linux).empty());
    EXPECT_FALSE(problem_catalog().empty());
}
