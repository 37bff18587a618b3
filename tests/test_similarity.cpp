#include <gtest/gtest.h>
#include <nl2cmd/match/similarity.hpp>

using namespace nl2cmd::match;

TEST(Similarity, Ratio) {
    EXPECT_DOUBLE_EQ(ratio("abc", "abc"), 100.0);
    EXPECT_DOUBLE_EQ(ratio("abcd", "abce"), 75.0);
    EXPECT_DOUBLE_EQ(ratio("", ""), 100.0);
    EXPECT_DOUBLE_EQ(ratio("abc", ""), 0.0);
    EXPECT_EQ(lcs_length("lst all fils", "list all files"), 12u);
}

TEST(Similarity, PartialAndTokenRatios) {
    EXPECT_DOUBLE_EQ(partial_ratio("abc", "xxabcxx"), 100.0);
    EXPECT_DOUBLE_EQ(token_sort_ratio("files all list", "list all files"), 100.0);
    EXPECT_DOUBLE_EQ(token_set_ratio("list files", "list all files"), 100.0);
    EXPECT_DOUBLE_EQ(partial_token_set_ratio("kill chrome now", "chrome"), 100.0);
    EXPECT_LT(token_set_ratio("abc", "xyz"), 50.0);
}

TEST(Similarity, WeightedRatioToleratesTypos) {
    EXPECT_DOUBLE_EQ(weighted_ratio("", "list"), 0.0);
    EXPECT_NEAR(weighted_ratio("lst all fils", "list all files"), 92.307, 0.01);
    EXPECT_GT(weighted_ratio("lst all fils", "list all files"), weighted_ratio("lst all fils", "list all branches"));
    EXPECT_DOUBLE_EQ(weighted_ratio("show date", "show date"), 100.0);
}
