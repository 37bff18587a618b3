#include <gtest/gtest.h>
#include <nl2cmd/query/normalizer.hpp>

using namespace nl2cmd::query;

TEST(Normalizer, LowercasesStripsPunctuationAndCollapses) {
    EXPECT_EQ(Normalizer::normalize_text("  Show   ME the FILES!!  "), "show me the files");
    EXPECT_EQ(Normalizer::normalize_text("kill-process my_app"), "kill-process my_app");
    EXPECT_EQ(Normalizer::normalize_text("what's up?"), "what s up");
}

TEST(Normalizer, KeepsNonAsciiLetters) {
    EXPECT_EQ(Normalizer::normalize_text("open caf\xC3\xA9.txt!"), "open caf\xC3\xA9 txt");
    Normalizer n;
    auto q = n.normalize("delete r\xC3\xA9sum\xC3\xA9");
    ASSERT_EQ(q.keywords.size(), 2u);
    EXPECT_EQ(q.keywords[1], "r\xC3\xA9sum\xC3\xA9");
}

TEST(Normalizer, NormalizingTwiceChangesNothing) {
    Normalizer n;
    for (const std::string raw : {"  Show ME the FILES!! ", "kill-process my_app, now", "what's up?",
                                  "create file notes.txt with content \"hi\"", "the and of", "caf\xC3\xA9 -- list"}) {
        std::string once = Normalizer::normalize_text(raw);
        EXPECT_EQ(Normalizer::normalize_text(once), once) << raw;
        EXPECT_EQ(n.normalize(once).keywords, n.normalize(raw).keywords) << raw;
    }
}

TEST(Normalizer, PartitionsKeywords) {
    Normalizer n;
    auto q = n.normalize("Show all hidden files in the folder please");
    EXPECT_TRUE(q.is_valid);
    ASSERT_FALSE(q.keywords.empty());
    EXPECT_EQ(q.keywords.front(), "show");
    EXPECT_EQ(q.actions, std::vector<std::string>{"show"});
    EXPECT_EQ(q.targets, (std::vector<std::string>{"all", "hidden", "files", "folder"}));
    EXPECT_EQ(q.modifiers, std::vector<std::string>{"please"});
}

TEST(Normalizer, StopWordsOnlyIsInvalid) {
    Normalizer n;
    auto q = n.normalize("the and of");
    EXPECT_FALSE(q.is_valid);
    EXPECT_TRUE(q.keywords.empty());
    EXPECT_FALSE(n.normalize("   ").is_valid);
}

TEST(Normalizer, ExtractsParameters) {
    Normalizer n;
    auto q = n.normalize("ping 192.168.1.1 on port 8080");
    EXPECT_EQ(q.parameter("ip").value_or(""), "192.168.1.1");
    EXPECT_EQ(q.parameter("port").value_or(""), "8080");
    EXPECT_EQ(q.parameter("number").value_or(""), "192");

    auto f = n.normalize("create file notes.txt with content \"hello world\"");
    EXPECT_EQ(f.parameter("filename").value_or(""), "notes.txt");
    EXPECT_EQ(f.parameter("content").value_or(""), "hello world");

    auto p = n.normalize("list files in /var/log");
    EXPECT_EQ(p.parameter("path").value_or(""), "/var/log");

    auto e = n.normalize("find all .py files");
    EXPECT_EQ(e.parameter("extension").value_or(""), "py");

    auto u = n.normalize("download https://example.com/a.zip");
    EXPECT_EQ(u.parameter("url").value_or(""), "https://example.com/a.zip");
    EXPECT_FALSE(u.parameter("ip").has_value());
}
