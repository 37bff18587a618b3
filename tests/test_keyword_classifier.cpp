#include <gtest/gtest.h>
#include <nl2cmd/ai/keyword_classifier.hpp>

using namespace nl2cmd;
using namespace nl2cmd::ai;

class KeywordClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ds = data::load_dataset(NL2CMD_TEST_DATA);
        ASSERT_TRUE(ds.has_value());
        clf = std::make_unique<KeywordClassifier>(std::make_shared<const data::Dataset>(std::move(*ds)));
    }
    std::unique_ptr<KeywordClassifier> clf;
};

TEST(KeywordFeatures, UnigramsAndBigrams) {
    auto f = KeywordClassifier::features("Show the files!");
    EXPECT_EQ(f, (std::vector<std::string>{"show", "files", "show files"}));
    EXPECT_TRUE(KeywordClassifier::features("the of").empty());
}

TEST_F(KeywordClassifierTest, PredictsKnownIntents) {
    EXPECT_EQ(clf->name(), "keyword");
    EXPECT_GT(clf->label_count(), 40u);

    auto ip = clf->predict("show my ip address");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(ip->label, "ip_address");
    EXPECT_GT(ip->confidence(), 0.7);
    EXPECT_LE(ip->confidence(), 1.0 + 1e-9);

    auto kill = clf->predict("kill chrome");
    ASSERT_TRUE(kill.has_value());
    EXPECT_EQ(kill->label, "kill_process");
}

TEST_F(KeywordClassifierTest, NoOverlapNoPrediction) {
    EXPECT_FALSE(clf->predict("zzqx blorp").has_value());
    EXPECT_FALSE(clf->predict("").has_value());
}

TEST_F(KeywordClassifierTest, LabelToCommandPerOs) {
    EXPECT_EQ(clf->label_to_command("kill_process", OsFamily::Windows).value_or(""), "taskkill /IM chrome.exe /F");
    EXPECT_EQ(clf->label_to_command("kill_process", OsFamily::Linux).value_or(""), "pkill chrome");
    EXPECT_FALSE(clf->label_to_command("no_such_intent", OsFamily::Linux).has_value());
}

TEST(KeywordClassifierEmpty, NullDataset) {
    KeywordClassifier clf(nullptr);
    EXPECT_EQ(clf.label_count(), 0u);
    EXPECT_FALSE(clf.predict("list files").has_value());
    EXPECT_FALSE(clf.label_to_command("list_files", OsFamily::Linux).has_value());
}
