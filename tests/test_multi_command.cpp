/*
 * Multi-command orchestration tests - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <nl2cmd/config/config.hpp>
#include <nl2cmd/engine/context.hpp>
#include <nl2cmd/engine/multi_command.hpp>

using namespace nl2cmd;
using namespace nl2cmd::engine;

namespace {

const char* kFolderThenFile = "create a folder named proj and then create a file named notes.txt inside the folder";

CommandSegment done_segment(const std::string& cmd) {
    CommandSegment s;
    s.decision.status = DecisionStatus::Resolved;
    s.decision.chosen = CandidateResolution::resolved(Method::Template, cmd, 0.95);
    return s;
}

} // namespace

TEST(MultiCommandDetect, NeedsTwoVerbsAndAConjunction) {
    EXPECT_EQ(MultiCommandProcessor::count_action_verbs(kFolderThenFile), 2);
    EXPECT_EQ(MultiCommandProcessor::find_conjunction(kFolderThenFile).value_or(""), "and then");
    EXPECT_TRUE(MultiCommandProcessor::is_multi_command(kFolderThenFile));
    EXPECT_FALSE(MultiCommandProcessor::is_multi_command("list files and folders"));
    EXPECT_FALSE(MultiCommandProcessor::is_multi_command("create x, delete y"));
    EXPECT_FALSE(MultiCommandProcessor::find_conjunction("expand the thenar").has_value());
}

TEST(MultiCommandSplit, FirstProductiveSeparatorWins) {
    auto comma = MultiCommandProcessor::split("make a, b; c");
    ASSERT_EQ(comma.size(), 2u);
    EXPECT_EQ(comma[1], "b; c");

    auto then = MultiCommandProcessor::split("list files then show date");
    EXPECT_EQ(then, (std::vector<std::string>{"list files", "show date"}));

    auto and_then = MultiCommandProcessor::split("create x and then delete y");
    EXPECT_EQ(and_then, (std::vector<std::string>{"create x", "delete y"}));

    EXPECT_EQ(MultiCommandProcessor::split("  single request  "), std::vector<std::string>{"single request"});
}

TEST(MultiCommandContext, FolderFromEarlierMkdir) {
    std::vector<CommandSegment> prev{done_segment("mkdir -p \"proj\""), done_segment("cd proj")};
    EXPECT_EQ(MultiCommandProcessor::created_folder(prev).value_or(""), "proj");

    std::vector<CommandSegment> failed{CommandSegment{}};
    EXPECT_FALSE(MultiCommandProcessor::created_folder(failed).has_value());

    Arbitrator arb(OsFamily::Linux, Collaborators{});
    MultiCommandProcessor mcp(arb);
    EXPECT_EQ(mcp.resolve_context("create a file named a.txt inside the folder", prev), "create a file named proj/a.txt");
    EXPECT_EQ(mcp.resolve_context("create a file called b.md in it", prev), "create a file called proj/b.md");
    EXPECT_EQ(mcp.resolve_context("create a file named c.txt", prev), "create a file named c.txt");
    EXPECT_EQ(mcp.resolve_context("create a file named notes.txt in items", prev), "create a file named notes.txt in items");
    EXPECT_EQ(mcp.resolve_context("create a file named log.txt inside folders", prev), "create a file named log.txt inside folders");

    Arbitrator win(OsFamily::Windows, Collaborators{});
    MultiCommandProcessor wmcp(win);
    EXPECT_EQ(wmcp.resolve_context("make file named 2024.log in that folder", prev), "make file named proj\\2024.log");
}

class ChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        ds = data::load_dataset(NL2CMD_TEST_DATA);
        ASSERT_TRUE(ds.has_value());
    }
    std::optional<data::Dataset> ds;
};

TEST_F(ChainTest, FolderThenFileWindows) {
    EngineContext ctx(OsFamily::Windows, ds, nullptr);
    auto chain = ctx.orchestrator().process(kFolderThenFile);
    ASSERT_TRUE(chain.success());
    EXPECT_TRUE(chain.is_multi_command);
    ASSERT_EQ(chain.segments.size(), 2u);
    EXPECT_EQ(chain.segments[0].order, 1);
    EXPECT_EQ(chain.segments[1].order, 2);
    EXPECT_EQ(chain.segments[1].resolved_text, "create a file named proj\\notes.txt");
    EXPECT_EQ(*chain.chained_command, "mkdir proj && echo. > proj\\notes.txt");
    EXPECT_DOUBLE_EQ(chain.confidence, 0.95);
}

TEST_F(ChainTest, FolderThenFileLinux) {
    EngineContext ctx(OsFamily::Linux, ds, nullptr);
    auto chain = ctx.orchestrator().process(kFolderThenFile);
    ASSERT_TRUE(chain.success());
    EXPECT_EQ(*chain.chained_command, "mkdir proj && touch proj/notes.txt");
}

TEST_F(ChainTest, ConfidenceIsTheMinimum) {
    EngineContext ctx(OsFamily::Linux, ds, nullptr);
    auto chain = ctx.orchestrator().process("create a folder named logs and then show my ip address");
    ASSERT_TRUE(chain.success());
    ASSERT_EQ(chain.segments.size(), 2u);
    EXPECT_EQ(*chain.chained_command, "mkdir logs && ip addr show");
    EXPECT_DOUBLE_EQ(chain.confidence, 0.95);
}

TEST_F(ChainTest, AnyFailedSegmentBlocksTheChain) {
    EngineContext ctx(OsFamily::Linux, ds, nullptr);
    auto chain = ctx.orchestrator().process("create a folder named proj and then make zzqx blorp");
    EXPECT_TRUE(chain.is_multi_command);
    EXPECT_FALSE(chain.success());
    EXPECT_FALSE(chain.chained_command.has_value());
    EXPECT_EQ(chain.error_kind, ErrorKind::PartialChainFailure);
    EXPECT_EQ(chain.error, "Cannot chain - 1 of 2 commands failed");
    ASSERT_EQ(chain.segments.size(), 2u);
    EXPECT_TRUE(chain.segments[0].success());
    EXPECT_FALSE(chain.segments[1].success());
    EXPECT_DOUBLE_EQ(chain.confidence, 0.0);
}

TEST_F(ChainTest, KeywordClassifierDoesNotPatchAFailedSegment) {
    config::Config cfg;
    cfg.dataset_path = NL2CMD_TEST_DATA;
    cfg.os_family = "linux";
    EngineContext ctx(cfg);
    ASSERT_NE(ctx.classifier(), nullptr);
    auto chain = ctx.orchestrator().process("create a folder named proj and then make zzqx blorp");
    EXPECT_FALSE(chain.success());
    EXPECT_EQ(chain.error_kind, ErrorKind::PartialChainFailure);
    ASSERT_EQ(chain.segments.size(), 2u);
    EXPECT_EQ(chain.segments[0].decision.command().value_or(""), "mkdir proj");
    EXPECT_EQ(chain.segments[1].decision.status, DecisionStatus::Unresolved);

    auto gibberish = ctx.orchestrator().process("some random text xyz");
    EXPECT_FALSE(gibberish.success());
    EXPECT_EQ(gibberish.error_kind, ErrorKind::NoResolution);
}

TEST_F(ChainTest, SingleRequestPassesThrough) {
    EngineContext ctx(OsFamily::Linux, ds, nullptr);
    auto chain = ctx.orchestrator().process("show my ip address");
    EXPECT_FALSE(chain.is_multi_command);
    ASSERT_EQ(chain.segments.size(), 1u);
    ASSERT_TRUE(chain.success());
    EXPECT_EQ(*chain.chained_command, "ip addr show");
    EXPECT_EQ(*chain.chained_command, *chain.segments[0].decision.command());

    auto forced = ctx.orchestrator().process("show my ip address", Method::Rule);
    ASSERT_TRUE(forced.success());
    EXPECT_EQ(forced.segments[0].decision.method(), Method::Rule);

    auto invalid = ctx.orchestrator().process("the of");
    EXPECT_FALSE(invalid.success());
    EXPECT_EQ(invalid.error_kind, ErrorKind::InvalidInput);
}
