/*
 * Dataset loader tests - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <nl2cmd/data/dataset.hpp>

using namespace nl2cmd;
using namespace nl2cmd::data;

TEST(Dataset, ParsesSectionsAndEscapes) {
    std::string json = R"({
      "windows": [ {"query": "list all files", "intent": "list_files", "command": "dir"} ],
      "linux": [ {"query": "find it", "intent": "find_file", "command": "find . -name \"*x*\""},
                 {"query": "tab\tbed", "intent": "odd", "command": "echo \u00e9", "weight": 2} ],
      "git": [ {"query": "git status", "intent": "git_status", "command": "git status"} ],
      "meta": {"version": 1, "tags": ["a", "b"]}
    })";
    auto ds = parse_dataset_json(json);
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(ds->size(), 4u);
    EXPECT_EQ(ds->section(RecordScope::Linux)[0].command, "find . -name \"*x*\"");
    EXPECT_EQ(ds->section(RecordScope::Linux)[1].query, "tab\tbed");
    EXPECT_EQ(ds->section(RecordScope::Linux)[1].command, "echo \xC3\xA9");
    EXPECT_EQ(ds->records(OsFamily::Windows).size(), 2u);
}

TEST(Dataset, MalformedInputRejected) {
    EXPECT_FALSE(parse_dataset_json("").has_value());
    EXPECT_FALSE(parse_dataset_json("{\"windows\": [ {\"query\": \"x\" ").has_value());
    EXPECT_FALSE(parse_dataset_json("[1,2]").has_value());
    EXPECT_FALSE(parse_dataset_json("{} trailing").has_value());
}

TEST(Dataset, IncompleteRecordsDropped) {
    auto ds = parse_dataset_json(R"({"linux": [{"query": "q", "intent": "i"}, {"query": "a", "intent": "b", "command": "c"}]})");
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(ds->size(), 1u);
}

TEST(Dataset, CommandForIntentFirstWinsAndGitIsShared) {
    Dataset ds({{"a", "list_files", "dir"}, {"b", "list_files", "dir /w"}},
               {{"a", "list_files", "ls -la"}},
               {{"git status", "git_status", "git status"}});
    EXPECT_EQ(ds.command_for_intent("list_files", OsFamily::Windows).value_or(""), "dir");
    EXPECT_EQ(ds.command_for_intent("list_files", OsFamily::Linux).value_or(""), "ls -la");
    EXPECT_EQ(ds.command_for_intent("git_status", OsFamily::Windows).value_or(""), "git status");
    EXPECT_EQ(ds.command_for_intent("git_status", OsFamily::Linux).value_or(""), "git status");
    EXPECT_FALSE(ds.command_for_intent("nope", OsFamily::Linux).has_value());
    auto labels = ds.labels();
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "git_status");
}

TEST(Dataset, LoadsShippedFile) {
    auto ds = load_dataset(NL2CMD_TEST_DATA);
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(ds->section(RecordScope::Windows).size(), 51u);
    EXPECT_EQ(ds->section(RecordScope::Linux).size(), 52u);
    EXPECT_EQ(ds->section(RecordScope::Git).size(), 17u);
    EXPECT_EQ(ds->command_for_intent("ip_address", OsFamily::Linux).value_or(""), "ip addr show");
}

TEST(Dataset, MissingFileIsNotFatal) {
    EXPECT_FALSE(load_dataset("/nonexistent/nl2cmd/data.json").has_value());
}
