/*
 * Risk gate tests - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <nl2cmd/safety/risk.hpp>

using namespace nl2cmd::safety;

TEST(Risk, SafeCommands) {
    EXPECT_FALSE(is_risky_command("ls -la"));
    EXPECT_FALSE(is_risky_command("git add ."));
    EXPECT_FALSE(is_risky_command("systeminfo | findstr /C:\"Available Physical Memory\""));
    EXPECT_EQ(safety_report("dir"), "This command appears safe to execute");
}

TEST(Risk, HighestSeverityWins) {
    auto a = assess_risk("sudo rm -rf /");
    ASSERT_TRUE(a.is_risky);
    EXPECT_EQ(*a.severity, Severity::Critical);
    EXPECT_EQ(a.matches.size(), 3u);    // "rm -rf /", "rm -rf", "rm "
    EXPECT_EQ(a.matches[0].keyword, "rm -rf /");

    auto tmp = assess_risk("rm -rf /tmp/build");
    ASSERT_TRUE(tmp.is_risky);
    EXPECT_EQ(tmp.matches[0].keyword, "rm -rf");
}

TEST(Risk, SeverityLevels) {
    EXPECT_EQ(*assess_risk("shutdown /s /t 0").severity, Severity::High);
    EXPECT_EQ(*assess_risk("del file.txt").severity, Severity::Medium);
    EXPECT_EQ(*assess_risk("pkill chrome").severity, Severity::Medium);
    EXPECT_EQ(*assess_risk("sudo ufw status").severity, Severity::Low);
    EXPECT_EQ(*assess_risk("dd if=/dev/zero of=/dev/sdb").severity, Severity::Critical);
    EXPECT_EQ(*assess_risk("CHOWN -R user /srv").severity, Severity::Medium);
}

TEST(Risk, ReportListsPatterns) {
    auto r = safety_report("del /s /q C:\\temp");
    EXPECT_NE(r.find("Risk Level: CRITICAL"), std::string::npos);
    EXPECT_NE(r.find("Risky Patterns Found: 2"), std::string::npos);
    EXPECT_NE(r.find("Alternative:"), std::string::npos);
}
