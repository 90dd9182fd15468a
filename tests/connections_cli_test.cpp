#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "connections_cli.h"

namespace {

struct CliRun {
  int status = 0;
  std::string out;
  std::string err;
};

CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "connections");
  std::vector<const char *> argv;
  for (const auto &arg : args)
    argv.push_back(arg.c_str());

  std::ostringstream out;
  std::ostringstream err;
  CliRun result;
  result.status = run_connections_cli(static_cast<int>(argv.size()),
                                      argv.data(), out, err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

const char kWin[] = "There is a winning strategy! 🥳\n";
const char kNoWin[] = "There is no winning strategy. 🫤\n";

} // namespace

TEST(ConnectionsCli, DefaultsAreEightSlotsAndFourTries) {
  const CliRun defaults = run({});
  EXPECT_EQ(defaults.status, 0);
  EXPECT_EQ(defaults.out, kNoWin);

  const CliRun spelled_out = run({"-s", "8", "-t", "4"});
  EXPECT_EQ(spelled_out.status, 0);
  EXPECT_EQ(spelled_out.out, defaults.out);
}

TEST(ConnectionsCli, BothVerdictsExitZero) {
  const CliRun lost = run({"--slots", "8", "--tries", "5"});
  EXPECT_EQ(lost.status, 0);
  EXPECT_EQ(lost.out, kNoWin);

  const CliRun won = run({"-s", "8", "-t", "6"});
  EXPECT_EQ(won.status, 0);
  EXPECT_EQ(won.out, kWin);
  EXPECT_TRUE(won.err.empty());
}

TEST(ConnectionsCli, ShowStrategyFollowsTheVerdict) {
  const CliRun won = run({"-t", "6", "--show-strategy", "--dump-json"});
  EXPECT_EQ(won.status, 0);
  EXPECT_EQ(won.out.rfind(kWin, 0), 0u);
  EXPECT_NE(won.out.find("select {"), std::string::npos);
  EXPECT_NE(won.out.find("{\"select\":["), std::string::npos);
}

TEST(ConnectionsCli, BadArgumentsExitOne) {
  const CliRun uneven = run({"-s", "6"});
  EXPECT_EQ(uneven.status, 1);
  EXPECT_TRUE(uneven.out.empty());
  EXPECT_NE(uneven.err.find("multiple"), std::string::npos);

  EXPECT_EQ(run({"-s", "68"}).status, 1);
  EXPECT_EQ(run({"-s", "0"}).status, 1);
  EXPECT_EQ(run({"-t", "-1"}).status, 1);
  EXPECT_EQ(run({"-s", "eight"}).status, 1);
  EXPECT_EQ(run({"-t"}).status, 1);
  EXPECT_EQ(run({"--bogus"}).status, 1);
}

TEST(ConnectionsCli, NodeLimitIsReportedAsAnError) {
  const CliRun capped = run({"-t", "6", "--max-nodes", "1"});
  EXPECT_EQ(capped.status, 1);
  EXPECT_TRUE(capped.out.empty());
  EXPECT_NE(capped.err.find("Search gave up"), std::string::npos);
}

TEST(ConnectionsCli, HelpExitsZero) {
  const CliRun help = run({"-h"});
  EXPECT_EQ(help.status, 0);
  EXPECT_NE(help.out.find("Usage:"), std::string::npos);
}
