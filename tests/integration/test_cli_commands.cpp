#include "TestFixtures.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <sys/wait.h>

#ifndef FLEETCTL_BINARY
#error "FLEETCTL_BINARY must point at the built fleetctl"
#endif

using fleet::test::TempWorkspaceTest;

namespace fs = std::filesystem;

namespace {

// Stand-in tmux: the session is a file listing its window names
const char *kFakeTmux = R"(#!/bin/sh
state="$(dirname "$0")/session.txt"
echo "$@" >> "$(dirname "$0")/tmux-calls.txt"
case "$1" in
  has-session)
    [ -f "$state" ] && exit 0
    echo "can't find session: itest" >&2; exit 1 ;;
  list-windows)
    [ -f "$state" ] && { cat "$state"; exit 0; }
    echo "can't find session: itest" >&2; exit 1 ;;
  new-session) echo "$6" > "$state" ;;
  new-window) echo "$5" >> "$state" ;;
  kill-window)
    window="${3#*:=}"
    grep -vx "$window" "$state" > "$state.tmp"
    if [ -s "$state.tmp" ]; then mv "$state.tmp" "$state"
    else rm -f "$state" "$state.tmp"; fi ;;
  kill-session)
    [ -f "$state" ] || { echo "can't find session: itest" >&2; exit 1; }
    rm -f "$state" ;;
esac
exit 0
)";

class CLITest : public TempWorkspaceTest {
protected:
  void SetUp() override {
    TempWorkspaceTest::SetUp();
    write_file("bin/tmux", kFakeTmux);
    fs::permissions(workspace_ / "bin" / "tmux", fs::perms::owner_all,
                    fs::perm_options::replace);
    write_file("tmux-fleet.yaml",
               "session: itest\ntmux_binary: " +
                   (workspace_ / "bin" / "tmux").string() + "\n");
  }

  // Run fleetctl inside the workspace, capturing both streams
  int run_fleetctl(const std::string &args) {
    std::string command = "cd '" + workspace_.string() + "' && '" +
                          FLEETCTL_BINARY + "' " + args +
                          " --config tmux-fleet.yaml > stdout.txt 2> stderr.txt";
    int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status))
      return -1;
    return WEXITSTATUS(status);
  }

  int run_bare(const std::string &args) {
    std::string command = "cd '" + workspace_.string() + "' && '" +
                          FLEETCTL_BINARY + "' " + args +
                          " > stdout.txt 2> stderr.txt";
    int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status))
      return -1;
    return WEXITSTATUS(status);
  }

  std::string out() const { return read_file("stdout.txt"); }
  std::string err() const { return read_file("stderr.txt"); }
};

} // namespace

TEST_F(CLITest, NoCommandPrintsUsageAndFails) {
  EXPECT_EQ(run_bare(""), 1);
  EXPECT_NE(err().find("Usage: fleetctl"), std::string::npos);
}

TEST_F(CLITest, HelpSucceeds) {
  EXPECT_EQ(run_bare("--help"), 0);
  EXPECT_NE(out().find("collect_all"), std::string::npos);
}

TEST_F(CLITest, UnknownCommandFails) {
  EXPECT_EQ(run_bare("restart"), 1);
  EXPECT_NE(err().find("Unknown command: restart"), std::string::npos);
}

TEST_F(CLITest, MissingRequiredFlagFails) {
  EXPECT_EQ(run_fleetctl("start --name web"), 1);
  EXPECT_NE(err().find("--port"), std::string::npos);
}

TEST_F(CLITest, InvalidNameFails) {
  EXPECT_EQ(run_fleetctl("start --name Web1 --port 8080"), 1);
  EXPECT_NE(err().find("ERROR: --name must be 1..32 lowercase Latin letters"),
            std::string::npos);
  EXPECT_FALSE(fs::exists(workspace_ / "Web1"));
}

TEST_F(CLITest, InvalidPortFails) {
  write_file("fleet-server", "binary");
  EXPECT_EQ(run_fleetctl("start --name web --port eighty"), 1);
  EXPECT_NE(err().find("ERROR: --port must be an integer"), std::string::npos);
}

TEST_F(CLITest, MissingArtifactFails) {
  EXPECT_EQ(run_fleetctl("start --name web --port 8080"), 1);
  EXPECT_NE(err().find("fleet-server not found"), std::string::npos);
  EXPECT_FALSE(fs::exists(workspace_ / "web"));
}

TEST_F(CLITest, StartCollectStop) {
  write_file("fleet-server", "binary");

  ASSERT_EQ(run_fleetctl("start --name web --port 8080"), 0) << err();
  EXPECT_EQ(out(), "Started 'web' on port 8080 in tmux session 'itest'.\n");
  EXPECT_TRUE(fs::exists(workspace_ / "web" / "fleet-server"));

  ASSERT_EQ(run_fleetctl("start --name=api --port=8081"), 0) << err();
  write_file("web/out.log", "ready\n");

  ASSERT_EQ(run_fleetctl("collect_all"), 0) << err();
  EXPECT_EQ(out(), "=== server: api ===\n\n=== server: web ===\nready\n");

  EXPECT_EQ(run_fleetctl("start --name web --port 8080"), 1);
  EXPECT_NE(err().find("already exists"), std::string::npos);

  ASSERT_EQ(run_fleetctl("stop --name web"), 0) << err();
  EXPECT_NE(out().find("Stopped 'web'. Logs moved to "), std::string::npos);
  EXPECT_FALSE(fs::exists(workspace_ / "web"));
  auto files = backup_files();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(read_file(".backup/" + files[0].filename().string()), "ready\n");

  EXPECT_EQ(run_fleetctl("stop --name web"), 1);
  EXPECT_NE(err().find("does not exist"), std::string::npos);

  ASSERT_EQ(run_fleetctl("stop_all"), 0) << err();
  EXPECT_EQ(out(), "Stopped all instances.\n");
  EXPECT_FALSE(fs::exists(workspace_ / "api"));
  EXPECT_FALSE(fs::exists(workspace_ / "bin" / "session.txt"));
  EXPECT_EQ(backup_files().size(), 2u);
}

TEST_F(CLITest, CollectAllWithoutSessionIsEmpty) {
  EXPECT_EQ(run_fleetctl("collect_all"), 0) << err();
  EXPECT_EQ(out(), "");
}

TEST_F(CLITest, StopAllWithNothingRunning) {
  EXPECT_EQ(run_fleetctl("stop_all"), 0) << err();
  EXPECT_EQ(out(), "Stopped all instances.\n");
}

TEST_F(CLITest, BrokenConfigFails) {
  write_file("tmux-fleet.yaml", "session: [oops\n");
  EXPECT_EQ(run_fleetctl("collect_all"), 1);
  EXPECT_NE(err().find("ERROR: "), std::string::npos);
}
