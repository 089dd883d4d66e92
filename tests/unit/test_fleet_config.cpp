#include "TestFixtures.hpp"
#include "tmux-fleet/FleetConfig.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace fleet;
using fleet::test::TempWorkspaceTest;

TEST(FleetConfig, Defaults) {
  FleetConfig config;
  EXPECT_EQ(config.session_name, "fleet");
  EXPECT_EQ(config.artifact_name, "fleet-server");
  EXPECT_EQ(config.log_file_name, "out.log");
  EXPECT_EQ(config.backup_dir_name, ".backup");
  EXPECT_EQ(config.tmux_binary, "tmux");
  EXPECT_EQ(config.instance_env_var, "INSTANCE_NAME");
  EXPECT_TRUE(config.validate().ok());
}

TEST(FleetConfig, EmptyDocumentKeepsDefaults) {
  auto config = FleetConfig::from_yaml_string("");
  ASSERT_TRUE(config.ok()) << config.error().message;
  EXPECT_EQ(config.value().session_name, "fleet");
}

TEST(FleetConfig, OverridesFromYaml) {
  auto config = FleetConfig::from_yaml_string(R"(
session: lab
artifact: mini-web
log_file: server.log
backup_dir: log-archive
tmux_binary: /opt/tmux/bin/tmux
instance_env_var: APP_NAME
logging:
  file: fleetctl.log
  level: debug
)");
  ASSERT_TRUE(config.ok()) << config.error().message;
  const auto &c = config.value();
  EXPECT_EQ(c.session_name, "lab");
  EXPECT_EQ(c.artifact_name, "mini-web");
  EXPECT_EQ(c.log_file_name, "server.log");
  EXPECT_EQ(c.backup_dir_name, "log-archive");
  EXPECT_EQ(c.tmux_binary, "/opt/tmux/bin/tmux");
  EXPECT_EQ(c.instance_env_var, "APP_NAME");
  EXPECT_EQ(c.tool_log_file, "fleetctl.log");
  EXPECT_EQ(c.tool_log_level, "debug");
}

TEST(FleetConfig, UnknownKeysAreIgnored) {
  auto config = FleetConfig::from_yaml_string("session: lab\ncolour: blue\n");
  ASSERT_TRUE(config.ok());
  EXPECT_EQ(config.value().session_name, "lab");
}

TEST(FleetConfig, RejectsWrongTypes) {
  auto config = FleetConfig::from_yaml_string("session: [a, b]\n");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.error().kind, ErrorKind::InvalidInput);

  config = FleetConfig::from_yaml_string("logging: verbose\n");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.error().kind, ErrorKind::InvalidInput);

  config = FleetConfig::from_yaml_string("- just\n- a list\n");
  ASSERT_FALSE(config.ok());
}

TEST(FleetConfig, RejectsMalformedYaml) {
  auto config = FleetConfig::from_yaml_string("session: [unterminated\n");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.error().kind, ErrorKind::InvalidInput);
}

TEST(FleetConfig, RejectsTmuxTargetSeparatorsInSession) {
  EXPECT_FALSE(FleetConfig::from_yaml_string("session: a:b\n").ok());
  EXPECT_FALSE(FleetConfig::from_yaml_string("session: a.b\n").ok());
  EXPECT_FALSE(FleetConfig::from_yaml_string("session: ''\n").ok());
}

TEST(FleetConfig, RejectsPathsWhereFileNamesExpected) {
  EXPECT_FALSE(FleetConfig::from_yaml_string("artifact: bin/server\n").ok());
  EXPECT_FALSE(FleetConfig::from_yaml_string("log_file: ../out.log\n").ok());
  EXPECT_FALSE(FleetConfig::from_yaml_string("backup_dir: ..\n").ok());
  EXPECT_FALSE(
      FleetConfig::from_yaml_string("instance_env_var: 'A B'\n").ok());
  EXPECT_FALSE(FleetConfig::from_yaml_string("instance_env_var: 1X\n").ok());
}

TEST(FleetConfig, RejectsNamesThatLookLikeInstances) {
  auto config = FleetConfig::from_yaml_string("backup_dir: archive\n");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.error().kind, ErrorKind::InvalidInput);
  EXPECT_NE(config.error().message.find("archive"), std::string::npos);

  EXPECT_FALSE(FleetConfig::from_yaml_string("artifact: server\n").ok());
  EXPECT_FALSE(
      FleetConfig::from_yaml_string("artifact: x.bin\nbackup_dir: x.bin\n")
          .ok());
  EXPECT_TRUE(FleetConfig::from_yaml_string("backup_dir: Archive\n").ok());
  EXPECT_TRUE(FleetConfig::from_yaml_string("artifact: server.bin\n").ok());
}

class FleetConfigFileTest : public TempWorkspaceTest {};

TEST_F(FleetConfigFileTest, LoadsFile) {
  write_file("custom.yaml", "session: fromfile\n");
  auto config = FleetConfig::load_file(workspace_ / "custom.yaml");
  ASSERT_TRUE(config.ok()) << config.error().message;
  EXPECT_EQ(config.value().session_name, "fromfile");
}

TEST_F(FleetConfigFileTest, MissingFileIsInvalidInput) {
  auto config = FleetConfig::load_file(workspace_ / "nope.yaml");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.error().kind, ErrorKind::InvalidInput);
  EXPECT_NE(config.error().message.find("nope.yaml"), std::string::npos);
}

TEST_F(FleetConfigFileTest, ResolveUsesExplicitPathAndCurrentDirectory) {
  write_file("explicit.yaml", "session: explicit\n");
  auto config = FleetConfig::resolve((workspace_ / "explicit.yaml").string());
  ASSERT_TRUE(config.ok()) << config.error().message;
  EXPECT_EQ(config.value().session_name, "explicit");
  EXPECT_EQ(config.value().working_dir, std::filesystem::current_path());
}

TEST_F(FleetConfigFileTest, ResolveFallsBackToEnvironment) {
  write_file("env.yaml", "session: fromenv\n");
  ::setenv(kConfigEnvVar, (workspace_ / "env.yaml").c_str(), 1);
  auto config = FleetConfig::resolve(std::nullopt);
  ::unsetenv(kConfigEnvVar);
  ASSERT_TRUE(config.ok()) << config.error().message;
  EXPECT_EQ(config.value().session_name, "fromenv");
}
