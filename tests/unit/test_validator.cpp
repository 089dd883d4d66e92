#include "tmux-fleet/Validator.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>

using namespace fleet;

TEST(Validator, AcceptsLowercaseNames) {
  for (const std::string name : {"a", "web", "api", "abcdefghijklmnopqrstuvwxyz"}) {
    auto result = validate_name(name);
    ASSERT_TRUE(result.ok()) << name;
    EXPECT_EQ(result.value(), name);
  }
}

TEST(Validator, AcceptsThirtyTwoLetters) {
  std::string name(32, 'z');
  EXPECT_TRUE(validate_name(name).ok());
  EXPECT_TRUE(is_instance_name(name));
}

TEST(Validator, RejectsThirtyThreeLetters) {
  std::string name(33, 'a');
  auto result = validate_name(name);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
}

TEST(Validator, RejectsEverythingElse) {
  for (const std::string name :
       {"", "Web", "web1", "we-b", "we b", " web", "web\n", "wéb", "_", ".",
        "..", "WEB"}) {
    auto result = validate_name(name);
    EXPECT_FALSE(result.ok()) << "'" << name << "'";
    EXPECT_FALSE(is_instance_name(name)) << "'" << name << "'";
  }
}

TEST(Validator, NameErrorMessage) {
  auto result = validate_name("Bad");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().message,
            "--name must be 1..32 lowercase Latin letters [a-z]");
}

TEST(Validator, ParsesPorts) {
  EXPECT_EQ(validate_port("8080").value(), 8080);
  EXPECT_EQ(validate_port("0").value(), 0);
  EXPECT_EQ(validate_port(" 42 ").value(), 42);
  EXPECT_EQ(validate_port("+7").value(), 7);
}

TEST(Validator, PortRangeIsNotChecked) {
  EXPECT_EQ(validate_port("-1").value(), -1);
  EXPECT_EQ(validate_port("70000").value(), 70000);
}

TEST(Validator, RejectsNonIntegerPorts) {
  for (const std::string port :
       {"", " ", "abc", "80a", "8.0", "0x50", "+", "-", "+-1",
        "99999999999999999999999x"}) {
    auto result = validate_port(port);
    ASSERT_FALSE(result.ok()) << "'" << port << "'";
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
    EXPECT_EQ(result.error().message, "--port must be an integer");
  }
}

TEST(Validator, ReportsIntegerOverflowSeparately) {
  auto result = validate_port("99999999999999999999999");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
  EXPECT_EQ(result.error().message,
            "--port 99999999999999999999999 is out of range");

  result = validate_port(" -99999999999999999999999 ");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().message,
            "--port -99999999999999999999999 is out of range");

  EXPECT_EQ(validate_port("9223372036854775807").value(), INT64_MAX);
}

TEST(ErrorTaxonomy, NotFoundIsAPreconditionFailure) {
  EXPECT_TRUE((Error{ErrorKind::NotFound, ""}.is_precondition()));
  EXPECT_TRUE((Error{ErrorKind::PreconditionFailed, ""}.is_precondition()));
  EXPECT_FALSE((Error{ErrorKind::IOFailure, ""}.is_precondition()));
  EXPECT_FALSE((Error{ErrorKind::ExternalToolError, ""}.is_precondition()));
  EXPECT_STREQ(error_kind_name(ErrorKind::NotFound), "NotFound");
}

TEST(ErrorTaxonomy, StatusDefaultsToOk) {
  Status status;
  EXPECT_TRUE(status.ok());

  Status failed = make_error(ErrorKind::IOFailure, "disk {} full", "sda");
  ASSERT_FALSE(failed.ok());
  EXPECT_EQ(failed.error().message, "disk sda full");
}
