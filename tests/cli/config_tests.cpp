#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace netqasm::test {
namespace {

class ConfigTest : public CliTestFixture {};

// netqasm.toml selects the flavour when no --flavour is given
TEST_F(ConfigTest, ConfigFlavourApplies) {
  WriteConfig("nv", "warn");
  WriteFile("prog.nqasm", "set Q0 0\nqalloc Q0\nh Q0\n");

  auto result = Run({"check", "prog.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("UnsupportedOperationError"),
      std::string::npos)
      << result.combined_output;
}

TEST_F(ConfigTest, FlagOverridesConfig) {
  WriteConfig("nv", "warn");
  WriteFile("prog.nqasm", "set Q0 0\nqalloc Q0\nh Q0\n");

  auto result = Run({"check", "--flavour", "vanilla", "prog.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(result.combined_output.find("vanilla"), std::string::npos);
}

TEST_F(ConfigTest, ConfigFoundFromSubdirectory) {
  WriteConfig("nv", "warn");
  WriteFile("sub/prog.nqasm", "set Q0 0\nqalloc Q0\n");

  auto result = Run({"-C", "sub", "check", "prog.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.combined_output.find("valid for flavour nv"), std::string::npos)
      << result.combined_output;
}

TEST_F(ConfigTest, InvalidConfigIsReported) {
  WriteFile("netqasm.toml", "[session]\nflavour = \"trapped_ion\"\n");
  WriteFile("prog.nqasm", "set R0 1\n");

  auto result = Run({"check", "prog.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("trapped_ion"), std::string::npos)
      << result.combined_output;
}

TEST_F(ConfigTest, WarnLevelSilencesProcessorTrace) {
  WriteConfig("vanilla", "warn");
  WriteFile("prog.nqasm", "set Q0 0\nqalloc Q0\nqfree Q0\n");

  auto result = Run({"run", "prog.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(result.combined_output.find("processor:"), std::string::npos)
      << result.combined_output;
}

TEST_F(ConfigTest, VerboseShowsProcessorTrace) {
  WriteConfig("vanilla", "warn");
  WriteFile("prog.nqasm", "set Q0 0\nqalloc Q0\nqfree Q0\n");

  auto result = Run({"-v", "run", "prog.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.combined_output.find("processor: alloc q0"), std::string::npos)
      << result.combined_output;
}

}  // namespace
}  // namespace netqasm::test
