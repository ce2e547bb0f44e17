#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tests/cli/cli_test_fixture.hpp"

namespace netqasm::test {
namespace {

constexpr const char* kBellHalf =
    "# NETQASM 1.0\n"
    "# APPID 3\n"
    "set Q0 0\n"
    "qalloc Q0\n"
    "init Q0\n"
    "h Q0\n"
    "meas Q0 M0\n"
    "qfree Q0\n"
    "ret_reg M0\n";

class CommandTest : public CliTestFixture {};

TEST_F(CommandTest, CheckAcceptsValidSubroutine) {
  WriteFile("bell.nqasm", kBellHalf);

  auto result = Run({"check", "bell.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.combined_output.find("7 instruction(s)"), std::string::npos)
      << result.combined_output;
}

TEST_F(CommandTest, CheckReportsParseErrorWithLine) {
  WriteFile("bad.nqasm", "set Q0 0\nfrobnicate Q0\n");

  auto result = Run({"check", "bad.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("line 2"), std::string::npos)
      << result.combined_output;
  EXPECT_NE(result.combined_output.find("EncodingError"), std::string::npos);
}

TEST_F(CommandTest, CheckRejectsGateOutsideFlavour) {
  WriteFile("bell.nqasm", kBellHalf);

  auto result = Run({"check", "--flavour", "nv", "bell.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("UnsupportedOperationError"),
      std::string::npos)
      << result.combined_output;
}

TEST_F(CommandTest, MissingFileIsHostError) {
  auto result = Run({"check", "missing.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("cannot open"), std::string::npos);
}

TEST_F(CommandTest, PrintCanonicalizesText) {
  WriteFile(
      "prog.nqasm",
      "// leading comment\n"
      "# DEFINE q Q0\n"
      "set $q 0\n"
      "qalloc $q\n");

  auto result = Run({"print", "prog.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(
      result.combined_output,
      "# NETQASM 1.0\n# APPID 0\nset Q0 0\nqalloc Q0\n");
}

TEST_F(CommandTest, EncodeWritesBinaryNextToInput) {
  WriteFile("bell.nqasm", kBellHalf);

  auto result = Run({"encode", "bell.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  ASSERT_TRUE(FileExists("bell.nqb"));
  auto bytes = ReadFile("bell.nqb");
  // Metadata plus seven commands.
  ASSERT_EQ(bytes.size(), 4U + (7U * 7U));
  EXPECT_EQ(bytes[0], '\x01');
  EXPECT_EQ(bytes[2], '\x03');
}

TEST_F(CommandTest, DecodeRestoresText) {
  WriteFile("bell.nqasm", kBellHalf);
  ASSERT_TRUE(Run({"encode", "bell.nqasm", "-o", "out.nqb"}).Success());

  auto result = Run({"decode", "out.nqb", "-o", "round.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(ReadFile("round.nqasm"), kBellHalf);
}

TEST_F(CommandTest, DecodeRejectsTextInput) {
  WriteFile("bell.nqasm", kBellHalf);

  auto result = Run({"decode", "bell.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find(".nqb"), std::string::npos);
}

TEST_F(CommandTest, DecodeRejectsTruncatedBinary) {
  WriteFile("short.nqb", std::string("\x01\x00", 2));

  auto result = Run({"decode", "short.nqb"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("InvalidEncoding"), std::string::npos)
      << result.combined_output;
}

TEST_F(CommandTest, RunReportsReturnedRegister) {
  WriteFile("bell.nqasm", kBellHalf);

  auto result = Run({"run", "--outcome", "1", "bell.nqasm"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.combined_output.find("returned M0 = 1"), std::string::npos)
      << result.combined_output;
}

TEST_F(CommandTest, RunReportsExecutionError) {
  WriteFile(
      "div.nqasm",
      "set R0 1\n"
      "set R1 0\n"
      "div R2 R0 R1\n");

  auto result = Run({"run", "div.nqasm"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("ExecutionError"), std::string::npos)
      << result.combined_output;
}

TEST_F(CommandTest, NoSubcommandPrintsUsage) {
  auto result = Run(std::vector<std::string>{});

  EXPECT_TRUE(result.Success());
  EXPECT_NE(result.combined_output.find("Usage"), std::string::npos);
}

}  // namespace
}  // namespace netqasm::test
