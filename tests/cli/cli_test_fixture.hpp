#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace netqasm::test {

struct CliResult {
  int exit_code;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Runs the netqasm binary inside a fresh temporary directory per test.
// NETQASM_BIN overrides the binary baked in at build time.
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     WriteFile("prog.nqasm", "ret\n");
//     auto result = Run({"check", "prog.nqasm"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a netqasm.toml selecting `flavour`
  void WriteConfig(const std::string& flavour, const std::string& log_level);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path netqasm_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args) -> CliResult;
};

}  // namespace netqasm::test
