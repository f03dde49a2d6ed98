#include <gtest/gtest.h>
#include <steward/testing/common.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef STEWARD_EXECUTABLE_PATH
#define STEWARD_EXECUTABLE_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen((command + " 2>&1").c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string steward_binary() {
  return std::string{STEWARD_EXECUTABLE_PATH};
}

}  // namespace

TEST(steward_cli, help_lists_options_and_exits_cleanly) {
  auto steward = steward_binary();
  if (steward.empty() || !std::filesystem::exists(steward)) {
    GTEST_SKIP() << "steward binary not available: " << steward;
  }
  auto [exit_code, output] = run_capture(shell_quote(steward) + " --help");
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_NE(output.find("--tenant"), std::string::npos) << output;
  EXPECT_NE(output.find("--state-root"), std::string::npos) << output;
}

TEST(steward_cli, usage_errors_exit_64) {
  auto steward = steward_binary();
  if (steward.empty() || !std::filesystem::exists(steward)) {
    GTEST_SKIP() << "steward binary not available: " << steward;
  }
  auto [unknown, unknown_output] =
      run_capture(shell_quote(steward) + " destroy");
  EXPECT_EQ(unknown, 64) << unknown_output;
  EXPECT_NE(unknown_output.find("unknown command"), std::string::npos);

  auto [missing, missing_output] = run_capture(shell_quote(steward));
  EXPECT_EQ(missing, 64) << missing_output;

  auto [bad_option, bad_option_output] =
      run_capture(shell_quote(steward) + " deploy --frobnicate");
  EXPECT_EQ(bad_option, 64) << bad_option_output;
}

TEST(steward_cli, deploy_with_missing_inputs_fails_without_side_effects) {
  auto steward = steward_binary();
  if (steward.empty() || !std::filesystem::exists(steward)) {
    GTEST_SKIP() << "steward binary not available: " << steward;
  }
  auto scratch = steward::testing::make_temp_path("steward_cli");
  std::filesystem::create_directories(scratch);
  auto state_root = scratch / "state";
  auto log_file = scratch / "steward.log";

  auto [exit_code, output] = run_capture(
      shell_quote(steward) + " deploy --tenant acme --mode production" +
      " --state-root " + shell_quote(state_root.string()) + " --log-file " +
      shell_quote(log_file.string()) + " --runtime-executable " +
      shell_quote("steward-no-such-runtime"));
  EXPECT_EQ(exit_code, 1) << output;
  EXPECT_NE(output.find("credential"), std::string::npos) << output;
  EXPECT_NE(output.find("image"), std::string::npos) << output;
  EXPECT_FALSE(std::filesystem::exists(state_root));
  EXPECT_TRUE(std::filesystem::exists(log_file));

  steward::testing::remove_path(scratch);
}

TEST(steward_cli, status_reports_an_undeployed_tenant) {
  auto steward = steward_binary();
  if (steward.empty() || !std::filesystem::exists(steward)) {
    GTEST_SKIP() << "steward binary not available: " << steward;
  }
  auto scratch = steward::testing::make_temp_path("steward_cli_status");
  std::filesystem::create_directories(scratch);

  auto [exit_code, output] = run_capture(
      shell_quote(steward) + " status --tenant acme-bots --state-root " +
      shell_quote((scratch / "state").string()) + " --log-file " +
      shell_quote((scratch / "steward.log").string()) +
      " --runtime-executable /bin/false");
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_NE(output.find("acme_bots_db"), std::string::npos) << output;
  EXPECT_NE(output.find("release:    none"), std::string::npos) << output;
  EXPECT_NE(output.find("container runtime unavailable"), std::string::npos)
      << output;

  steward::testing::remove_path(scratch);
}
