#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace weld::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Execute command and capture output
// Uses popen to capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

}  // namespace

void CliTestFixture::SetUp() {
  // Create unique test directory
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = tmp / ("weld_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);

  // WELD_OVERRIDE_BINARY wins over the binary the build system points at
  const char* override_bin = std::getenv("WELD_OVERRIDE_BINARY");
  if (override_bin != nullptr) {
    weld_bin_ = override_bin;
  } else {
    weld_bin_ = WELD_BINARY;
  }
}

void CliTestFixture::TearDown() {
  // Clean up test directory
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(std::initializer_list<std::string> args) -> CliResult {
  return RunIn(test_dir_, std::vector<std::string>(args));
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunIn(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, std::initializer_list<std::string> args)
    -> CliResult {
  return RunImpl(dir, std::vector<std::string>(args));
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, const std::vector<std::string>& args)
    -> CliResult {
  return RunImpl(dir, args);
}

auto CliTestFixture::RunImpl(
    const std::filesystem::path& working_dir,
    const std::vector<std::string>& args) -> CliResult {
  // Build command string
  std::ostringstream cmd;
  cmd << "cd " << working_dir.string() << " && " << weld_bin_.string();
  for (const auto& arg : args) {
    // Simple escaping for shell
    cmd << " '" << arg << "'";
  }
  // Redirect stderr to stdout so we capture both
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());

  return CliResult{
      .exit_code = exit_code,
      .stdout_output = output,  // Combined since we redirected
      .stderr_output = "",
      .combined_output = output,
  };
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteWeldToml(
    const std::vector<std::string>& inputs, const std::string& extra) {
  std::ostringstream toml;
  toml << "[project]\n";
  toml << "input = [";
  for (size_t i = 0; i < inputs.size(); ++i) {
    if (i > 0) {
      toml << ", ";
    }
    toml << "\"" << inputs[i] << "\"";
  }
  toml << "]\n";
  if (!extra.empty()) {
    toml << "\n" << extra;
  }
  WriteFile("weld.toml", toml.str());
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  auto full_path = test_dir_ / relative_path;
  std::ifstream in(full_path);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace weld::test
