// test_cli_commands.cpp - CLI integration tests for the sync commands

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Run `sync <args>` with `dir` as the working directory.
CliResult run_cli(const fs::path & dir, const std::string & args)
{
  CliResult result;
#ifdef SYN_DSL_CLI_PATH
  const std::string cli = SYN_DSL_CLI_PATH;
  const fs::path out_file = dir / "cli.stdout";
  const fs::path err_file = dir / "cli.stderr";
  const std::string cmd = "cd " + shell_quote(dir.string()) + " && " + shell_quote(cli) + " " +
                          args + " > " + shell_quote(out_file.string()) + " 2> " +
                          shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
#else
  result.exit_code = rc;
#endif
  result.out = read_all(out_file);
  result.err = read_all(err_file);
#else
  (void)dir;
  (void)args;
#endif
  return result;
}

}  // namespace

TEST(CliCommandsTest, CheckAcceptsValidProgram)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_check_ok");
  write_all(dir / "pipeline.syn", "FROM squad {\n  FIELDS [question]\n  SAVE out.json\n}\n");

  const CliResult r = run_cli(dir, "check pipeline.syn");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find("pipeline.syn: OK"), std::string::npos);
}

TEST(CliCommandsTest, CheckReportsParseErrorWithLocation)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_check_err");
  write_all(dir / "bad.syn", "FROM squad\nMERGE [squad]\n");

  const CliResult r = run_cli(dir, "check bad.syn");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("error[E0109]: at least two datasets are required for MERGE"),
            std::string::npos)
    << r.err;
  EXPECT_NE(r.err.find("bad.syn:2:1"), std::string::npos) << r.err;
}

TEST(CliCommandsTest, CheckMissingFile)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_missing");
  const CliResult r = run_cli(dir, "check absent.syn");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("E0200"), std::string::npos) << r.err;
}

TEST(CliCommandsTest, BuildPrintsProgram)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_build");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  const CliResult r = run_cli(dir, "build pipeline.syn");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find("def main():"), std::string::npos);
  EXPECT_NE(r.out.find("ds_squad = load_dataset_with_config('squad'"), std::string::npos);
}

TEST(CliCommandsTest, BuildWritesOutputFile)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_build_out");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  const CliResult r = run_cli(dir, "build pipeline.syn -o gen/pipeline.py");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_TRUE(r.out.empty());
  const std::string program = read_all(dir / "gen" / "pipeline.py");
  EXPECT_NE(program.find("if __name__ == '__main__':"), std::string::npos);
}

TEST(CliCommandsTest, AstPrintsJson)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_ast");
  write_all(dir / "pipeline.syn", "FILTER difficulty >= 8\n");

  const CliResult r = run_cli(dir, "ast pipeline.syn");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find("\"type\": \"FilterStmt\""), std::string::npos) << r.out;
  EXPECT_NE(r.out.find("\"value\": 8"), std::string::npos) << r.out;
}

TEST(CliCommandsTest, RunKeepsScriptWhenAsked)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_run_keep");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  // `true` stands in for the interpreter: it ignores the generated program.
  const CliResult r = run_cli(dir, "run pipeline.syn --python true --keep-script");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_TRUE(fs::exists(dir / "output" / "pipeline.py"));
}

TEST(CliCommandsTest, RunDeletesScriptByDefault)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_run_rm");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  const CliResult r = run_cli(dir, "--compile pipeline.syn --python true");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_FALSE(fs::exists(dir / "output" / "pipeline.py"));
}

TEST(CliCommandsTest, RunUsesProjectConfig)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_run_cfg");
  write_all(dir / "sync.yaml", "interpreter: \"false\"\nscript_dir: scripts\n");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  const CliResult failing = run_cli(dir, "run pipeline.syn");
  EXPECT_EQ(failing.exit_code, 1);
  EXPECT_NE(failing.err.find("exited with status 1"), std::string::npos) << failing.err;
  // A failed run leaves the program in the configured script_dir.
  EXPECT_TRUE(fs::exists(dir / "scripts" / "pipeline.py"));

  // Command-line flags override sync.yaml.
  const CliResult ok = run_cli(dir, "run pipeline.syn --python true");
  EXPECT_EQ(ok.exit_code, 0) << ok.err;
}

TEST(CliCommandsTest, InvalidProjectConfigIsReported)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_bad_cfg");
  write_all(dir / "sync.yaml", "keep_script: sometimes\n");
  write_all(dir / "pipeline.syn", "FROM squad\n");

  const CliResult r = run_cli(dir, "run pipeline.syn --python true");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("'keep_script' must be a boolean"), std::string::npos) << r.err;
}

TEST(CliCommandsTest, UsageAndUnknownCommands)
{
#ifndef SYN_DSL_CLI_PATH
  GTEST_SKIP() << "SYN_DSL_CLI_PATH is not configured (sync target missing?)";
#endif
  const fs::path dir = make_temp_dir("syn_dsl_cli_usage");

  const CliResult help = run_cli(dir, "--help");
  EXPECT_EQ(help.exit_code, 0);
  EXPECT_NE(help.err.find("Usage:"), std::string::npos);

  const CliResult unknown = run_cli(dir, "deploy pipeline.syn");
  EXPECT_EQ(unknown.exit_code, 1);
  EXPECT_NE(unknown.err.find("unknown command: deploy"), std::string::npos);

  const CliResult missing = run_cli(dir, "run");
  EXPECT_EQ(missing.exit_code, 1);
  EXPECT_NE(missing.err.find("input file required"), std::string::npos);
}
