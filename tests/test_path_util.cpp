#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

#include "my_error_codes.hpp"
#include "test_support.hpp"
#include "update_error.hpp"
#include "util/path_util.hpp"
#include "util/string_util.hpp"

using updatectrl::BaseDirs;
using updatectrl::Environment;
namespace fs = std::filesystem;

using EnvMap = std::map<std::string, std::string>;

TEST(EnvironmentTest, EmptyValuesCountAsUnset) {
  Environment env(EnvMap{{"SET", "value"}, {"EMPTY", ""}});
  EXPECT_EQ(env.get("SET").value_or(""), "value");
  EXPECT_FALSE(env.get("EMPTY").has_value());
  EXPECT_FALSE(env.get("MISSING").has_value());
}

TEST(EnvironmentTest, SnapshotIgnoresLaterChanges) {
  testinfra::EnvVarGuard guard("UPDATECTRL_SNAPSHOT_TEST", std::string("before"));
  auto env = Environment::from_process();
  testinfra::EnvVarGuard later("UPDATECTRL_SNAPSHOT_TEST", std::string("after"));
  EXPECT_EQ(env.get("UPDATECTRL_SNAPSHOT_TEST").value_or(""), "before");
}

TEST(BaseDirsTest, DerivesXdgDefaultsFromHome) {
  Environment env(EnvMap{{"HOME", "/home/u"}});
  auto dirs = BaseDirs::from_environment(env);
  EXPECT_EQ(dirs.home_dir, fs::path("/home/u"));
  EXPECT_EQ(dirs.config_dir, fs::path("/home/u/.config"));
  EXPECT_EQ(dirs.data_dir, fs::path("/home/u/.local/share"));
}

TEST(BaseDirsTest, HonorsAbsoluteXdgOverridesOnly) {
  Environment env(EnvMap{{"HOME", "/home/u"},
                         {"XDG_CONFIG_HOME", "/cfg"},
                         {"XDG_DATA_HOME", "relative/data"}});
  auto dirs = BaseDirs::from_environment(env);
  EXPECT_EQ(dirs.config_dir, fs::path("/cfg"));
  EXPECT_EQ(dirs.data_dir, fs::path("/home/u/.local/share"));
}

TEST(ResolvePathTest, ExplicitThenProbeThenFallback) {
  int probes = 0;
  updatectrl::PathProbe probe = [&probes]() -> std::optional<std::string> {
    ++probes;
    return std::string("/probed");
  };
  EXPECT_EQ(updatectrl::resolve_path(std::string("/explicit"), probe, "/fb"),
            fs::path("/explicit"));
  EXPECT_EQ(probes, 0);

  EXPECT_EQ(updatectrl::resolve_path(std::nullopt, probe, "/fb"),
            fs::path("/probed"));
  EXPECT_EQ(probes, 1);

  updatectrl::PathProbe silent = []() -> std::optional<std::string> {
    return std::nullopt;
  };
  EXPECT_EQ(updatectrl::resolve_path(std::nullopt, silent, "/fb"),
            fs::path("/fb"));
  EXPECT_EQ(updatectrl::resolve_path(std::string(""), nullptr, "/fb"),
            fs::path("/fb"));
}

TEST(RequirePathTest, MissingPathIsNotApplicable) {
  testinfra::TempDir dir;
  EXPECT_FALSE(updatectrl::require_path(dir.path()).has_value());

  auto err = updatectrl::require_path(dir.path() / "absent");
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::REQUIREMENT::PATH_MISSING);
  EXPECT_EQ(err->kind(), updatectrl::ErrorKind::NotApplicable);
  EXPECT_NE(err->what.find("does not exist"), std::string::npos);
}

TEST(StringUtilTest, ShellQuote) {
  using updatectrl::stringutil::shell_quote;
  EXPECT_EQ(shell_quote("plain-word_1.txt"), "plain-word_1.txt");
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("two words"), "'two words'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(StringUtilTest, Utf8Validation) {
  using updatectrl::stringutil::is_valid_utf8;
  EXPECT_TRUE(is_valid_utf8("ascii"));
  EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
  EXPECT_FALSE(is_valid_utf8("\xff"));
  EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));         // overlong
  EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));     // surrogate
  EXPECT_FALSE(is_valid_utf8("\xe2\x82"));         // truncated
}

TEST(StringUtilTest, SplitPathList) {
  auto parts = updatectrl::stringutil::split_path_list(":/usr/bin::/bin:");
  EXPECT_EQ(parts, (std::vector<std::string>{"/usr/bin", "/bin"}));
}

TEST(ErrorTest, KindsFollowCodes) {
  using updatectrl::ErrorKind;
  EXPECT_EQ(updatectrl::requirement_missing("git").kind(),
            ErrorKind::RequirementMissing);
  EXPECT_EQ(updatectrl::exited_with(2, "x").kind(), ErrorKind::NonZeroExit);
  EXPECT_EQ(updatectrl::make_error(my_errors::EXEC::SPAWN_FAILED, "x").kind(),
            ErrorKind::SpawnFailure);
  EXPECT_EQ(updatectrl::make_error(my_errors::IO::TRAVERSAL_FAILED, "x").kind(),
            ErrorKind::IOFailure);
  EXPECT_EQ(updatectrl::make_error(my_errors::GIT::PULL_FAILED, "x").kind(),
            ErrorKind::Unexpected);
}
