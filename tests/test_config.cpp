#include <cstdlib>
#include <map>

#include <gtest/gtest.h>

#include "media_fixture.hpp"
#include "media_relay/config.hpp"

using namespace media_relay;
using test_support::TempDir;

namespace {

const char *const VARIABLES[] = {
    "MEDIA_RELAY_ENV_FILE", "SOURCE_DIR",        "PARALLEL_WORKERS",
    "SHARE_BACKEND",        "LOCAL_SHARE_ROOT",  "SMB_SERVER",
    "SMB_SHARE",            "SMB_USERNAME",      "SMB_BASE_PATH",
    "ENGLISH_MOVIE_PATH",   "MALAYALAM_TV_PATH", "PREFERRED_AUDIO_LANGS",
    "PREFERRED_SUBTITLE_LANGS", "DRY_RUN",       "TRANSFER_CHUNK_KB",
    "CLEAN_ORIGINAL_FILES", "MR_TEST_BOOL",      "MR_TEST_INT",
    "MR_TEST_LIST"};

/// Clears the variables the tests touch and restores them afterwards
class ConfigTest : public ::testing::Test {
  std::map<std::string, std::string> saved_;

protected:
  TempDir dir;

  void SetUp() override {
    for (const char *name : VARIABLES) {
      if (const char *v = std::getenv(name))
        saved_[name] = v;
      unsetenv(name);
    }
    /// Keep the repository's env file out of the tests
    setenv("MEDIA_RELAY_ENV_FILE", dir.file("absent.env").c_str(), 1);
  }

  void TearDown() override {
    for (const char *name : VARIABLES)
      unsetenv(name);
    for (const auto &kv : saved_)
      setenv(kv.first.c_str(), kv.second.c_str(), 1);
  }
};

} // namespace

TEST_F(ConfigTest, Defaults) {
  Settings s = load_settings();
  EXPECT_EQ(s.parallel_workers, 2);
  EXPECT_EQ(s.share.backend, "smb");
  EXPECT_EQ(s.share.base_path, "media");
  EXPECT_EQ(s.destinations.english_movies, "movies");
  EXPECT_EQ(s.language_policy.audio_languages,
            (std::vector<std::string>{"mal"}));
  EXPECT_TRUE(s.language_policy.subtitle_languages.empty());
  EXPECT_EQ(s.transfer.chunk_size, TRANSFER_CHUNK_SIZE);
  EXPECT_FALSE(s.dry_run);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("PARALLEL_WORKERS", "6", 1);
  setenv("SHARE_BACKEND", "LOCAL", 1);
  setenv("LOCAL_SHARE_ROOT", "/mnt/nas", 1);
  setenv("SMB_BASE_PATH", "/library//media/", 1);
  setenv("PREFERRED_AUDIO_LANGS", " MAL , eng,, ", 1);
  setenv("DRY_RUN", "yes", 1);
  setenv("TRANSFER_CHUNK_KB", "64", 1);

  Settings s = load_settings();
  EXPECT_EQ(s.parallel_workers, 6);
  EXPECT_EQ(s.share.backend, "local");
  EXPECT_EQ(s.share.local_root, "/mnt/nas");
  EXPECT_EQ(s.share.base_path, "library/media");
  EXPECT_EQ(s.language_policy.audio_languages,
            (std::vector<std::string>{"mal", "eng"}));
  EXPECT_TRUE(s.dry_run);
  EXPECT_EQ(s.transfer.chunk_size, 64u * 1024);
}

TEST_F(ConfigTest, EmptyBasePathMeansShareRoot) {
  setenv("SMB_BASE_PATH", "", 1);
  EXPECT_EQ(load_settings().share.base_path, "");
}

TEST_F(ConfigTest, EnvFileFillsUnsetVariablesOnly) {
  std::string file = dir.file("relay.env");
  ASSERT_TRUE(test_support::write_file(file,
                                       "# comment\n"
                                       "\n"
                                       "export SOURCE_DIR=\"/srv/incoming\"\n"
                                       "PARALLEL_WORKERS = 4\n"
                                       "ENGLISH_MOVIE_PATH='films'\n"
                                       "not a setting\n"));
  setenv("MEDIA_RELAY_ENV_FILE", file.c_str(), 1);
  setenv("PARALLEL_WORKERS", "3", 1);

  Settings s = load_settings();
  EXPECT_EQ(s.source_dir, "/srv/incoming");
  EXPECT_EQ(s.parallel_workers, 3);
  EXPECT_EQ(s.destinations.english_movies, "films");
}

TEST_F(ConfigTest, TypedReadersFallBackOnGarbage) {
  setenv("MR_TEST_BOOL", "maybe", 1);
  EXPECT_TRUE(Config::get_env_bool("MR_TEST_BOOL", true));
  setenv("MR_TEST_BOOL", "Off", 1);
  EXPECT_FALSE(Config::get_env_bool("MR_TEST_BOOL", true));

  setenv("MR_TEST_INT", "12abc", 1);
  EXPECT_EQ(Config::get_env_int("MR_TEST_INT", 7), 7);

  EXPECT_EQ(Config::get_env_list("MR_TEST_LIST", {"x"}),
            (std::vector<std::string>{"x"}));
  setenv("MR_TEST_LIST", "", 1);
  EXPECT_TRUE(Config::get_env_list("MR_TEST_LIST", {"x"}).empty());
}

TEST_F(ConfigTest, ValidationReportsEveryProblem) {
  Settings s = load_settings();
  std::vector<std::string> problems;
  EXPECT_FALSE(validate_settings(s, problems));
  EXPECT_EQ(problems.size(), 3u); //< SMB server, share and user

  s.share.backend = "local";
  s.share.local_root = dir.path();
  problems.clear();
  EXPECT_TRUE(validate_settings(s, problems));

  s.parallel_workers = 0;
  s.destinations.malayalam_tv = s.destinations.english_tv;
  s.language_policy.audio_languages.clear();
  problems.clear();
  EXPECT_FALSE(validate_settings(s, problems));
  EXPECT_EQ(problems.size(), 3u);

  s = Settings{};
  s.share.backend = "ftp";
  problems.clear();
  EXPECT_FALSE(validate_settings(s, problems));
  ASSERT_EQ(problems.size(), 1u);
  EXPECT_NE(problems[0].find("ftp"), std::string::npos);
}
