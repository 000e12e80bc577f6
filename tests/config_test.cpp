#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>
#include "config/config.hpp"
#include "core/paths.hpp"

using namespace asdf;
using namespace asdf::config;

namespace {

std::string testdata(const std::string& name) {
    return std::string(ASDF_TESTDATA_DIR) + "/" + name;
}

std::shared_ptr<core::MapEnvironment> make_env(const std::string& config_file = "") {
    auto env = std::make_shared<core::MapEnvironment>();
    env->set("HOME", "/home/tester");
    if (!config_file.empty()) {
        env->set("ASDF_CONFIG_FILE", config_file);
    }
    return env;
}

Config load(std::shared_ptr<const core::Environment> env) {
    auto result = load_config(std::move(env));
    EXPECT_TRUE(result.success) << result.error;
    return result.config;
}

} // namespace

TEST(LoadConfigTest, WithDefaults) {
    auto result = load_config();
    ASSERT_TRUE(result.success) << result.error;

    auto home = core::paths::home_dir(*core::process_environment());
    ASSERT_TRUE(home.has_value());

    const Config& config = result.config;
    EXPECT_EQ(config.home, *home);
    if (std::getenv("ASDF_DATA_DIR") == nullptr) {
        EXPECT_EQ(config.data_dir.rfind(*home, 0), 0u);
    }
    if (std::getenv("ASDF_CONFIG_FILE") == nullptr) {
        EXPECT_EQ(config.config_file.rfind(*home, 0), 0u);
    }
}

TEST(LoadConfigTest, DefaultPathsUnderHome) {
    Config config = load(make_env());
    EXPECT_EQ(config.home, "/home/tester");
    EXPECT_EQ(config.data_dir, "/home/tester/.asdf");
    EXPECT_EQ(config.config_file, "/home/tester/.asdfrc");
    EXPECT_EQ(config.default_tool_versions_filename, ".tool-versions");
}

TEST(LoadConfigTest, DataDirWithTilde) {
    auto env = make_env();
    env->set("ASDF_DATA_DIR", "~/some/other/dir");

    Config config = load(env);
    EXPECT_EQ(config.home, "/home/tester");
    EXPECT_EQ(config.data_dir, "/home/tester/some/other/dir");
    EXPECT_EQ(config.config_file, "/home/tester/.asdfrc");
}

TEST(LoadConfigTest, AbsoluteDataDirUsedAsIs) {
    auto env = make_env();
    env->set("ASDF_DATA_DIR", "/opt/asdf");
    EXPECT_EQ(load(env).data_dir, "/opt/asdf");
}

TEST(LoadConfigTest, ConfigFileOverrideIsVerbatim) {
    auto env = make_env("~/custom-asdfrc");
    EXPECT_EQ(load(env).config_file, "~/custom-asdfrc");
}

TEST(LoadConfigTest, HomeUnavailable) {
    auto env = std::make_shared<core::MapEnvironment>();
    auto result = load_config(env, [] { return std::optional<std::string>(); });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, ErrorKind::HOME_DIRECTORY_UNAVAILABLE);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(result.config.home.empty());
}

TEST(LoadConfigTest, HomeFromLookupWhenHomeUnset) {
    auto env = std::make_shared<core::MapEnvironment>();
    auto result = load_config(env, [] { return std::optional<std::string>("/var/lib/tester/"); });

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.config.home, "/var/lib/tester/");
    EXPECT_EQ(result.config.data_dir, "/var/lib/tester/.asdf");
    EXPECT_EQ(result.config.config_file, "/var/lib/tester/.asdfrc");
}

TEST(LoadConfigTest, ToolVersionsFilenameOverride) {
    auto env = make_env();
    env->set("ASDF_DEFAULT_TOOL_VERSIONS_FILENAME", ".versions");
    EXPECT_EQ(load(env).default_tool_versions_filename, ".versions");
}

TEST(LoadConfigTest, ToJsonListsPaths) {
    auto j = load(make_env()).to_json();
    EXPECT_EQ(j["home"].get<std::string>(), "/home/tester");
    EXPECT_EQ(j["data_dir"].get<std::string>(), "/home/tester/.asdf");
    EXPECT_EQ(j["config_file"].get<std::string>(), "/home/tester/.asdfrc");
}

TEST(ConfigMethodsTest, ReadsValuesFromRcFile) {
    Config config = load(make_env(testdata("asdfrc")));

    auto legacy = config.legacy_version_file();
    EXPECT_TRUE(legacy.success) << legacy.error;
    EXPECT_TRUE(legacy.value);

    auto keep = config.always_keep_download();
    EXPECT_TRUE(keep.success);
    EXPECT_TRUE(keep.value);

    auto duration = config.plugin_repository_last_check_duration();
    EXPECT_TRUE(duration.success);
    EXPECT_TRUE(duration.value.never);
    EXPECT_EQ(duration.value.every, 0);

    auto short_name = config.disable_plugin_short_name_repository();
    EXPECT_TRUE(short_name.success);
    EXPECT_TRUE(short_name.value);

    auto concurrency = config.concurrency();
    EXPECT_TRUE(concurrency.success);
    EXPECT_EQ(concurrency.value, "5");
}

TEST(ConfigMethodsTest, MissingFileReturnsDefaultsWithoutError) {
    Config config;
    config.config_file = "non-existent";

    auto legacy = config.legacy_version_file();
    EXPECT_TRUE(legacy.success);
    EXPECT_TRUE(legacy.error.empty());
    EXPECT_FALSE(legacy.value);

    auto keep = config.always_keep_download();
    EXPECT_TRUE(keep.success);
    EXPECT_FALSE(keep.value);

    auto duration = config.plugin_repository_last_check_duration();
    EXPECT_TRUE(duration.success);
    EXPECT_FALSE(duration.value.never);
    EXPECT_EQ(duration.value.every, 60);

    auto short_name = config.disable_plugin_short_name_repository();
    EXPECT_TRUE(short_name.success);
    EXPECT_FALSE(short_name.value);

    auto settings = config.settings();
    EXPECT_TRUE(settings.success);
    EXPECT_FALSE(settings.value.loaded);
}

TEST(ConfigMethodsTest, UnreadableFileIsPropagated) {
    auto env = make_env();
    Config config(env);
    config.config_file = ASDF_TESTDATA_DIR;

    auto legacy = config.legacy_version_file();
    EXPECT_FALSE(legacy.success);
    EXPECT_EQ(legacy.kind, ErrorKind::FILE_OPEN_ERROR);
    EXPECT_FALSE(legacy.error.empty());
    EXPECT_FALSE(legacy.value);
}

TEST(ConfigMethodsTest, ConcurrencyEnvSeenAfterLoad) {
    auto env = make_env(testdata("asdfrc"));
    Config config = load(env);
    EXPECT_EQ(config.concurrency().value, "5");

    env->set("ASDF_CONCURRENCY", "99");
    EXPECT_EQ(config.concurrency().value, "99");

    env->set("ASDF_CONCURRENCY", "auto");
    EXPECT_EQ(config.concurrency().value, std::to_string(processing_units()));
}

TEST(ConfigMethodsTest, AccessorsAreIdempotent) {
    Config config = load(make_env(testdata("asdfrc")));

    auto first = config.settings();
    auto second = config.settings();
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.value.to_json(), second.value.to_json());
    EXPECT_EQ(config.get_hook("pre_asdf_plugin_add").value,
              config.get_hook("pre_asdf_plugin_add").value);
}

TEST(ConfigGetHookTest, MissingHookIsEmpty) {
    Config config = load(make_env(testdata("asdfrc")));
    auto hook = config.get_hook("post_asdf_plugin_add");
    EXPECT_TRUE(hook.success);
    EXPECT_TRUE(hook.value.empty());
}

TEST(ConfigGetHookTest, ReturnsCommand) {
    Config config = load(make_env(testdata("asdfrc")));
    auto hook = config.get_hook("pre_asdf_plugin_add");
    EXPECT_TRUE(hook.success);
    EXPECT_EQ(hook.value, "echo Executing with args: $@");
}

TEST(ConfigGetHookTest, IgnoresLeadingAndTrailingSpaces) {
    Config config = load(make_env(testdata("asdfrc")));
    EXPECT_EQ(config.get_hook("pre_asdf_plugin_add_test").value, "echo Executing with args: $@");
}

TEST(ConfigGetHookTest, PreservesQuoting) {
    Config config = load(make_env(testdata("asdfrc")));
    EXPECT_EQ(config.get_hook("pre_asdf_plugin_add_test2").value, "echo 'Executing' \"with args: $@\"");
}

TEST(ConfigGetHookTest, WorksWithoutConfigFile) {
    Config config;
    auto hook = config.get_hook("some_hook");
    EXPECT_TRUE(hook.success);
    EXPECT_TRUE(hook.error.empty());
    EXPECT_TRUE(hook.value.empty());
}

TEST(ConfigTest, FileValueAutoResolvesToProcessingUnits) {
    Config config(make_env());
    config.config_file = testdata("auto-concurrency-asdfrc");
    auto concurrency = config.concurrency();
    EXPECT_TRUE(concurrency.success);
    EXPECT_EQ(concurrency.value, std::to_string(processing_units()));
}

TEST(ErrorKindTest, Names) {
    EXPECT_STREQ(error_kind_to_string(ErrorKind::NONE), "NONE");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::HOME_DIRECTORY_UNAVAILABLE), "HOME_DIRECTORY_UNAVAILABLE");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::FILE_NOT_FOUND), "FILE_NOT_FOUND");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::FILE_OPEN_ERROR), "FILE_OPEN_ERROR");
}
