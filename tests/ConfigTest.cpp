#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>

#include "TempDir.hpp"
#include "tinydc/Config.hpp"

namespace {
// Sets an environment variable for the lifetime of the guard, restoring the old value after.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        const char* old = std::getenv(name);
        if (old != nullptr) {
            old_ = old;
        }
        if (value != nullptr) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~EnvGuard() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};
}

TEST(ConfigTest, LoadsKeyValueLinesAndSkipsComments) {
    TempDir tmp;
    const auto file = tmp.MakeFile("config.yml",
                                   "# tinydc settings\n"
                                   "\n"
                                   "frecent_limit: 50\n"
                                   "  show_hidden :  no  \n"
                                   "not a setting\n"
                                   "index_file: /var/tmp/idx\n");
    AppConfig config;
    ASSERT_TRUE(config.LoadFromFile(file));

    EXPECT_EQ(config.GetInt("frecent_limit", 200), 50);
    EXPECT_FALSE(config.GetBool("show_hidden", true));
    EXPECT_EQ(config.GetString("index_file", ""), "/var/tmp/idx");
    EXPECT_EQ(config.GetString("missing", "fallback"), "fallback");
}

TEST(ConfigTest, MalformedValuesFallBack) {
    AppConfig config;
    config.SetString("frecent_limit", "lots");
    config.SetString("show_hidden", "maybe");
    config.SetString("key_sequence_timeout_ms", "99999999999999999999");

    EXPECT_EQ(config.GetInt("frecent_limit", 200), 200);
    EXPECT_TRUE(config.GetBool("show_hidden", true));
    EXPECT_EQ(config.GetInt("key_sequence_timeout_ms", 1000), 1000);
}

TEST(ConfigTest, MissingFileReportsFailure) {
    TempDir tmp;
    AppConfig config;
    EXPECT_FALSE(config.LoadFromFile(tmp.Path() / "absent.yml"));
}

TEST(ConfigTest, IndexFilePrefersConfigThenEnvironmentThenHome) {
    EnvGuard home("HOME", "/home/tester");
    EnvGuard env("TINYDC_INDEX", nullptr);

    AppConfig config;
    EXPECT_EQ(config.IndexFile(), std::filesystem::path("/home/tester/.tiny-dc"));

    {
        EnvGuard override_index("TINYDC_INDEX", "~/state/dc");
        EXPECT_EQ(config.IndexFile(), std::filesystem::path("/home/tester/state/dc"));

        config.SetString("index_file", "/srv/index");
        EXPECT_EQ(config.IndexFile(), std::filesystem::path("/srv/index"));
    }
}

TEST(ConfigTest, DefaultPathHonorsXdgConfigHome) {
    EnvGuard home("HOME", "/home/tester");
    {
        EnvGuard xdg("XDG_CONFIG_HOME", "/xdg");
        EXPECT_EQ(AppConfig::DefaultPath(), std::filesystem::path("/xdg/tinydc/config.yml"));
    }
    EnvGuard no_xdg("XDG_CONFIG_HOME", nullptr);
    EXPECT_EQ(AppConfig::DefaultPath(), std::filesystem::path("/home/tester/.config/tinydc/config.yml"));
}
