// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

#include "config/settings.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_Settings, Defaults)
{
    auto s = config::defaults();
    EXPECT_EQ(s.chunk_size, 1200000000ULL);
    EXPECT_EQ(s.sidecar, ".rclone");
    EXPECT_EQ(s.mover, "rclone");
    EXPECT_EQ(s.remote_service, "box");
    EXPECT_EQ(s.min_free_percent, 10);
    EXPECT_FALSE(s.finish_hour.has_value());
    ASSERT_EQ(s.skip_extensions.size(), 5u);
    EXPECT_EQ(s.skip_extensions.front(), ".bundle");
}

TEST(Env_Settings, FromEnv)
{
    EnvGuard g_root("CHUNKSYNC_ROOT");
    EnvGuard g_size("CHUNKSYNC_CHUNK_SIZE");
    EnvGuard g_skip("CHUNKSYNC_SKIP_EXT");
    EnvGuard g_hour("CHUNKSYNC_FINISH_HOUR");
    EnvGuard g_mover("CHUNKSYNC_MOVER");
    g_root.set("/srv/data");
    g_size.set("900M");
    g_skip.set(".tmp, .part");
    g_hour.set("6");
    g_mover.set("mirror");

    auto s = config::defaults();
    EXPECT_FALSE(config::apply_env(s).has_value());
    EXPECT_EQ(s.root, "/srv/data");
    EXPECT_EQ(s.chunk_size, 900000000ULL);
    ASSERT_EQ(s.skip_extensions.size(), 2u);
    EXPECT_EQ(s.skip_extensions[1], ".part");
    ASSERT_TRUE(s.finish_hour.has_value());
    EXPECT_EQ(*s.finish_hour, 6);
    EXPECT_EQ(s.mover, "mirror");
}

TEST(Env_Settings, BadChunkSizeIsRejected)
{
    EnvGuard g("CHUNKSYNC_CHUNK_SIZE");
    for (const char *bad : {"0", "-5", "abc", "12X", ""})
    {
        g.set(bad);
        auto s   = config::defaults();
        auto err = config::apply_env(s);
        ASSERT_TRUE(err.has_value()) << "value '" << bad << "'";
        EXPECT_NE(err->find("CHUNKSYNC_CHUNK_SIZE"), std::string::npos);
    }
}

TEST(Env_Settings, FlagsOverrideEnv)
{
    EnvGuard g("CHUNKSYNC_CHUNK_SIZE");
    g.set("1G");

    auto s = config::defaults();
    ASSERT_FALSE(config::apply_env(s).has_value());
    EXPECT_EQ(s.chunk_size, 1000000000ULL);

    int         used = 0;
    std::string err;
    EXPECT_TRUE(config::apply_flag(s, "--chunk-size", "2500", used, err));
    EXPECT_EQ(used, 2);
    EXPECT_EQ(s.chunk_size, 2500u);

    EXPECT_FALSE(config::apply_flag(s, "--finish-hour", "24", used, err));
    EXPECT_FALSE(config::apply_flag(s, "--bogus", "1", used, err));
    EXPECT_FALSE(config::apply_flag(s, "--root", nullptr, used, err));
    EXPECT_NE(err.find("missing value"), std::string::npos);
}

TEST(Env_Settings, Validate)
{
    auto s = config::defaults();
    EXPECT_TRUE(config::validate(s, true).has_value());  // no root
    EXPECT_FALSE(config::validate(s, false).has_value());

    s.root = std::filesystem::temp_directory_path().string();
    EXPECT_FALSE(config::validate(s, true).has_value());

    s.root = "/nonexistent/chunksync";
    EXPECT_TRUE(config::validate(s, true).has_value());

    s = config::defaults();
    s.mover = "ftp";
    EXPECT_TRUE(config::validate(s, false).has_value());
    s.mover = "mirror";
    EXPECT_TRUE(config::validate(s, false).has_value());
    s.mirror_root = "/tmp/mirror";
    EXPECT_FALSE(config::validate(s, false).has_value());
    EXPECT_EQ(config::make_mover(s)->name(), "mirror");

    s.mover = "rclone";
    EXPECT_EQ(config::make_mover(s)->name(), "rclone");
}

TEST(Env_Settings, ParseSize)
{
    EXPECT_EQ(config::parse_size("1200000000").value_or(0), 1200000000ULL);
    EXPECT_EQ(config::parse_size("64K").value_or(0), 64000u);
    EXPECT_EQ(config::parse_size("1.2G").has_value(), false);
    EXPECT_FALSE(config::parse_size("99999999999999999999").has_value());
    EXPECT_FALSE(config::parse_size("20000000000G").has_value());
}

TEST(Env_Settings, ParseSizeRejectsNegativeBehindBlanks)
{
    EXPECT_FALSE(config::parse_size("-5").has_value());
    EXPECT_FALSE(config::parse_size(" -5").has_value());
    EXPECT_FALSE(config::parse_size("\t-1").has_value());
    EXPECT_FALSE(config::parse_size("   ").has_value());
    EXPECT_EQ(config::parse_size(" 5").value_or(0), 5u);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace chunksync;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM lines are never filtered
    testing::internal::CaptureStderr();
    LOG_SYSTEM("summary_line");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("summary_line"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, FileGetsEverythingAndErrorsAreCounted)
{
    using namespace chunksync;
    const std::string path = (std::filesystem::temp_directory_path() /
                              ("chunksync-log-" + std::to_string(::getpid()) + ".log"))
                                 .string();
    std::filesystem::remove(path);

    set_log_level(Level::Error);
    ASSERT_TRUE(open_log_file(path));
    const unsigned before = error_count().load();

    testing::internal::CaptureStderr();
    LOG_DEBUG("file_only_debug");
    LOG_ERROR("both_error");
    std::string console = testing::internal::GetCapturedStderr();
    close_log_file();
    set_log_level(Level::Info);

    EXPECT_EQ(error_count().load(), before + 1);
    EXPECT_EQ(console.find("file_only_debug"), std::string::npos);

    std::ifstream in(path);
    std::string   text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("file_only_debug"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);

    std::filesystem::remove(path);
}
