#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

#include "remote/mirror_mover.hpp"

using namespace remote;
namespace fs = std::filesystem;

static fs::path mirror_base()
{
    fs::path d = fs::temp_directory_path() / ("chunksync-mirror-" + std::to_string(::getpid()));
    fs::remove_all(d);
    fs::create_directories(d / "src");
    return d;
}

static std::string read_all(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), {});
}

TEST(Mirror, CopiesIntoRemoteDirectory)
{
    const auto base = mirror_base();
    {
        std::ofstream(base / "src" / "a.txt") << "hello";
    }
    MirrorMover m(base / "dst");

    auto r = m.copy(base / "src" / "a.txt", "2023/trip");
    ASSERT_TRUE(r.ok) << r.diagnostics;
    EXPECT_EQ(read_all(base / "dst" / "2023" / "trip" / "a.txt"), "hello");
    EXPECT_EQ(m.local_for("2023/trip/a.txt"), base / "dst" / "2023" / "trip" / "a.txt");

    r = m.copy(base / "src" / "a.txt", "");
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(fs::exists(base / "dst" / "a.txt"));

    fs::remove_all(base);
}

TEST(Mirror, CopyOverwritesExisting)
{
    const auto base = mirror_base();
    MirrorMover m(base / "dst");
    {
        std::ofstream(base / "src" / "b.txt") << "first";
    }
    ASSERT_TRUE(m.copy(base / "src" / "b.txt", "x").ok);
    {
        std::ofstream(base / "src" / "b.txt") << "later";
    }
    ASSERT_TRUE(m.copy(base / "src" / "b.txt", "x").ok);
    EXPECT_EQ(read_all(base / "dst" / "x" / "b.txt"), "later");

    fs::remove_all(base);
}

TEST(Mirror, CopyOfMissingFileFails)
{
    const auto  base = mirror_base();
    MirrorMover m(base / "dst");
    auto        r = m.copy(base / "src" / "none", "x");
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.diagnostics.empty());
    fs::remove_all(base);
}

TEST(Mirror, DeleteRemote)
{
    const auto base = mirror_base();
    MirrorMover m(base / "dst");
    {
        std::ofstream(base / "src" / "c.zip.001") << "c";
    }
    ASSERT_TRUE(m.copy(base / "src" / "c.zip.001", "d").ok);

    EXPECT_TRUE(m.delete_remote("d/c.zip.001"));
    EXPECT_FALSE(fs::exists(base / "dst" / "d" / "c.zip.001"));
    EXPECT_FALSE(m.delete_remote("d/c.zip.001"));

    fs::remove_all(base);
}

TEST(Mirror, PathsStayInsideTheMirror)
{
    const auto  base = mirror_base();
    MirrorMover m(base / "dst");

    EXPECT_EQ(m.local_for("a/../b"), base / "dst" / "b");
    EXPECT_EQ(m.local_for("/x/y"), base / "dst" / "x" / "y");
    EXPECT_TRUE(m.local_for("../x").empty());
    EXPECT_TRUE(m.local_for("a/../../x").empty());

    {
        std::ofstream(base / "src" / "e.txt") << "e";
    }
    auto r = m.copy(base / "src" / "e.txt", "../escape");
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.diagnostics.empty());
    EXPECT_FALSE(fs::exists(base / "escape"));

    // a sibling of the mirror root survives a delete aimed at it
    EXPECT_FALSE(m.delete_remote("../src/e.txt"));
    EXPECT_TRUE(fs::exists(base / "src" / "e.txt"));

    fs::remove_all(base);
}
