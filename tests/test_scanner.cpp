#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

#include "chunk/scanner.hpp"

using namespace chunk;
namespace fs = std::filesystem;

static fs::path scan_dir(const std::string &tag)
{
    fs::path d = fs::temp_directory_path() /
                 ("chunksync-scan-" + tag + "-" + std::to_string(::getpid()));
    fs::remove_all(d);
    fs::create_directories(d);
    return d;
}

static void touch(const fs::path &p, std::size_t n)
{
    std::ofstream out(p, std::ios::binary);
    out << std::string(n, 'x');
}

TEST(Scanner, MissingDirectoryIsEmpty)
{
    auto r = scan_chunks("a.bin", fs::temp_directory_path() / "chunksync-no-such-dir-xyz");
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.set.empty());
    EXPECT_EQ(r.set.total_bytes, 0u);
}

TEST(Scanner, CollectsOnlyMatchingArtifactsInOrder)
{
    const auto d = scan_dir("order");
    touch(d / "movie.mkv.zip.003", 5);
    touch(d / "movie.mkv.zip.001", 10);
    touch(d / "movie.mkv.zip.002", 10);
    touch(d / "movie.mkv.zip.004.partial", 7);
    touch(d / "other.mkv.zip.001", 10);
    touch(d / "movie.mkv.zip", 25);
    touch(d / "notes.txt", 3);
    fs::create_directories(d / "movie.mkv.zip.005");

    auto r = scan_chunks("movie.mkv", d);
    ASSERT_TRUE(r.ok);
    ASSERT_EQ(r.set.count(), 3u);
    EXPECT_EQ(r.set.chunks[0].name, "movie.mkv.zip.001");
    EXPECT_EQ(r.set.chunks[1].ordinal, 2u);
    EXPECT_EQ(r.set.chunks[2].size, 5u);
    EXPECT_EQ(r.set.total_bytes, 25u);
    EXPECT_TRUE(r.set.contiguous());

    fs::remove_all(d);
}

TEST(Scanner, ReportsGapsAsNonContiguous)
{
    const auto d = scan_dir("gap");
    touch(d / "x.zip.001", 1);
    touch(d / "x.zip.003", 1);

    auto r = scan_chunks("x.zip", d);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.set.count(), 2u);
    EXPECT_FALSE(r.set.contiguous());

    fs::remove_all(d);
}

TEST(Scanner, SeesBothNamingStyles)
{
    const auto d = scan_dir("styles");
    // "a" archives to a.zip.NNN, which is also the raw name of a source called a.zip
    touch(d / "a.zip.001", 4);

    auto archived = scan_chunks("a", d);
    ASSERT_TRUE(archived.ok);
    ASSERT_EQ(archived.set.count(), 1u);
    EXPECT_EQ(archived.set.chunks[0].style, NameStyle::Archived);

    auto raw = scan_chunks("a.zip", d);
    ASSERT_TRUE(raw.ok);
    ASSERT_EQ(raw.set.count(), 1u);
    EXPECT_EQ(raw.set.chunks[0].style, NameStyle::Raw);

    fs::remove_all(d);
}

TEST(Scanner, NotADirectoryIsAScanError)
{
    const auto d = scan_dir("file");
    touch(d / "plain", 1);

    auto r = scan_chunks("x", d / "plain");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, ErrorKind::Scan);

    fs::remove_all(d);
}
