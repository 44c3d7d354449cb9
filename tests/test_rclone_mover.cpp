#include <gtest/gtest.h>

#include "remote/rclone_mover.hpp"

using namespace remote;

TEST(Rclone, RemoteSpec)
{
    RcloneConfig cfg;
    cfg.service   = "box";
    cfg.dest_root = "/backups/nas/";
    RcloneMover m(cfg);

    EXPECT_EQ(m.remote_spec(""), "box:backups/nas");
    EXPECT_EQ(m.remote_spec("2023/a.zip.001"), "box:backups/nas/2023/a.zip.001");
    EXPECT_EQ(m.name(), "rclone");
}

TEST(Rclone, RunProcessExitCodes)
{
    EXPECT_EQ(run_process({"true"}).exit_code, 0);
    EXPECT_EQ(run_process({"false"}).exit_code, 1);
    EXPECT_EQ(run_process({"chunksync-no-such-program"}).exit_code, 127);
}

TEST(Rclone, RunProcessCapturesStderr)
{
    auto r = run_process({"sh", "-c", "echo out; echo oops >&2; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.err, "oops\n");
}

TEST(Rclone, ProgramExitStatusDrivesResult)
{
    // stand-ins that ignore their arguments
    RcloneConfig ok_cfg;
    ok_cfg.program = "true";
    RcloneMover ok(ok_cfg);
    EXPECT_TRUE(ok.copy("/tmp/whatever", "dir").ok);
    EXPECT_TRUE(ok.delete_remote("dir/whatever"));

    RcloneConfig bad_cfg;
    bad_cfg.program = "false";
    RcloneMover bad(bad_cfg);
    EXPECT_FALSE(bad.copy("/tmp/whatever", "dir").ok);
    EXPECT_FALSE(bad.delete_remote("dir/whatever"));

    RcloneConfig missing_cfg;
    missing_cfg.program = "chunksync-no-such-program";
    RcloneMover missing(missing_cfg);
    auto        r = missing.copy("/tmp/whatever", "dir");
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.diagnostics.empty());
}
