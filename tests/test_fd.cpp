#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "testing.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        hotupdate::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, OpenReadReportsMissingFile) {
    testutil::TemporaryDirectory tmp;
    hotupdate::Fd fd;
    auto r = hotupdate::Fd::OpenRead(tmp.Path() + "/missing", fd);
    EXPECT_FALSE(r.is_ok());
    EXPECT_FALSE(fd.Valid());
}

TEST(FdTests, DirectoryCanBeSynced) {
    testutil::TemporaryDirectory tmp;
    hotupdate::Fd fd;
    ASSERT_TRUE(hotupdate::Fd::OpenDirectory(tmp.Path(), fd).is_ok());
    EXPECT_TRUE(fd.Fsync().is_ok());
}

} // namespace
