#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        gzinspect::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    gzinspect::Fd a(fd);
    gzinspect::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), fd);

    gzinspect::Fd c;
    c = std::move(b);
    EXPECT_FALSE(b.Valid());
    EXPECT_EQ(c.Get(), fd);
    EXPECT_TRUE(IsOpen(fd));
}

TEST(FdTests, ReleaseLeavesDescriptorOpen) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    int released = -1;
    {
        gzinspect::Fd holder(fd);
        released = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }
    EXPECT_EQ(released, fd);
    EXPECT_TRUE(IsOpen(fd));
    ::close(fd);
}

TEST(FdTests, ResetClosesPreviousDescriptor) {
    int first = ::open("/dev/null", O_RDONLY);
    int second = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(first, 0);
    ASSERT_GE(second, 0);

    gzinspect::Fd holder(first);
    holder.Reset(second);
    EXPECT_FALSE(IsOpen(first));
    EXPECT_EQ(holder.Get(), second);

    holder.Reset(second);
    EXPECT_TRUE(IsOpen(second));
}

TEST(FdTests, StandardStreamsAreNeverClosed) {
    {
        gzinspect::Fd holder(STDERR_FILENO);
    }
    EXPECT_TRUE(IsOpen(STDERR_FILENO));
}

} // namespace
