#include <gtest/gtest.h>
#include "build/Executor.hpp"

#include <filesystem>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;
using mh::build::ShellExecutor;

class ShellExecutorTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mirrorhall_executor_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override { fs::remove_all(test_dir); }
};

TEST_F(ShellExecutorTest, ZeroExitIsSuccessAndOutputIsCaptured) {
    ShellExecutor exec;
    const auto res = exec.run("echo hello; echo oops 1>&2", test_dir);
    EXPECT_TRUE(res.ok());
    EXPECT_NE(res.output.find("hello"), std::string::npos);
    EXPECT_NE(res.output.find("oops"), std::string::npos);
}

TEST_F(ShellExecutorTest, NonZeroExitIsReported) {
    ShellExecutor exec;
    const auto res = exec.run("exit 3", test_dir);
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.exitCode, 3);
}

TEST_F(ShellExecutorTest, RunsInWorkingDirectory) {
    ShellExecutor exec;
    ASSERT_TRUE(exec.run("touch marker", test_dir).ok());
    EXPECT_TRUE(fs::exists(test_dir / "marker"));
}

TEST_F(ShellExecutorTest, MissingWorkingDirectoryFails) {
    ShellExecutor exec;
    const auto res = exec.run("true", test_dir / "missing");
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.exitCode, 126);
}

TEST_F(ShellExecutorTest, EmptyCommandIsRejected) {
    ShellExecutor exec;
    EXPECT_THROW((void)exec.run("", test_dir), std::invalid_argument);
}

TEST_F(ShellExecutorTest, ChildDoesNotInheritOpenDescriptors) {
    // Opened without O_CLOEXEC, like a listener socket created elsewhere in the process
    const int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    ShellExecutor exec;
    const auto res = exec.run(fmt::format("if [ -e /proc/self/fd/{} ]; then echo leaked; exit 1; fi; echo clean", fd),
                              test_dir);
    ::close(fd);

    EXPECT_TRUE(res.ok()) << res.output;
    EXPECT_NE(res.output.find("clean"), std::string::npos);
}
