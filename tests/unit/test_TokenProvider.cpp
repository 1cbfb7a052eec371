#include <gtest/gtest.h>
#include "auth/TokenProvider.hpp"
#include "fakes.hpp"

#include <cstdlib>

namespace fs = std::filesystem;
using namespace mh::auth;
using mh::config::RemoteConfig;
using mh::test::writeFile;

class TokenProviderTest : public ::testing::Test {
protected:
    fs::path test_dir;
    const std::string envName = "MIRRORHALL_TEST_TOKEN";

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mirrorhall_token_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        ::unsetenv(envName.c_str());
    }

    void TearDown() override {
        ::unsetenv(envName.c_str());
        fs::remove_all(test_dir);
    }

    [[nodiscard]] RemoteConfig remote() const {
        RemoteConfig cfg;
        cfg.access_token_env = envName;
        return cfg;
    }
};

TEST_F(TokenProviderTest, StaticTokenIsTrimmed) {
    const StaticTokenProvider p("  sl.abc\n");
    EXPECT_EQ(p.token(), "sl.abc");
}

TEST_F(TokenProviderTest, BlankStaticTokenIsRejected) {
    EXPECT_THROW((void)StaticTokenProvider(" \n"), std::invalid_argument);
}

TEST_F(TokenProviderTest, FileTokenIsReReadOnEveryCall) {
    const auto file = test_dir / "token";
    writeFile(file, "first\n");
    const FileTokenProvider p(file);
    EXPECT_EQ(p.token(), "first");

    writeFile(file, "second");
    EXPECT_EQ(p.token(), "second");

    writeFile(file, "\n");
    EXPECT_THROW((void)p.token(), std::runtime_error);

    fs::remove(file);
    EXPECT_THROW((void)p.token(), std::runtime_error);
}

TEST_F(TokenProviderTest, FileWinsOverInlineAndEnvironment) {
    const auto file = test_dir / "token";
    writeFile(file, "from-file");
    ::setenv(envName.c_str(), "from-env", 1);

    auto cfg = remote();
    cfg.access_token = "inline";
    cfg.access_token_file = file.string();
    EXPECT_EQ(makeTokenProvider(cfg)->token(), "from-file");

    cfg.access_token_file.clear();
    EXPECT_EQ(makeTokenProvider(cfg)->token(), "inline");

    cfg.access_token.clear();
    EXPECT_EQ(makeTokenProvider(cfg)->token(), "from-env");
}

TEST_F(TokenProviderTest, NothingConfiguredThrows) {
    EXPECT_THROW((void)makeTokenProvider(remote()), std::runtime_error);

    ::setenv(envName.c_str(), "", 1);
    EXPECT_THROW((void)makeTokenProvider(remote()), std::runtime_error);
}
