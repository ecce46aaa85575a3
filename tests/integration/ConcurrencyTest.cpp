/**
 * @file ConcurrencyTest.cpp
 * @brief Integration tests for repeated and concurrent updates of one file
 * @note A PropertyFile is not thread-safe for shared instance access.
 *       File-level locking (fcntl) serializes updates between processes.
 */

#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>

#include <propfile/PropertyFile.hpp>

using namespace PropFile;

class ConcurrencyTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_concurrency.tmp";
        ::remove(testFile_.c_str());
    }

    void TearDown() override { ::remove(testFile_.c_str()); }

    std::string testFile_;
};

TEST_F(ConcurrencyTest, SequentialUpdatesAccumulate) {
    std::error_code ec;
    ASSERT_TRUE(PropertyFile().overwrite(testFile_, ec));

    for (int i = 0; i < 10; ++i) {
        PropertyFile pf;
        pf.set("key" + std::to_string(i), std::to_string(i));
        ASSERT_TRUE(pf.update(testFile_, ec)) << "Failed on iteration " << i;
    }

    auto pf = PropertyFile::fromFile(testFile_, ec);
    ASSERT_TRUE(pf.has_value());
    EXPECT_EQ(pf->propertiesSize(), 10u);
    EXPECT_EQ(pf->get("key7"), "7");
}

TEST_F(ConcurrencyTest, RapidReadWriteNoLeak) {
    // fd가 새면 반복 중 EMFILE로 실패한다.
    std::error_code ec;
    for (int i = 0; i < 200; ++i) {
        PropertyFile pf;
        pf.set("counter", std::to_string(i));
        ASSERT_TRUE(pf.saveTo(testFile_, ec)) << "Failed on iteration " << i;

        auto reread = PropertyFile::fromFile(testFile_, ec);
        ASSERT_TRUE(reread.has_value()) << ec.message();
        ASSERT_EQ(reread->get("counter"), std::to_string(i));
    }
}

TEST_F(ConcurrencyTest, ConcurrentProcessUpdatesAreSerialized) {
    std::error_code ec;
    ASSERT_TRUE(PropertyFile::fromString("# shared\n").overwrite(testFile_, ec));

    constexpr int kWriters = 4;
    constexpr int kUpdatesPerWriter = 10;

    pid_t children[kWriters];
    for (int w = 0; w < kWriters; ++w) {
        const pid_t pid = ::fork();
        ASSERT_GE(pid, 0);
        if (pid == 0) {
            int failures = 0;
            for (int i = 0; i < kUpdatesPerWriter; ++i) {
                PropertyFile pf;
                pf.set("writer" + std::to_string(w) + ".key" + std::to_string(i), "v");
                std::error_code childEc;
                if (!pf.update(testFile_, childEc))
                    ++failures;
            }
            ::_exit(failures == 0 ? 0 : 1);
        }
        children[w] = pid;
    }

    for (pid_t pid : children) {
        int status = 0;
        ASSERT_EQ(::waitpid(pid, &status, 0), pid);
        EXPECT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }

    // 잠금이 없으면 read-modify-write 사이에 갱신이 유실된다.
    auto pf = PropertyFile::fromFile(testFile_, ec);
    ASSERT_TRUE(pf.has_value());
    EXPECT_EQ(pf->propertiesSize(), static_cast<size_t>(kWriters * kUpdatesPerWriter));
    EXPECT_EQ(pf->entryAt(0), Entry(BasicEntry("# shared\n")));
}
