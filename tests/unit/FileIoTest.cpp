/**
 * @file FileIoTest.cpp
 * @brief Unit tests for the POSIX file layer (UniqueFd, FileLockGuard, FileIo)
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>

#include <propfile/util/DiagnosticSink.hpp>
#include <propfile/util/FileIo.hpp>
#include <propfile/util/FileLockGuard.hpp>
#include <propfile/util/UniqueFd.hpp>

using namespace PropFile;
using namespace PropFile::detail;

class FileIoTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_fileio.tmp";
        testDir_ = "./test_fileio_dir.tmp";
        ::remove(testFile_.c_str());
        std::filesystem::remove_all(testDir_);
    }

    void TearDown() override {
        ::remove(testFile_.c_str());
        std::filesystem::remove_all(testDir_);
    }

    std::string testFile_;
    std::string testDir_;
};

// =============================================================================
// UniqueFd
// =============================================================================

TEST_F(FileIoTest, UniqueFdOpenMissingFileSetsErrno) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_RDONLY, ec);
    EXPECT_FALSE(fd.valid());
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(FileIoTest, UniqueFdOpenAndClose) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(fd.valid());
    const int raw = fd.get();

    EXPECT_TRUE(fd.close(ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(fd.valid());
    // 이미 닫힌 fd
    EXPECT_EQ(::write(raw, "x", 1), -1);

    // 두 번째 close는 아무 일도 하지 않는다.
    EXPECT_TRUE(fd.close(ec));
}

TEST_F(FileIoTest, UniqueFdMoveTransfersOwnership) {
    std::error_code ec;
    UniqueFd fd1 = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd1.valid());
    const int raw = fd1.get();

    UniqueFd fd2(std::move(fd1));
    EXPECT_FALSE(fd1.valid());
    EXPECT_EQ(fd2.get(), raw);
}

// =============================================================================
// FileLockGuard
// =============================================================================

TEST_F(FileIoTest, LockGuardLocksAndUnlocks) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd.valid());

    {
        FileLockGuard lock(fd.get(), FileLockGuard::Mode::Exclusive, ec);
        EXPECT_FALSE(ec);
        EXPECT_TRUE(lock.locked());

        EXPECT_TRUE(lock.unlock(ec));
        EXPECT_FALSE(lock.locked());
    }

    FileLockGuard shared(fd.get(), FileLockGuard::Mode::Shared, ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(shared.locked());
}

TEST_F(FileIoTest, LockGuardRejectsInvalidFd) {
    std::error_code ec;
    FileLockGuard lock(-1, FileLockGuard::Mode::Shared, ec);
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
    EXPECT_FALSE(lock.locked());
}

TEST_F(FileIoTest, LockGuardMoveKeepsSingleOwner) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd.valid());

    FileLockGuard lock1(fd.get(), FileLockGuard::Mode::Exclusive, ec);
    ASSERT_TRUE(lock1.locked());

    FileLockGuard lock2;
    lock2 = std::move(lock1);
    EXPECT_FALSE(lock1.locked());
    EXPECT_TRUE(lock2.locked());
}

// =============================================================================
// readFile / writeFile
// =============================================================================

TEST_F(FileIoTest, WriteThenReadFile) {
    std::error_code ec;
    ASSERT_TRUE(writeFile(testFile_, "a = 1\nb = 2\n", false, ec));
    ASSERT_FALSE(ec);

    std::string content;
    ASSERT_TRUE(readFile(testFile_, content, ec));
    EXPECT_EQ(content, "a = 1\nb = 2\n");
}

TEST_F(FileIoTest, WriteFileTruncatesLongerContent) {
    std::error_code ec;
    ASSERT_TRUE(writeFile(testFile_, "a very long first version\n", false, ec));
    ASSERT_TRUE(writeFile(testFile_, "short\n", false, ec));

    std::string content;
    ASSERT_TRUE(readFile(testFile_, content, ec));
    EXPECT_EQ(content, "short\n");
}

TEST_F(FileIoTest, WriteFileCreatesParentDirectories) {
    const std::string path = testDir_ + "/nested/deeper/file.properties";
    std::error_code ec;

    EXPECT_FALSE(writeFile(path, "x = 1\n", false, ec));
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

    ASSERT_TRUE(writeFile(path, "x = 1\n", true, ec));
    EXPECT_TRUE(fileExists(path));
}

TEST_F(FileIoTest, ReadMissingFileFails) {
    std::error_code ec;
    std::string content;
    EXPECT_FALSE(readFile(testFile_, content, ec));
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    EXPECT_FALSE(fileExists(testFile_));
}

TEST_F(FileIoTest, ReplaceContentsRewritesFromStart) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd.valid());

    ASSERT_TRUE(writeAll(fd.get(), "0123456789", ec));
    ASSERT_TRUE(replaceContents(fd.get(), "abc", ec));

    struct stat st{};
    ASSERT_EQ(::fstat(fd.get(), &st), 0);
    EXPECT_EQ(st.st_size, 3);

    ASSERT_EQ(::lseek(fd.get(), 0, SEEK_SET), 0);
    std::string content;
    ASSERT_TRUE(readAll(fd.get(), content, ec));
    EXPECT_EQ(content, "abc");
}

TEST_F(FileIoTest, CloseReportingWarnsOnBadDescriptor) {
    CollectingDiagnosticSink sink;

    // 이미 닫힌 번호를 넘겨 close 실패를 만든다.
    int raw = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(raw, 0);
    ::close(raw);

    UniqueFd fd(raw);
    closeReporting(fd, testFile_, sink);

    ASSERT_EQ(sink.diagnostics().size(), 1u);
    EXPECT_EQ(sink.diagnostics()[0].severity, Severity::Warning);
    EXPECT_NE(sink.diagnostics()[0].message.find(testFile_), std::string::npos);
}
