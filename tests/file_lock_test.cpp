#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "lanpaste/storage/file_lock.hpp"
#include "lanpaste/storage/files.hpp"
#include "test_support.hpp"

using namespace lanpaste::core;
using lanpaste::storage::FileLock;
using lanpaste::test_support::TempDir;

TEST(StorageFileLock, SecondAcquireConflicts) {
    TempDir tmp;
    const auto path = tmp.path() / "run" / "git.lock";

    FileLock first;
    ASSERT_TRUE(is_ok(FileLock::acquire(path, &first)));
    EXPECT_TRUE(first.held());

    FileLock second;
    const Status s = FileLock::acquire(path, &second);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.aux, kConflictAlreadyRunning);
    EXPECT_FALSE(second.held());
}

TEST(StorageFileLock, ReleaseAllowsReacquire) {
    TempDir tmp;
    const auto path = tmp.path() / "daemon.lock";

    {
        FileLock lock;
        ASSERT_TRUE(is_ok(FileLock::acquire(path, &lock)));
    }
    FileLock again;
    ASSERT_TRUE(is_ok(FileLock::acquire(path, &again)));
    again.release();
    EXPECT_FALSE(again.held());

    FileLock third;
    EXPECT_TRUE(is_ok(FileLock::acquire(path, &third)));
}

TEST(StorageFileLock, MoveTransfersOwnership) {
    TempDir tmp;
    const auto path = tmp.path() / "git.lock";

    FileLock a;
    ASSERT_TRUE(is_ok(FileLock::acquire(path, &a)));
    FileLock b(std::move(a));
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());

    FileLock other;
    EXPECT_EQ(FileLock::acquire(path, &other).code, StatusCode::Conflict);
}

TEST(StorageFiles, WriteReadRemove) {
    TempDir tmp;
    const auto path = tmp.path() / "a" / "b" / "c.txt";
    ASSERT_TRUE(is_ok(lanpaste::storage::create_dirs(path.parent_path())));
    ASSERT_TRUE(is_ok(lanpaste::storage::write_file(path, lanpaste::storage::as_buffer("hello"))));

    std::string got;
    ASSERT_TRUE(is_ok(lanpaste::storage::read_file(path, &got)));
    EXPECT_EQ(got, "hello");

    ASSERT_TRUE(is_ok(lanpaste::storage::remove_file(path)));
    EXPECT_EQ(lanpaste::storage::read_file(path, &got).code, StatusCode::NotFound);
    EXPECT_TRUE(is_ok(lanpaste::storage::remove_file(path)));
}

TEST(StorageFiles, WriteIntoMissingDirectoryFails) {
    TempDir tmp;
    const Status s = lanpaste::storage::write_file(tmp.path() / "missing" / "x", lanpaste::storage::as_buffer("x"));
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_NE(s.aux, 0u);
}
