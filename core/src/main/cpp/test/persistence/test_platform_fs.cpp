/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include "persistence/platform_fs.h"
#include "test_helpers.h"

using namespace keep::persist;
using namespace keep::persist::test;

class PlatformFSTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDir> dir;

    void SetUp() override {
        dir = std::make_unique<TempDir>("keep_platform_fs");
    }

    void TearDown() override {
        PlatformFS::inject_rename_failures(0, 0);
        dir.reset();
    }
};

TEST_F(PlatformFSTest, AtomicWriteThenRead) {
    std::vector<uint8_t> data{1, 2, 3, 4};
    std::string path = *dir / "record";

    FSResult r = PlatformFS::write_file_atomic(path, data, false);
    ASSERT_TRUE(r.ok) << r.err;

    auto [rr, back] = PlatformFS::read_file(path);
    ASSERT_TRUE(rr.ok);
    EXPECT_EQ(back, data);
    EXPECT_FALSE(std::filesystem::exists(path + TMP_SUFFIX));
}

TEST_F(PlatformFSTest, SyncedWriteSucceeds) {
    std::string path = *dir / "synced";
    EXPECT_TRUE(PlatformFS::write_file_atomic(path, {9}, true).ok);
    EXPECT_TRUE(PlatformFS::fsync_directory(dir->path()).ok);
}

TEST_F(PlatformFSTest, FailedRenameKeepsPreviousFile) {
    std::string path = *dir / "record";
    ASSERT_TRUE(PlatformFS::write_file_atomic(path, {1, 1, 1}, false).ok);

    PlatformFS::inject_rename_failures(1, EIO);
    FSResult r = PlatformFS::write_file_atomic(path, {2, 2, 2, 2}, false);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, EIO);

    auto [rr, back] = PlatformFS::read_file(path);
    ASSERT_TRUE(rr.ok);
    EXPECT_EQ(back, (std::vector<uint8_t>{1, 1, 1}));
    EXPECT_FALSE(std::filesystem::exists(path + TMP_SUFFIX));

    // Injection is consumed
    EXPECT_TRUE(PlatformFS::write_file_atomic(path, {3}, false).ok);
}

TEST_F(PlatformFSTest, ReadPrefixIsBounded) {
    std::string path = *dir / "big";
    std::vector<uint8_t> data(4096, 7);
    ASSERT_TRUE(PlatformFS::write_file_atomic(path, data, false).ok);

    auto [r, prefix] = PlatformFS::read_prefix(path, 515);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(prefix.size(), 515u);

    auto [r2, small] = PlatformFS::read_prefix(path, 100000);
    ASSERT_TRUE(r2.ok);
    EXPECT_EQ(small.size(), data.size());

    auto [rs, size] = PlatformFS::file_size(path);
    ASSERT_TRUE(rs.ok);
    EXPECT_EQ(size, 4096u);
}

TEST_F(PlatformFSTest, MissingFileReportsEnoent) {
    auto [r, bytes] = PlatformFS::read_file(*dir / "absent");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_TRUE(bytes.empty());
}

TEST_F(PlatformFSTest, RemoveMissingIsOk) {
    EXPECT_TRUE(PlatformFS::remove_file(*dir / "absent").ok);
}

TEST_F(PlatformFSTest, ListFilesSkipsDirectories) {
    ASSERT_TRUE(PlatformFS::write_file_atomic(*dir / "a", {1}, false).ok);
    ASSERT_TRUE(PlatformFS::write_file_atomic(*dir / "b", {1}, false).ok);
    ASSERT_TRUE(PlatformFS::ensure_directory(*dir / "nested/deeper").ok);

    auto [r, names] = PlatformFS::list_files(dir->path());
    ASSERT_TRUE(r.ok);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}

TEST_F(PlatformFSTest, EnsureDirectoryIsIdempotent) {
    std::string nested = *dir / "x/y/z";
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);
    EXPECT_TRUE(std::filesystem::is_directory(nested));

    std::string file = *dir / "plain";
    ASSERT_TRUE(PlatformFS::write_file_atomic(file, {1}, false).ok);
    EXPECT_FALSE(PlatformFS::ensure_directory(file).ok);
}
