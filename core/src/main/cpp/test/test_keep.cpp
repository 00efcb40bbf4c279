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
#include <filesystem>
#include <thread>
#include "keep_fixture.h"
#include "codec/codec.h"
#include "persistence/platform_fs.h"

using namespace keep;
using namespace keep::test;
namespace fs = std::filesystem;
using keep::persist::test::corrupt_file;
using keep::persist::test::wait_until;
using keep::persist::test::write_raw;

namespace {

    bool contains(const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    std::vector<std::string> ids_of(const std::vector<KeyDescriptor>& descs) {
        std::vector<std::string> out;
        for (const auto& d : descs) out.push_back(d.physical_id);
        std::sort(out.begin(), out.end());
        return out;
    }

}

class KeepTest : public KeepFixture {};

TEST_F(KeepTest, InitCreatesLayout) {
    EXPECT_EQ(keep->state(), Keep::State::Ready);
    EXPECT_TRUE(fs::is_directory(root()));
    EXPECT_TRUE(fs::is_regular_file(root() + "/main.keep"));
    EXPECT_TRUE(fs::is_directory(root() + "/external"));
}

TEST_F(KeepTest, SecondInitThrows) {
    try {
        keep->init(dir->path());
        FAIL() << "expected Initialization";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::Initialization);
    }
    EXPECT_TRUE(keep->is_ready());
}

TEST_F(KeepTest, CustomFolderName) {
    Keep other(options());
    other.init(dir->path(), "profile");
    other.key<int>("n").write(1).get();
    other.close();
    EXPECT_TRUE(fs::is_regular_file(*dir / "profile/main.keep"));
}

TEST_F(KeepTest, InvalidLocationFailsInit) {
    write_raw(*dir / "not_a_dir", {'p', 'l', 'a', 'i', 'n'});
    Keep other(options());
    Key<int> k = other.key<int>("early");
    auto pending = k.read();

    try {
        other.init(*dir / "not_a_dir");
        FAIL() << "expected Initialization";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::Initialization);
    }
    EXPECT_EQ(other.state(), Keep::State::Failed);
    EXPECT_TRUE(has_error(ErrorCode::Initialization));
    EXPECT_THROW(pending.get(), KeepException);
    EXPECT_THROW(other.init("", "x"), KeepException);
}

TEST_F(KeepTest, CounterSurvivesReopen) {
    Key<int> counter = keep->key<int>("counter");
    counter.write(42).get();
    EXPECT_EQ(counter.read().get(), 42);
    counter.write(100).get();
    reopen();
    EXPECT_EQ(keep->key<int>("counter").read().get(), 100);
}

TEST_F(KeepTest, LastOfUnawaitedWritesSurvivesReopen) {
    Key<int> internal = keep->key<int>("volume");
    Key<int> external = keep->key<int>("position", KeyOptions{false, true, nullptr});
    for (int i = 0; i < 64; ++i) {
        // Futures dropped on purpose: order must not depend on the caller waiting
        internal.write(i);
        external.write(i);
    }
    keep->flush();
    reopen();
    EXPECT_EQ(keep->key<int>("volume").read().get(), 63);
    EXPECT_EQ(keep->key<int>("position", KeyOptions{false, true, nullptr}).read().get(), 63);
}

TEST_F(KeepTest, TempLikeNamesCannotShadowRecordFiles) {
    EXPECT_THROW(keep->key<int>("draft.tmp", KeyOptions{false, true, nullptr}), KeepException);
    EXPECT_THROW(keep->key<int>("..", KeyOptions{false, true, nullptr}), KeepException);
    EXPECT_TRUE(has_error(ErrorCode::InvalidKey));

    // A secure key's record file is named by hash, so any name is fine
    Key<int> secret = keep->secure_key<int>("draft.tmp");
    secret.write(9).get();
    reopen();
    EXPECT_EQ(keep->secure_key<int>("draft.tmp").read().get(), 9);
}

TEST_F(KeepTest, HandleCreatedBeforeInitWaits) {
    Keep late(options());
    Key<std::string> greeting = late.key<std::string>("greeting");
    auto write = greeting.write("hello");
    EXPECT_FALSE(greeting.read_sync());

    late.init(*dir / "late");
    write.get();
    EXPECT_EQ(greeting.read().get(), "hello");
}

TEST_F(KeepTest, CloseBeforeInitFailsPendingWork) {
    auto other = std::make_unique<Keep>(options());
    auto pending = other->key<int>("never").read();
    other->close();
    try {
        pending.get();
        FAIL() << "expected NotInitialized";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotInitialized);
    }
    EXPECT_THROW(other->init(dir->path()), KeepException);
}

TEST_F(KeepTest, OperationsAfterCloseFail) {
    Key<int> k = keep->key<int>("late_write");
    keep->close();
    keep->close();
    try {
        k.write(1).get();
        FAIL() << "expected NotInitialized";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotInitialized);
    }
    EXPECT_THROW(keep->clear().get(), KeepException);
}

TEST_F(KeepTest, SecureTokenNeverOnDisk) {
    Key<std::string> token = keep->secure_key<std::string>("token");
    token.write("abc").get();
    keep->flush();
    EXPECT_TRUE(absent_on_disk("abc"));
    EXPECT_FALSE(persist::test::file_contains(root() + "/main.keep", "abc"));
    EXPECT_EQ(token.read().get(), "abc");
}

TEST_F(KeepTest, ClearRemovableKeepsDurableKeys) {
    Key<int> session = keep->key<int>("session", KeyOptions{true, std::nullopt, nullptr});
    Key<std::string> cache = keep->key<std::string>("cache", KeyOptions{true, true, nullptr});
    Key<int> durable = keep->key<int>("durable");
    Key<std::string> durable_ext = keep->key<std::string>("durable_ext", KeyOptions{false, true, nullptr});

    session.write(1).get();
    cache.write("c").get();
    durable.write(2).get();
    durable_ext.write("d").get();

    std::mutex mu;
    std::vector<std::string> cleared;
    Subscription sub = keep->subscribe([&](const KeyChange& c) {
        if (c.kind == ChangeKind::Cleared) {
            std::lock_guard<std::mutex> lk(mu);
            cleared.push_back(c.physical_id);
        }
    });

    keep->clear_removable().get();

    EXPECT_FALSE(session.read().get());
    EXPECT_FALSE(cache.read().get());
    EXPECT_EQ(durable.read().get(), 2);
    EXPECT_EQ(durable_ext.read().get(), "d");
    EXPECT_FALSE(fs::exists(external_path("cache")));
    EXPECT_TRUE(fs::exists(external_path("durable_ext")));

    std::lock_guard<std::mutex> lk(mu);
    std::sort(cleared.begin(), cleared.end());
    EXPECT_EQ(cleared, (std::vector<std::string>{"cache", "session"}));
}

TEST_F(KeepTest, ClearRemovableAppliesToRecordsFromEarlierRuns) {
    keep->key<int>("temp", KeyOptions{true, std::nullopt, nullptr}).write(1).get();
    keep->key<int>("temp_ext", KeyOptions{true, true, nullptr}).write(1).get();
    keep->key<int>("kept").write(1).get();
    reopen();

    keep->clear_removable().get();
    EXPECT_FALSE(contains(keep->internal_keys(), "temp"));
    EXPECT_FALSE(contains(keep->external_keys(), "temp_ext"));
    EXPECT_TRUE(contains(keep->internal_keys(), "kept"));
}

TEST_F(KeepTest, ClearWipesEverything) {
    Key<int> a = keep->key<int>("a");
    Key<int> b = keep->key<int>("b", KeyOptions{false, true, nullptr});
    a.write(1).get();
    b.write(2).get();

    keep->clear().get();
    EXPECT_FALSE(a.read().get());
    EXPECT_FALSE(b.read().get());
    EXPECT_TRUE(keep->internal_keys().empty());
    EXPECT_TRUE(keep->external_keys().empty());

    a.write(3).get();
    EXPECT_EQ(a.read().get(), 3);
}

TEST_F(KeepTest, RegisteredKeysListed) {
    keep->key<int>("one");
    keep->key<int>("two", KeyOptions{true, std::nullopt, nullptr});
    Key<int> parent = keep->key<int>("three", KeyOptions{true, true, nullptr});
    parent("child");

    EXPECT_EQ(ids_of(keep->keys()),
              (std::vector<std::string>{"one", "three", "three$" + hash_name("child"), "two"}));
    EXPECT_EQ(ids_of(keep->removable_keys()),
              (std::vector<std::string>{"three", "three$" + hash_name("child"), "two"}));
}

TEST_F(KeepTest, StoreListingsFollowPlacement) {
    keep->key<int>("inside").write(1).get();
    keep->key<int>("outside", KeyOptions{false, true, nullptr}).write(1).get();
    EXPECT_TRUE(contains(keep->internal_keys(), "inside"));
    EXPECT_FALSE(contains(keep->internal_keys(), "outside"));
    EXPECT_TRUE(contains(keep->external_keys(), "outside"));
}

TEST_F(KeepTest, FlushPersistsDebouncedSave) {
    keep->key<std::string>("note").write("draft").get();
    keep->flush();

    // Another engine reading a copy of the file sees the flushed record
    fs::create_directories(*dir / "copy/keep");
    fs::copy_file(root() + "/main.keep", *dir / "copy/keep/main.keep");
    Keep copy(options());
    copy.init(*dir / "copy");
    EXPECT_EQ(copy.key<std::string>("note").read().get(), "draft");
}

TEST_F(KeepTest, CorruptConsolidatedFileStartsEmpty) {
    keep->key<int>("lost").write(1).get();
    keep->close();
    keep.reset();

    write_raw(root() + "/main.keep", {0x01, 0x02, 0x03});
    keep = open();

    EXPECT_TRUE(keep->is_ready());
    EXPECT_TRUE(has_error(ErrorCode::Initialization));
    EXPECT_FALSE(keep->key<int>("lost").read().get());
    keep->key<int>("fresh").write(5).get();
    reopen();
    EXPECT_EQ(keep->key<int>("fresh").read().get(), 5);
}

TEST_F(KeepTest, CorruptExternalRecordIsDropped) {
    Key<std::string> doc = keep->key<std::string>("doc", KeyOptions{false, true, nullptr});
    doc.write("contents").get();
    corrupt_file(external_path("doc"), 0, 4);

    EXPECT_FALSE(doc.read().get());
    EXPECT_TRUE(wait_until([&]() { return !fs::exists(external_path("doc")); }));
}

TEST_F(KeepTest, ConcurrentWritersOnDistinctKeys) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i) {
                keep->key<int>("w" + std::to_string(t)).write(i).get();
            }
        });
    }
    for (auto& w : writers) w.join();

    reopen();
    for (int t = 0; t < 4; ++t) {
        EXPECT_EQ(keep->key<int>("w" + std::to_string(t)).read().get(), 24);
    }
}

TEST_F(KeepTest, UserDiscoveryAfterRestart) {
    {
        Key<std::string> users = keep->key<std::string>("users", KeyOptions{true, std::nullopt, nullptr});
        users("u1").write("alice").get();
        users("u2").write("bob").get();
        users("u1")("settings").write("dark").get();
    }
    reopen();

    Key<std::string> users = keep->key<std::string>("users", KeyOptions{true, std::nullopt, nullptr});
    EXPECT_EQ(users.sub_keys().get(), (std::vector<std::string>{"u1", "u2"}));

    keep->clear_removable().get();
    EXPECT_TRUE(users.sub_keys().get().empty());
    EXPECT_FALSE(users("u1")("settings").read().get());
}
