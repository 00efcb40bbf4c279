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
#include <gmock/gmock.h>
#include <atomic>
#include <future>
#include <map>
#include "keep_fixture.h"
#include "codec/json_value.h"
#include "persistence/mock_storage.h"
#include "persistence/platform_fs.h"

using namespace keep;
using namespace keep::test;
using keep::persist::test::MockStorage;
using keep::persist::test::wait_until;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class KeyTest : public KeepFixture {};

TEST_F(KeyTest, PlainWriteThenRead) {
    Key<int> counter = keep->key<int>("counter");
    counter.write(42).get();
    EXPECT_EQ(counter.read().get(), 42);
    counter.write(100).get();
    EXPECT_EQ(counter.read().get(), 100);
    EXPECT_EQ(counter.read_sync(), 100);
    EXPECT_EQ(counter.physical_id(), "counter");
    EXPECT_FALSE(counter.external());
}

TEST_F(KeyTest, MissingValueReadsEmpty) {
    Key<std::string> name = keep->key<std::string>("name");
    EXPECT_FALSE(name.read().get());
    EXPECT_FALSE(name.read_sync());
    EXPECT_EQ(name.read_safe_sync("fallback"), "fallback");
    EXPECT_FALSE(name.exists().get());
}

TEST_F(KeyTest, WriteNothingRemoves) {
    Key<bool> flag = keep->key<bool>("flag");
    flag.write(true).get();
    EXPECT_TRUE(flag.exists_sync());
    flag.write(std::nullopt).get();
    EXPECT_FALSE(flag.exists_sync());
    EXPECT_FALSE(flag.read().get());
}

TEST_F(KeyTest, RemoveAndExists) {
    Key<double> ratio = keep->key<double>("ratio");
    ratio.write(0.75).get();
    EXPECT_TRUE(ratio.exists().get());
    ratio.remove().get();
    EXPECT_FALSE(ratio.exists().get());
}

TEST_F(KeyTest, UpdateIsReadModifyWrite) {
    Key<int> visits = keep->key<int>("visits");
    for (int i = 0; i < 10; ++i) {
        visits.update([](std::optional<int> cur) -> std::optional<int> { return cur.value_or(0) + 1; }).get();
    }
    EXPECT_EQ(visits.read().get(), 10);

    visits.update([](std::optional<int>) -> std::optional<int> { return std::nullopt; }).get();
    EXPECT_FALSE(visits.exists_sync());
}

TEST_F(KeyTest, ContainersRoundTripThroughDisk) {
    Key<std::vector<std::string>> tags = keep->key<std::vector<std::string>>("tags");
    Key<std::map<std::string, int>> scores = keep->key<std::map<std::string, int>>("scores", KeyOptions{false, true, nullptr});
    Key<Value::Bytes> blob = keep->key<Value::Bytes>("blob");

    tags.write({"a", "b"}).get();
    scores.write({{"x", 1}}).get();
    blob.write(Value::Bytes{0, 1, 255}).get();
    reopen();

    EXPECT_EQ(keep->key<std::vector<std::string>>("tags").read().get(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ((keep->key<std::map<std::string, int>>("scores", KeyOptions{false, true, nullptr}).read().get()),
              (std::map<std::string, int>{{"x", 1}}));
    EXPECT_EQ(keep->key<Value::Bytes>("blob").read().get(), (Value::Bytes{0, 1, 255}));
}

TEST_F(KeyTest, SameShapeSharesCore) {
    Key<int> a = keep->key<int>("shared");
    Key<int> b = keep->key<int>("shared");
    EXPECT_TRUE(a == b);
    a.write(5).get();
    EXPECT_EQ(b.read_sync(), 5);
}

TEST_F(KeyTest, IncompatibleRegistrationConflicts) {
    keep->key<int>("typed");
    try {
        keep->key<std::string>("typed");
        FAIL() << "expected KeyConflict";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::KeyConflict);
    }
    EXPECT_THROW(keep->key<int>("typed", KeyOptions{true, std::nullopt, nullptr}), KeepException);
    EXPECT_THROW(keep->key<int>("typed", KeyOptions{false, true, nullptr}), KeepException);
    EXPECT_TRUE(has_error(ErrorCode::KeyConflict));
}

TEST_F(KeyTest, InvalidNamesRejected) {
    for (const std::string& bad : {std::string(), std::string("a$b"), std::string("a/b"), std::string(256, 'n'),
                                   std::string("."), std::string(".."), std::string("cache.tmp")}) {
        try {
            keep->key<int>(bad);
            FAIL() << "accepted '" << bad << "'";
        } catch (const KeepException& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidKey);
        }
    }
    EXPECT_NO_THROW(keep->key<int>(std::string(255, 'n')));
    EXPECT_NO_THROW(keep->key<int>(".hidden"));
    EXPECT_NO_THROW(keep->key<int>("cache.tmp.bak"));
    EXPECT_THROW(keep->secure_key<int>(""), KeepException);
    EXPECT_NO_THROW(keep->secure_key<int>("a/b$c"));
}

TEST_F(KeyTest, UnconvertibleValueIsDroppedAndReported) {
    Converter<int> picky;
    picky.from_storage = [](const Value&) -> std::optional<int> { return std::nullopt; };
    Key<int> k = keep->key<int>("picky", KeyOptions(), picky);
    k.write(5).get();

    EXPECT_FALSE(k.read().get());
    EXPECT_TRUE(has_error(ErrorCode::Codec));
    EXPECT_TRUE(wait_until([&]() { return !k.exists_sync(); }));
}

TEST_F(KeyTest, ConverterFailureOnWriteIsReported) {
    Converter<int> broken;
    broken.to_storage = [](const int&) -> Value { throw std::runtime_error("cannot encode"); };
    Key<int> k = keep->key<int>("broken", KeyOptions(), broken);

    try {
        k.write(1).get();
        FAIL() << "expected Codec";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::Codec);
    }
    EXPECT_TRUE(has_error(ErrorCode::Codec));
    EXPECT_FALSE(k.exists_sync());
}

TEST_F(KeyTest, ExternalKeyUsesRecordFile) {
    Key<std::string> doc = keep->key<std::string>("doc", KeyOptions{false, true, nullptr});
    EXPECT_TRUE(doc.external());
    doc.write(std::string(2000, 'd')).get();
    EXPECT_TRUE(std::filesystem::exists(external_path("doc")));

    auto internal = keep->internal_keys();
    EXPECT_EQ(std::find(internal.begin(), internal.end(), "doc"), internal.end());
}

TEST_F(KeyTest, SecureValueNeverStoredInClear) {
    Key<std::string> token = keep->secure_key<std::string>("session_token");
    EXPECT_TRUE(token.secure());
    EXPECT_TRUE(token.external());
    EXPECT_EQ(token.physical_id(), hash_name("session_token"));

    token.write("abc").get();
    keep->flush();
    EXPECT_EQ(token.read().get(), "abc");

    ASSERT_TRUE(std::filesystem::exists(external_path(token.physical_id())));
    EXPECT_TRUE(absent_on_disk("abc"));
    EXPECT_TRUE(absent_on_disk("session_token"));

    std::optional<RecordHeader> h = keep->external_storage().header(token.physical_id());
    ASSERT_TRUE(h);
    EXPECT_TRUE(h->secure());
    EXPECT_TRUE(h->logical_name.empty());

    reopen();
    EXPECT_EQ(keep->secure_key<std::string>("session_token").read().get(), "abc");
}

TEST_F(KeyTest, SecureInternalKey) {
    Key<int> pin = keep->secure_key<int>("pin", KeyOptions{false, false, nullptr});
    pin.write(1234).get();
    keep->flush();
    EXPECT_FALSE(pin.external());
    EXPECT_EQ(pin.read().get(), 1234);
    EXPECT_TRUE(absent_on_disk("pin"));
}

TEST_F(KeyTest, SecureRecordThatIsNotCiphertextIsDropped) {
    Key<std::string> token = keep->secure_key<std::string>("token");
    KeyDescriptor raw = token.descriptor();
    keep->external_storage().write(raw, Value(17)).get();

    EXPECT_FALSE(token.read().get());
    EXPECT_TRUE(has_error(ErrorCode::Encryption));
    EXPECT_TRUE(wait_until([&]() { return !token.exists_sync(); }));
}

TEST_F(KeyTest, SecureReaderAcceptsBareValue) {
    Key<std::string> legacy = keep->secure_key<std::string>("legacy");
    std::string cipher = keep->encryptor().encrypt_sync(value_to_json(Value("old")));
    keep->external_storage().write(legacy.descriptor(), Value(cipher)).get();
    EXPECT_EQ(legacy.read().get(), "old");
}

TEST_F(KeyTest, SecureLegacyMapWithValueMemberStaysWhole) {
    using Fields = std::map<std::string, int>;
    Key<Fields> legacy = keep->secure_key<Fields>("legacy_map");
    Value::Map fields;
    fields["v"] = Value(1);
    fields["w"] = Value(2);
    std::string cipher = keep->encryptor().encrypt_sync(value_to_json(Value(fields)));
    keep->external_storage().write(legacy.descriptor(), Value(cipher)).get();
    EXPECT_EQ(legacy.read().get(), (Fields{{"v", 1}, {"w", 2}}));
}

TEST_F(KeyTest, SubscribersSeeWritesAndRemovals) {
    Key<int> k = keep->key<int>("watched");
    std::mutex mu;
    std::vector<ChangeKind> kinds;
    Subscription sub = k.subscribe([&](const KeyChange& c) {
        std::lock_guard<std::mutex> lk(mu);
        kinds.push_back(c.kind);
        EXPECT_EQ(c.logical_name, "watched");
    });
    Key<int> other = keep->key<int>("unwatched");

    k.write(1).get();
    other.write(2).get();
    k.remove().get();

    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(kinds, (std::vector<ChangeKind>{ChangeKind::Written, ChangeKind::Removed}));
}

TEST_F(KeyTest, SubKeysDeriveIdsAndInheritFlags) {
    Key<int> users = keep->key<int>("users", KeyOptions{true, std::nullopt, nullptr});
    Key<int> u1 = users("u1");
    EXPECT_EQ(u1.physical_id(), "users$" + hash_name("u1"));
    EXPECT_EQ(u1.name(), "u1");
    EXPECT_TRUE(u1.removable());
    EXPECT_EQ(u1.descriptor().parent, std::optional<std::string>("users"));
    EXPECT_TRUE(users("u1") == u1);
    EXPECT_THROW(users(""), KeepException);
}

TEST_F(KeyTest, SubKeyDiscoveryListsDirectChildrenOnly) {
    {
        Key<int> users = keep->key<int>("users");
        users("u1").write(1).get();
        users("u2").write(2).get();
        users("u1")("settings").write(3).get();
    }
    reopen();

    Key<int> users = keep->key<int>("users");
    std::vector<std::string> names = users.sub_keys().get();
    EXPECT_EQ(names, (std::vector<std::string>{"u1", "u2"}));
    EXPECT_EQ(users("u2").read().get(), 2);
    EXPECT_EQ(users("u1")("settings").read().get(), 3);
}

TEST_F(KeyTest, InstantiatedSubKeyListedBeforeWrite) {
    Key<int> users = keep->key<int>("users");
    users("u1").write(1).get();
    Key<int> u2 = users("u2");
    users("u1")("settings");

    EXPECT_EQ(users.sub_keys().get(), (std::vector<std::string>{"u1", "u2"}));
    EXPECT_FALSE(u2.exists_sync());
}

TEST_F(KeyTest, SecureSubKeyNamesRecoveredByDecryption) {
    {
        Key<std::string> vault = keep->secure_key<std::string>("vault");
        vault("github").write("gh-secret").get();
        vault("mail").write("mail-secret").get();
    }
    reopen();

    Key<std::string> vault = keep->secure_key<std::string>("vault");
    EXPECT_EQ(vault.sub_keys().get(), (std::vector<std::string>{"github", "mail"}));
    EXPECT_TRUE(absent_on_disk("github"));
}

TEST_F(KeyTest, ClearSubKeysRemovesDescendants) {
    Key<int> cart = keep->key<int>("cart");
    cart.write(0).get();
    cart("apple").write(3).get();
    cart("pear").write(1).get();
    cart("pear")("note").write(9).get();

    std::vector<SubKeyEvent> events;
    uint64_t id = cart.subscribe_sub_keys([&](SubKeyEvent e, const std::string&) { events.push_back(e); });
    cart.clear_sub_keys().get();
    cart.unsubscribe_sub_keys(id);

    EXPECT_TRUE(cart.sub_keys().get().empty());
    EXPECT_FALSE(cart("apple").read().get());
    EXPECT_FALSE(cart("pear")("note").read().get());
    EXPECT_EQ(cart.read().get(), 0);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front(), SubKeyEvent::Cleared);
}

TEST_F(KeyTest, RemovingSubKeyUnregistersIt) {
    Key<int> parent = keep->key<int>("parent");
    Key<int> child = parent("child");
    EXPECT_EQ(parent.sub_keys().get(), (std::vector<std::string>{"child"}));
    child.write(1).get();
    child.remove().get();
    EXPECT_TRUE(parent.sub_keys().get().empty());
}

TEST_F(KeyTest, AlternateStorageReceivesTraffic) {
    auto mock = std::make_shared<NiceMock<MockStorage>>();
    Key<int> k = keep->key<int>("routed", KeyOptions{false, std::nullopt, mock});
    EXPECT_TRUE(k.external());

    EXPECT_CALL(*mock, write(_, Value(7))).WillOnce(Invoke([](const KeyDescriptor& d, const Value&) {
        EXPECT_EQ(d.physical_id, "routed");
        EXPECT_TRUE(d.external);
        return persist::ready_future();
    }));
    EXPECT_CALL(*mock, read(_)).WillOnce(Invoke([](const KeyDescriptor&) {
        return persist::ready_future(std::optional<Value>(Value(7)));
    }));

    k.write(7).get();
    EXPECT_EQ(k.read().get(), 7);
    // Cached after the first read
    EXPECT_EQ(k.read().get(), 7);
}

TEST_F(KeyTest, PlainReadCacheInvalidatedByWrite) {
    auto mock = std::make_shared<NiceMock<MockStorage>>();
    Key<int> k = keep->key<int>("cached", KeyOptions{false, std::nullopt, mock});
    ON_CALL(*mock, write(_, _)).WillByDefault(Invoke([](const KeyDescriptor&, const Value&) {
        return persist::ready_future();
    }));

    std::atomic<int> value{1};
    EXPECT_CALL(*mock, read(_)).Times(2).WillRepeatedly(Invoke([&value](const KeyDescriptor&) {
        return persist::ready_future(std::optional<Value>(Value(value.load())));
    }));

    EXPECT_EQ(k.read().get(), 1);
    EXPECT_EQ(k.read().get(), 1);
    value = 2;
    k.write(2).get();
    EXPECT_EQ(k.read().get(), 2);
}

TEST_F(KeyTest, BackendWriteFailurePropagates) {
    auto mock = std::make_shared<NiceMock<MockStorage>>();
    Key<int> k = keep->key<int>("failing", KeyOptions{false, std::nullopt, mock});
    EXPECT_CALL(*mock, write(_, _)).WillOnce(Invoke([](const KeyDescriptor& d, const Value&) {
        return persist::failed_future<void>(KeepException(ErrorCode::IO, "backend down", d.physical_id));
    }));
    try {
        k.write(1).get();
        FAIL() << "expected IO";
    } catch (const KeepException& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO);
    }
}

TEST_F(KeyTest, UnawaitedWritesApplyInCallOrder) {
    Key<int> internal = keep->key<int>("burst");
    Key<int> external = keep->key<int>("burst_ext", KeyOptions{false, true, nullptr});
    for (int round = 0; round < 20; ++round) {
        std::vector<std::future<void>> pending;
        for (int i = 0; i < 64; ++i) {
            pending.push_back(internal.write(round * 100 + i));
            pending.push_back(external.write(round * 100 + i));
        }
        for (auto& f : pending) {
            f.get();
        }
        ASSERT_EQ(internal.read().get(), round * 100 + 63) << "round " << round;
        ASSERT_EQ(external.read().get(), round * 100 + 63) << "round " << round;
    }
}

TEST_F(KeyTest, ReadIssuedAfterWriteSeesIt) {
    Key<std::string> k = keep->key<std::string>("ordered", KeyOptions{false, true, nullptr});
    for (int i = 0; i < 50; ++i) {
        std::future<void> written = k.write("v" + std::to_string(i));
        std::future<std::optional<std::string>> read = k.read();
        EXPECT_EQ(read.get(), "v" + std::to_string(i));
        written.get();
    }
}

TEST_F(KeyTest, UnawaitedUpdatesNeverLoseIncrements) {
    Key<int> counter = keep->key<int>("hits");
    std::vector<std::future<void>> pending;
    for (int i = 0; i < 200; ++i) {
        pending.push_back(counter.update([](std::optional<int> v) { return std::optional<int>(v.value_or(0) + 1); }));
    }
    for (auto& f : pending) {
        f.get();
    }
    EXPECT_EQ(counter.read().get(), 200);
}

TEST_F(KeyTest, ReadOverlappingClearIsNotCached) {
    auto mock = std::make_shared<NiceMock<MockStorage>>();
    Key<int> k = keep->key<int>("racy", KeyOptions{false, std::nullopt, mock});

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> reading{false};
    EXPECT_CALL(*mock, read(_))
        .WillOnce(Invoke([&](const KeyDescriptor&) {
            reading = true;
            gate.wait();
            return persist::ready_future(std::optional<Value>(Value(1)));
        }))
        .WillOnce(Invoke([](const KeyDescriptor&) {
            return persist::ready_future(std::optional<Value>(Value(2)));
        }));

    std::future<std::optional<int>> first = k.read();
    ASSERT_TRUE(wait_until([&]() { return reading.load(); }));
    // Invalidates while the fetch is in flight
    keep->clear().get();
    release.set_value();
    EXPECT_EQ(first.get(), 1);
    EXPECT_EQ(k.read().get(), 2);
}

TEST_F(KeyTest, ReadSyncDoesNotFillCache) {
    auto mock = std::make_shared<NiceMock<MockStorage>>();
    Key<int> k = keep->key<int>("peeked", KeyOptions{false, std::nullopt, mock});
    EXPECT_CALL(*mock, read_sync(_)).WillOnce(Return(std::optional<Value>(Value(1))));
    EXPECT_CALL(*mock, read(_)).WillOnce(Invoke([](const KeyDescriptor&) {
        return persist::ready_future(std::optional<Value>(Value(2)));
    }));

    EXPECT_EQ(k.read_sync(), 1);
    EXPECT_EQ(k.read().get(), 2);
}

TEST_F(KeyTest, RewrittenValueSurvivesDropOfEarlierCorruption) {
    Key<int> k = keep->key<int>("mixed");
    keep->internal_storage().write(k.descriptor(), Value("junk")).get();

    // Whichever of the drop and the write runs first, the write wins
    std::future<std::optional<int>> bad = k.read();
    std::future<void> rewritten = k.write(5);
    EXPECT_FALSE(bad.get());
    rewritten.get();
    keep->flush();
    EXPECT_EQ(k.read().get(), 5);
    EXPECT_TRUE(has_error(ErrorCode::Codec));
}
