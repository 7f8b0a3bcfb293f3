/**
 * @file test_connection_registry.cpp
 * @brief Connection registry: round trip, overwrite, guarded removal and concurrency.
 */
#include "relay/connection_registry.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace mydiarelay::tests;
using namespace mydiarelay::tests::helper;
using namespace mydiarelay::relay;
using mydiarelay::utils::RegistryError;
using ::testing::NiceMock;
using ::testing::Return;

namespace
{

class MockSignalChannel : public SignalChannel
{
  public:
    MOCK_METHOD(bool, deliver, (const SignalMessage &), (override));
    MOCK_METHOD(std::string, channel_id, (), (const, override));
};

std::shared_ptr<NiceMock<MockSignalChannel>> make_channel(const std::string &id)
{
    auto ch = std::make_shared<NiceMock<MockSignalChannel>>();
    ON_CALL(*ch, channel_id()).WillByDefault(Return(id));
    ON_CALL(*ch, deliver(::testing::_)).WillByDefault(Return(true));
    return ch;
}

} // namespace

class ConnectionRegistryTest : public PureApiTest
{
  protected:
    ConnectionRegistry registry;
};

TEST_F(ConnectionRegistryTest, RegisterThenLookupReturnsHandleAndMetadata)
{
    auto ch = make_channel("conn-1");
    registry.register_instance("X", ch, {{"public_key", "pk"}, {"direct_urls", {"https://a"}}});

    auto entry = registry.lookup("X");
    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.content().instance_id, "X");
    EXPECT_EQ(entry.content().handle.lock(), ch);
    EXPECT_EQ(entry.content().metadata.at("public_key"), "pk");

    auto handle = registry.get_handle("X");
    ASSERT_TRUE(handle.is_ok());
    EXPECT_EQ(handle.content(), ch);
    EXPECT_TRUE(registry.online("X"));
}

TEST_F(ConnectionRegistryTest, UnregisterMakesLookupNotFound)
{
    auto ch = make_channel("conn-1");
    registry.register_instance("X", ch);
    registry.unregister("X");
    auto entry = registry.lookup("X");
    ASSERT_TRUE(entry.is_error());
    EXPECT_EQ(entry.error(), RegistryError::NotFound);
    registry.unregister("X");
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(ConnectionRegistryTest, SecondRegistrationWins)
{
    auto first = make_channel("conn-1");
    auto second = make_channel("conn-2");
    registry.register_instance("X", first, {{"v", 1}});
    registry.register_instance("X", second, {{"v", 2}});

    auto entry = registry.lookup("X");
    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.content().handle.lock(), second);
    EXPECT_EQ(entry.content().metadata.at("v"), 2);
    EXPECT_EQ(registry.count(), 1u);
}

TEST_F(ConnectionRegistryTest, StaleSessionCannotEvictSuccessor)
{
    auto first = make_channel("conn-1");
    auto second = make_channel("conn-2");
    registry.register_instance("X", first);
    registry.register_instance("X", second);

    EXPECT_FALSE(registry.unregister_if("X", first.get()));
    EXPECT_TRUE(registry.online("X"));
    EXPECT_TRUE(registry.unregister_if("X", second.get()));
    EXPECT_FALSE(registry.online("X"));
}

TEST_F(ConnectionRegistryTest, DroppedChannelIsNotOnline)
{
    auto ch = make_channel("conn-1");
    registry.register_instance("X", ch);
    ch.reset();
    EXPECT_FALSE(registry.online("X"));
    EXPECT_TRUE(registry.get_handle("X").is_error());
}

TEST_F(ConnectionRegistryTest, UpdateMetadataReplacesOneKey)
{
    registry.register_instance("X", make_channel("conn-1"), {{"public_key", "pk"}});
    EXPECT_TRUE(registry.update_metadata("X", "direct_urls", {"https://b"}));
    EXPECT_FALSE(registry.update_metadata("Y", "direct_urls", {"https://b"}));
    auto entry = registry.lookup("X");
    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.content().metadata.at("public_key"), "pk");
    EXPECT_EQ(entry.content().metadata.at("direct_urls")[0], "https://b");
}

TEST_F(ConnectionRegistryTest, ListOnlineSkipsDeadHandles)
{
    auto alive = make_channel("conn-1");
    registry.register_instance("alive", alive);
    registry.register_instance("dead", make_channel("conn-2"));
    auto online = registry.list_online();
    ASSERT_EQ(online.size(), 1u);
    EXPECT_EQ(online[0].instance_id, "alive");
}

TEST_F(ConnectionRegistryTest, FiftyConcurrentRegistrationsAndLookups)
{
    constexpr int kThreads = 50;
    std::vector<std::shared_ptr<NiceMock<MockSignalChannel>>> channels;
    for (int i = 0; i < kThreads; ++i)
        channels.push_back(make_channel("conn-" + std::to_string(i)));

    ThreadRacer writers(kThreads);
    ASSERT_TRUE(writers.race(
        [&](int i)
        {
            registry.register_instance("inst-" + std::to_string(i),
                                       channels[static_cast<size_t>(i)], {{"n", i}});
        }));

    std::atomic<int> matched{0};
    ThreadRacer readers(kThreads);
    ASSERT_TRUE(readers.race(
        [&](int i)
        {
            auto entry = registry.lookup("inst-" + std::to_string(i));
            if (entry.is_ok() &&
                entry.content().handle.lock() == channels[static_cast<size_t>(i)] &&
                entry.content().metadata.at("n") == i)
                matched.fetch_add(1);
        }));

    EXPECT_EQ(matched.load(), kThreads);
    EXPECT_GE(registry.count(), static_cast<size_t>(kThreads));
}
