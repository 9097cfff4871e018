#include <gtest/gtest.h>

#include "channeldirectory.hpp"
#include "channelerror.hpp"
#include "fake_participant.hpp"

TEST(ChannelDirectoryTest, DefaultChannelsAreRegistered) {
    ChannelDirectory directory(defaultChannels());

    EXPECT_EQ(directory.size(), defaultChannels().size());
    auto announce = directory.find("#announce");
    ASSERT_NE(announce, nullptr);
    EXPECT_TRUE(announce->canRead(Privileges::Normal));
    EXPECT_FALSE(announce->canWrite(Privileges::Normal));
    EXPECT_FALSE(announce->isInstance());

    auto staff = directory.find("#staff");
    ASSERT_NE(staff, nullptr);
    EXPECT_FALSE(staff->canRead(Privileges::Normal | Privileges::Supporter));
    EXPECT_TRUE(staff->canRead(Privileges::Normal | Privileges::Mod));
    EXPECT_TRUE(staff->canRead(Privileges::Normal | Privileges::Admin));
    EXPECT_TRUE(staff->canWrite(Privileges::Normal | Privileges::Mod | Privileges::Admin));
    EXPECT_FALSE(staff->canWrite(Privileges::Normal));
}

TEST(ChannelDirectoryTest, AutoJoinChannelsAreSortedByName) {
    ChannelDirectory directory(defaultChannels());

    auto autoJoin = directory.autoJoinChannels();
    ASSERT_EQ(autoJoin.size(), 2u);
    EXPECT_EQ(autoJoin[0]->internalName(), "#announce");
    EXPECT_EQ(autoJoin[1]->internalName(), "#osu");
}

TEST(ChannelDirectoryTest, CreateRejectsDuplicateName) {
    ChannelDirectory directory;
    beast::error_code ec;

    ChannelOptions options;
    options.name = "#osu";
    auto first = directory.createChannel(options, ec);
    ASSERT_FALSE(ec);
    ASSERT_NE(first, nullptr);

    auto second = directory.createChannel(options, ec);
    EXPECT_EQ(ec, make_error_code(ChannelError::channel_exists));
    EXPECT_EQ(second, nullptr);
    EXPECT_EQ(directory.find("#osu"), first);
}

TEST(ChannelDirectoryTest, JoinUnknownChannelFails) {
    ChannelDirectory directory(defaultChannels());
    auto a = FakeParticipant::make(1, "a");

    beast::error_code ec;
    EXPECT_EQ(directory.join("#nope", a, ec), nullptr);
    EXPECT_EQ(ec, make_error_code(ChannelError::channel_not_found));
    EXPECT_EQ(directory.findOrCreateInstance("#nope"), nullptr);
}

TEST(ChannelDirectoryTest, InstanceChannelIsCreatedOnJoinAndRemovedWhenEmpty) {
    ChannelDirectory directory;
    auto a = FakeParticipant::make(1, "a");

    beast::error_code ec;
    auto channel = directory.join("#multi_7", a, ec);
    ASSERT_FALSE(ec);
    ASSERT_NE(channel, nullptr);
    EXPECT_TRUE(channel->isInstance());
    EXPECT_FALSE(channel->autoJoin());
    EXPECT_EQ(channel->displayName(), "#multiplayer");
    EXPECT_EQ(directory.find("#multi_7"), channel);

    ASSERT_FALSE(channel->leave(*a));
    EXPECT_TRUE(channel->isDestroyed());
    EXPECT_EQ(directory.find("#multi_7"), nullptr);
    EXPECT_EQ(directory.size(), 0u);

    // The removal already happened once; the registry no longer knows it.
    EXPECT_EQ(directory.removeChannel(*channel), make_error_code(ChannelError::not_in_directory));
}

TEST(ChannelDirectoryTest, JoinAfterInstanceTeardownGetsFreshChannel) {
    ChannelDirectory directory;
    auto a = FakeParticipant::make(1, "a");
    auto b = FakeParticipant::make(2, "b");

    beast::error_code ec;
    auto first = directory.join("#spec_3", a, ec);
    ASSERT_FALSE(ec);
    ASSERT_FALSE(first->leave(*a));

    auto second = directory.join("#spec_3", b, ec);
    ASSERT_FALSE(ec);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
    EXPECT_TRUE(second->contains(*b));
    EXPECT_EQ(directory.find("#spec_3"), second);
}

TEST(ChannelDirectoryTest, PermanentChannelStaysResolvableWhenEmpty) {
    ChannelDirectory directory(defaultChannels());
    auto a = FakeParticipant::make(1, "a");

    beast::error_code ec;
    auto channel = directory.join("#lobby", a, ec);
    ASSERT_FALSE(ec);
    ASSERT_FALSE(channel->leave(*a));

    EXPECT_EQ(directory.find("#lobby"), channel);
    EXPECT_EQ(channel->summary().memberCount, 0u);
}

TEST(ChannelDirectoryTest, DuplicateJoinThroughDirectoryIsReported) {
    ChannelDirectory directory(defaultChannels());
    auto a = FakeParticipant::make(1, "a");

    beast::error_code ec;
    ASSERT_NE(directory.join("#osu", a, ec), nullptr);
    EXPECT_EQ(directory.join("#osu", a, ec), nullptr);
    EXPECT_EQ(ec, make_error_code(ChannelError::already_member));
    EXPECT_EQ(directory.find("#osu")->memberCount(), 1u);
}

TEST(ChannelDirectoryTest, DestroyChannelKicksMembers) {
    ChannelDirectory directory(defaultChannels());
    auto a = FakeParticipant::make(1, "a");
    auto b = FakeParticipant::make(2, "b");

    beast::error_code ec;
    auto channel = directory.join("#help", a, ec);
    ASSERT_FALSE(ec);
    ASSERT_NE(directory.join("#help", b, ec), nullptr);

    ASSERT_FALSE(directory.destroyChannel("#help"));
    EXPECT_EQ(directory.find("#help"), nullptr);
    EXPECT_TRUE(channel->isDestroyed());
    ASSERT_EQ(a->receivedCount(), 1u);
    EXPECT_EQ(*a->received().front(), *packets::channelKick("#help"));
    EXPECT_EQ(b->receivedCount(), 1u);

    EXPECT_EQ(directory.destroyChannel("#help"), make_error_code(ChannelError::channel_not_found));
    EXPECT_EQ(directory.join("#help", a, ec), nullptr);
    EXPECT_EQ(ec, make_error_code(ChannelError::channel_not_found));
}

TEST(ChannelDirectoryTest, InstanceNames) {
    EXPECT_TRUE(ChannelDirectory::isInstanceName("#spec_1"));
    EXPECT_TRUE(ChannelDirectory::isInstanceName("#multi_200"));
    EXPECT_FALSE(ChannelDirectory::isInstanceName("#spectator"));
    EXPECT_FALSE(ChannelDirectory::isInstanceName("#osu"));
}
