#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "channeldirectory.hpp"
#include "channelerror.hpp"
#include "channelregistry.hpp"
#include "fake_participant.hpp"

TEST(ConcurrencyTest, JoinRacingLastLeaveIsNeverLost) {
    for (int round = 0; round < 500; ++round) {
        ChannelDirectory directory;
        auto leaver = FakeParticipant::make(1, "leaver");
        auto joiner = FakeParticipant::make(2, "joiner");

        beast::error_code ec;
        auto original = directory.join("#multi_1", leaver, ec);
        ASSERT_FALSE(ec);

        std::atomic<bool> go{false};
        beast::error_code leaveEc;
        beast::error_code joinEc;
        std::shared_ptr<Channel> joined;

        std::thread leaving([&] {
            while (!go) {
            }
            leaveEc = original->leave(*leaver);
        });
        std::thread joining([&] {
            while (!go) {
            }
            joined = directory.join("#multi_1", joiner, joinEc);
        });
        go = true;
        leaving.join();
        joining.join();

        ASSERT_FALSE(leaveEc);
        ASSERT_FALSE(joinEc);
        ASSERT_NE(joined, nullptr);

        auto current = directory.find("#multi_1");
        ASSERT_EQ(current, joined);
        EXPECT_TRUE(current->contains(*joiner));
        EXPECT_EQ(current->memberCount(), 1u);
        EXPECT_FALSE(current->isDestroyed());
        if (current != original) {
            EXPECT_TRUE(original->isDestroyed());
        }
    }
}

namespace {

class CountingRegistry : public ChannelRegistry {
public:
    beast::error_code removeChannel(const Channel &) override {
        ++removals;
        return {};
    }

    std::atomic<int> removals{0};
};

} // namespace

TEST(ConcurrencyTest, InstanceIsRemovedExactlyOnceWhenAllLeave) {
    constexpr int members = 32;

    CountingRegistry registry;
    ChannelOptions options;
    options.name = "#spec_8";
    options.instance = true;
    Channel channel(options, &registry);

    std::vector<std::shared_ptr<FakeParticipant>> participants;
    for (SessionId id = 0; id < members; ++id) {
        participants.push_back(FakeParticipant::make(id, "p"));
        ASSERT_FALSE(channel.join(participants.back()));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (auto const &participant : participants) {
        threads.emplace_back([&channel, &failures, participant] {
            if (channel.leave(*participant)) {
                ++failures;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.removals.load(), 1);
    EXPECT_TRUE(channel.isDestroyed());
}

TEST(ConcurrencyTest, FanOutDuringMembershipChurn) {
    constexpr int workers = 8;
    constexpr int iterations = 200;

    Channel channel(ChannelOptions{"#osu", "", Privileges::Normal, Privileges::Normal, true, false});
    auto listener = FakeParticipant::make(1000, "listener");
    ASSERT_FALSE(channel.join(listener));

    std::vector<std::thread> threads;
    for (SessionId id = 0; id < workers; ++id) {
        threads.emplace_back([&channel, id] {
            auto self = FakeParticipant::make(id, "worker");
            for (int i = 0; i < iterations; ++i) {
                EXPECT_FALSE(channel.join(self));
                beast::error_code ec;
                channel.send(*self, "ping", false, ec);
                EXPECT_FALSE(ec);
                EXPECT_FALSE(channel.leave(*self));
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(channel.memberCount(), 1u);
    EXPECT_TRUE(channel.contains(*listener));
    EXPECT_EQ(listener->receivedCount(), static_cast<std::size_t>(workers * iterations));
}
