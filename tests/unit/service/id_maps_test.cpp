#include <gtest/gtest.h>

#include <cstdint>

#include "gnb/service/id_maps.hpp"

using namespace gnb::service;

TEST(IdMapsTest, FirstGuestIdIsTwo) {
    IdMaps maps;
    EXPECT_EQ(maps.assign(HostId(40)), GuestId(2));
    EXPECT_EQ(maps.assign(HostId(41)), GuestId(3));
    EXPECT_EQ(maps.size(), 2u);
}

TEST(IdMapsTest, GuestIdsIndependentOfHostIds) {
    IdMaps maps;
    auto guest = maps.assign(HostId(1000));
    EXPECT_NE(guest.value(), 1000u);
    EXPECT_EQ(maps.lookupGuest(guest), HostId(1000));
    EXPECT_EQ(maps.lookupHost(HostId(1000)), guest);
}

TEST(IdMapsTest, ReplacementKeepsGuestId) {
    IdMaps maps;
    auto guest = maps.assign(HostId(7));
    auto replaced = maps.assign(HostId(9), guest);
    EXPECT_EQ(replaced, guest);
    EXPECT_EQ(maps.lookupGuest(guest), HostId(9));
    EXPECT_FALSE(maps.lookupHost(HostId(7)).has_value());
    EXPECT_EQ(maps.size(), 1u);
}

TEST(IdMapsTest, ReplacementWithSameHostId) {
    IdMaps maps;
    auto guest = maps.assign(HostId(7));
    EXPECT_EQ(maps.assign(HostId(7), guest), guest);
    EXPECT_EQ(maps.lookupHost(HostId(7)), guest);
    EXPECT_EQ(maps.size(), 1u);
}

TEST(IdMapsTest, ReusedHostIdEvictsStaleMapping) {
    IdMaps maps;
    auto first = maps.assign(HostId(5));
    auto second = maps.assign(HostId(5));
    EXPECT_NE(first, second);
    EXPECT_FALSE(maps.lookupGuest(first).has_value());
    EXPECT_EQ(maps.lookupHost(HostId(5)), second);
    EXPECT_EQ(maps.size(), 1u);
}

TEST(IdMapsTest, RemoveHost) {
    IdMaps maps;
    auto guest = maps.assign(HostId(5));
    EXPECT_EQ(maps.removeHost(HostId(5)), guest);
    EXPECT_FALSE(maps.removeHost(HostId(5)).has_value());
    EXPECT_FALSE(maps.lookupGuest(guest).has_value());
    EXPECT_TRUE(maps.empty());
}

TEST(IdMapsTest, ClearKeepsCounterRunning) {
    IdMaps maps;
    maps.assign(HostId(1));
    maps.assign(HostId(2));
    maps.clear();
    EXPECT_TRUE(maps.empty());
    // Old guest IDs are not handed out again right away.
    EXPECT_EQ(maps.assign(HostId(1)), GuestId(4));
}

TEST(IdMapsTest, ReassignedHostIdGetsFreshGuestIds) {
    IdMaps maps;
    auto kept = maps.assign(HostId(1));
    ASSERT_EQ(kept, GuestId(2));

    constexpr uint32_t kSteps = 1000;
    GuestId last;
    for (uint32_t i = 0; i < kSteps; ++i) {
        last = maps.assign(HostId(2));
    }
    EXPECT_EQ(last, GuestId(2 + kSteps));
    EXPECT_EQ(maps.lookupGuest(kept), HostId(1));
    EXPECT_EQ(maps.size(), 2u);
}
